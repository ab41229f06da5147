#pragma once

/// @file progression_types.hpp
/// @brief Records persisted by the progression store.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "fxp/foundation/types.hpp"
#include "fxp/ingest/event.hpp"

namespace fxp::progression {

using foundation::EventId;
using foundation::PlayerId;
using foundation::QuestId;
using foundation::Timestamp;

/// A player, keyed by in-game display name.
struct PlayerRecord {
    PlayerId id;
    std::string displayName;
    bool eligible = false; ///< opted in to XP and levels
    Timestamp lastSeen{};
};

/// Per-player counters. `level` always equals levelFromXp(xp).
struct PlayerStats {
    std::int64_t kills = 0;
    std::int64_t deaths = 0;
    std::int64_t extracts = 0;
    std::int64_t survivals = 0;
    std::int64_t dogtags = 0;
    std::int64_t xp = 0;
    std::int64_t level = 1;

    bool operator==(const PlayerStats&) const = default;
};

/// Stat counters advanced by specific event types.
enum class StatCounter : uint8_t {
    Kills,
    Deaths,
    Extracts,
    Survivals,
    Dogtags
};

/// KILL->Kills, DEATH->Deaths, EXTRACT->Extracts, SURVIVE->Survivals,
/// DOGTAG->Dogtags; nullopt for every other type.
[[nodiscard]] std::optional<StatCounter> counterForEventType(std::string_view eventType);

/// Column / field name of a counter ("kills", ...).
[[nodiscard]] std::string_view statCounterName(StatCounter counter);

/// Add one to @p counter.
void increment(PlayerStats& stats, StatCounter counter);

/// A time-boxed objective counting one event type.
struct Quest {
    QuestId id;
    std::string key;       ///< stable natural key
    std::string title;
    std::string eventType; ///< upper-case event type tag
    std::int64_t target = 1;
    Timestamp start{};
    Timestamp end{};       ///< exclusive
    bool active = true;

    /// Active flag set and @p now inside [start, end).
    [[nodiscard]] bool isLiveAt(Timestamp now) const noexcept {
        return active && start <= now && now < end;
    }
};

/// Progress of one player toward one quest.
struct QuestProgress {
    PlayerId playerId;
    QuestId questId;
    std::int64_t progress = 0;
    std::optional<Timestamp> completedAt;
};

/// One player's line on a quest board.
struct QuestStanding {
    PlayerId playerId;
    std::string displayName;
    std::int64_t progress = 0;
    std::optional<Timestamp> completedAt;
};

/// Player row joined with its stats.
struct PlayerCard {
    PlayerRecord player;
    PlayerStats stats;
};

/// An active quest with its standings (progress desc).
struct QuestBoardEntry {
    Quest quest;
    std::vector<QuestStanding> standings;
};

/// A quest template installed by rotation each cycle.
struct QuestSeed {
    std::string key;
    std::string title;
    std::string eventType;
    std::int64_t target = 1;
};

/// An entry of the append-only event log.
struct EventLogEntry {
    EventId id;
    std::string identity;
    ingest::Event event;
};

} // namespace fxp::progression
