#pragma once

/// @file progression_engine.hpp
/// @brief Applies extracted events to players, stats, XP and quest progress.

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "fxp/foundation/game_result.hpp"
#include "fxp/foundation/types.hpp"
#include "fxp/ingest/event.hpp"
#include "fxp/progression/leveling.hpp"
#include "fxp/progression/progression_store.hpp"

namespace fxp::progression {

/// Engine settings.
struct EngineConfig {
    XpAwardTable awards;
    /// When set, only progress rows created by acceptQuest() advance;
    /// otherwise the first matching event creates the row.
    bool requireAcceptance = false;
};

/// What one apply() call did.
struct ApplyOutcome {
    bool applied = false;   ///< false when the event was already in the log
    PlayerId playerId;
    std::int64_t xpAwarded = 0;
    std::int64_t levelBefore = 1;
    std::int64_t levelAfter = 1;
    std::vector<std::string> completedQuests; ///< keys completed by this event

    [[nodiscard]] bool duplicate() const noexcept { return !applied; }
    [[nodiscard]] bool leveledUp() const noexcept { return levelAfter > levelBefore; }
};

/// Applies one event per transaction:
///   1. upsert the player and touch last_seen
///   2. ensure the stats row
///   3. append the event to the log
///   4. bump the counter mapped from the event type
///   5. for eligible players add the XP award and recompute the level
///   6. +1 on every live quest tracking the event type
///   7. stamp completed_at once progress reaches the target
///
/// An event whose identity key is already logged changes nothing.
/// Store errors roll the whole event back and are returned to the caller.
///
/// Example:
/// @code
///   InMemoryProgressionStore store;
///   ProgressionEngine engine(store, EngineConfig{});
///   auto outcome = engine.apply(event);
///   if (!outcome) { retry later with the same event }
/// @endcode
class ProgressionEngine {
public:
    ProgressionEngine(IProgressionStore& store, EngineConfig config,
                      foundation::Clock clock = foundation::systemNow);

    [[nodiscard]] GameResult<ApplyOutcome> apply(const ingest::Event& event);

    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

private:
    GameResult<void> advanceQuests(IProgressionTransaction& txn, const ingest::Event& event,
                                   const PlayerRecord& player, foundation::Timestamp now,
                                   ApplyOutcome& outcome);

    IProgressionStore& store_;
    EngineConfig config_;
    foundation::Clock clock_;
};

} // namespace fxp::progression
