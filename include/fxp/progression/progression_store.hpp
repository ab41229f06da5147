#pragma once

/// @file progression_store.hpp
/// @brief Durable store interfaces for players, stats, quests and the event log.

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "fxp/foundation/game_result.hpp"
#include "fxp/progression/progression_types.hpp"

namespace fxp::progression {

using foundation::GameResult;

/// Read operations shared by the store (committed state) and by open
/// transactions (committed state plus the transaction's own writes).
class IProgressionReader {
public:
    virtual ~IProgressionReader() = default;

    [[nodiscard]] virtual GameResult<std::optional<PlayerRecord>> findPlayer(
        std::string_view displayName) = 0;

    [[nodiscard]] virtual GameResult<std::optional<PlayerStats>> findStats(PlayerId player) = 0;

    /// Players with stats ordered by xp desc, then display name.
    [[nodiscard]] virtual GameResult<std::vector<PlayerCard>> topPlayers(std::size_t limit) = 0;

    [[nodiscard]] virtual GameResult<std::optional<Quest>> findQuest(std::string_view key) = 0;

    /// Quests ordered by id; only those with the active flag when @p activeOnly.
    [[nodiscard]] virtual GameResult<std::vector<Quest>> listQuests(bool activeOnly) = 0;

    [[nodiscard]] virtual GameResult<std::optional<QuestProgress>> findProgress(
        PlayerId player, QuestId quest) = 0;

    /// Progress rows of a quest ordered by progress desc, then display name.
    [[nodiscard]] virtual GameResult<std::vector<QuestStanding>> questStandings(QuestId quest) = 0;

    /// True when an event with this identity key is already in the log.
    [[nodiscard]] virtual GameResult<bool> hasEvent(std::string_view identity) = 0;

    /// Newest entries first.
    [[nodiscard]] virtual GameResult<std::vector<EventLogEntry>> recentEvents(std::size_t limit) = 0;
};

/// A unit of work. Nothing is visible to other readers until commit();
/// destroying an uncommitted transaction rolls it back.
class IProgressionTransaction : public IProgressionReader {
public:
    /// Create the player (not eligible) or touch last_seen of an existing one.
    [[nodiscard]] virtual GameResult<PlayerRecord> upsertPlayer(std::string_view displayName,
                                                                Timestamp seen) = 0;

    /// Stats of @p player, creating a zeroed row (level 1) when missing.
    [[nodiscard]] virtual GameResult<PlayerStats> ensureStats(PlayerId player) = 0;

    [[nodiscard]] virtual GameResult<void> saveStats(PlayerId player, const PlayerStats& stats) = 0;

    /// PlayerNotFound when no such player.
    [[nodiscard]] virtual GameResult<void> setEligible(PlayerId player, bool eligible) = 0;

    [[nodiscard]] virtual GameResult<EventId> appendEvent(const ingest::Event& event,
                                                          std::string_view identity) = 0;

    /// Insert a quest. AlreadyExists when the key is taken.
    [[nodiscard]] virtual GameResult<Quest> createQuest(const Quest& quest) = 0;

    /// Insert unless a quest with the same key exists. true when inserted.
    [[nodiscard]] virtual GameResult<bool> insertQuestIfAbsent(const Quest& quest) = 0;

    /// Overwrite title, event type, target, window and active flag by id.
    [[nodiscard]] virtual GameResult<void> updateQuest(const Quest& quest) = 0;

    /// Remove a quest and its progress rows.
    [[nodiscard]] virtual GameResult<void> deleteQuest(QuestId quest) = 0;

    /// Clear the active flag of every active quest with end <= @p now.
    [[nodiscard]] virtual GameResult<std::size_t> deactivateExpired(Timestamp now) = 0;

    /// Progress row for (player, quest), creating it at 0 when missing.
    [[nodiscard]] virtual GameResult<QuestProgress> ensureProgress(PlayerId player,
                                                                   QuestId quest) = 0;

    [[nodiscard]] virtual GameResult<void> saveProgress(const QuestProgress& progress) = 0;

    [[nodiscard]] virtual GameResult<void> commit() = 0;

    virtual void rollback() = 0;
};

/// Store handle passed explicitly to the engine, rotation and surfaces.
///
/// Implementations are thread-safe; write transactions are serialized.
class IProgressionStore : public IProgressionReader {
public:
    [[nodiscard]] virtual GameResult<std::unique_ptr<IProgressionTransaction>>
    beginTransaction() = 0;
};

} // namespace fxp::progression
