#pragma once

/// @file sql_progression_store.hpp
/// @brief IProgressionStore backed by GameDatabase (SQLite by default).

#include <memory>

#include "fxp/foundation/game_database.hpp"
#include "fxp/progression/progression_store.hpp"

namespace fxp::progression {

/// SQL store over kcenon database_system.
///
/// Tables (created on open() when missing):
///   players(id, display_name UNIQUE, eligible, last_seen)
///   stats(player_id PK, kills, deaths, extracts, survivals, dogtags, xp, level)
///   events(id, identity UNIQUE, ts, type, actor, data)
///   quests(id, quest_key UNIQUE, title, event_type, target, start_ts, end_ts, active)
///   quest_progress(player_id, quest_id, progress, completed_ts)
/// Timestamps are ISO-8601 UTC text, so lexical order is time order.
///
/// Writers are serialized by the connection pool: with the default
/// single connection a second transaction waits for the first to finish.
class SqlProgressionStore : public IProgressionStore {
public:
    SqlProgressionStore();
    ~SqlProgressionStore() override;

    SqlProgressionStore(const SqlProgressionStore&) = delete;
    SqlProgressionStore& operator=(const SqlProgressionStore&) = delete;

    /// Connect and create the schema.
    [[nodiscard]] GameResult<void> open(const foundation::DatabaseConfig& config);

    void close();

    [[nodiscard]] bool isOpen() const noexcept;

    GameResult<std::unique_ptr<IProgressionTransaction>> beginTransaction() override;

    GameResult<std::optional<PlayerRecord>> findPlayer(std::string_view displayName) override;
    GameResult<std::optional<PlayerStats>> findStats(PlayerId player) override;
    GameResult<std::vector<PlayerCard>> topPlayers(std::size_t limit) override;
    GameResult<std::optional<Quest>> findQuest(std::string_view key) override;
    GameResult<std::vector<Quest>> listQuests(bool activeOnly) override;
    GameResult<std::optional<QuestProgress>> findProgress(PlayerId player, QuestId quest) override;
    GameResult<std::vector<QuestStanding>> questStandings(QuestId quest) override;
    GameResult<bool> hasEvent(std::string_view identity) override;
    GameResult<std::vector<EventLogEntry>> recentEvents(std::size_t limit) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace fxp::progression
