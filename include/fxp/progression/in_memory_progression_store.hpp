#pragma once

/// @file in_memory_progression_store.hpp
/// @brief Thread-safe in-memory IProgressionStore.

#include <memory>

#include "fxp/progression/progression_store.hpp"

namespace fxp::progression {

/// In-memory store for tests and `store.backend: memory`.
///
/// A transaction holds the writer lock for its whole lifetime and works on
/// a private copy of the state; commit() publishes the copy. Readers take a
/// shared lock and only ever see committed state. A thread must not begin
/// a second transaction while it still holds one.
///
/// The private copy is the whole state, so beginTransaction() costs
/// O(players + quests + progress rows) and every applied event pays it.
/// That is fine for tests and short sessions; long-running workers with
/// many players should use the SQL backend.
class InMemoryProgressionStore : public IProgressionStore {
public:
    InMemoryProgressionStore();
    ~InMemoryProgressionStore() override;

    InMemoryProgressionStore(const InMemoryProgressionStore&) = delete;
    InMemoryProgressionStore& operator=(const InMemoryProgressionStore&) = delete;

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

    struct Impl;

private:
    std::shared_ptr<Impl> impl_;
};

} // namespace fxp::progression
