#pragma once

/// @file progression_queries.hpp
/// @brief Read-only views over committed progression state.

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "fxp/progression/progression_store.hpp"

namespace fxp::progression {

/// Leaderboard, player card, quest board and event feed, served straight
/// from the store with no caching.
class ProgressionQueries {
public:
    explicit ProgressionQueries(IProgressionReader& store);

    /// Players ordered by XP desc, then display name.
    [[nodiscard]] GameResult<std::vector<PlayerCard>> topPlayers(std::size_t limit = 10);

    /// nullopt when the name has never been seen.
    [[nodiscard]] GameResult<std::optional<PlayerCard>> playerCard(std::string_view displayName);

    /// Active quests in id order, each with standings by progress desc.
    [[nodiscard]] GameResult<std::vector<QuestBoardEntry>> questBoard();

    /// Newest first.
    [[nodiscard]] GameResult<std::vector<EventLogEntry>> recentEvents(std::size_t limit = 20);

private:
    IProgressionReader& store_;
};

} // namespace fxp::progression
