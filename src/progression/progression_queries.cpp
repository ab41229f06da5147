/// @file progression_queries.cpp
/// @brief ProgressionQueries implementation.

#include "fxp/progression/progression_queries.hpp"

#include <utility>

namespace fxp::progression {

ProgressionQueries::ProgressionQueries(IProgressionReader& store)
    : store_(store) {}

GameResult<std::vector<PlayerCard>> ProgressionQueries::topPlayers(std::size_t limit) {
    return store_.topPlayers(limit);
}

GameResult<std::optional<PlayerCard>> ProgressionQueries::playerCard(std::string_view displayName) {
    using Card = GameResult<std::optional<PlayerCard>>;

    auto player = store_.findPlayer(displayName);
    if (!player) {
        return Card::err(player.error());
    }
    if (!player.value()) {
        return Card::ok(std::nullopt);
    }

    auto stats = store_.findStats(player.value()->id);
    if (!stats) {
        return Card::err(stats.error());
    }
    return Card::ok(PlayerCard{*player.value(), stats.value().value_or(PlayerStats{})});
}

GameResult<std::vector<QuestBoardEntry>> ProgressionQueries::questBoard() {
    using Board = GameResult<std::vector<QuestBoardEntry>>;

    auto quests = store_.listQuests(true);
    if (!quests) {
        return Board::err(quests.error());
    }

    std::vector<QuestBoardEntry> board;
    board.reserve(quests.value().size());
    for (auto& quest : quests.value()) {
        auto standings = store_.questStandings(quest.id);
        if (!standings) {
            return Board::err(standings.error());
        }
        board.push_back(QuestBoardEntry{std::move(quest), std::move(standings).value()});
    }
    return Board::ok(std::move(board));
}

GameResult<std::vector<EventLogEntry>> ProgressionQueries::recentEvents(std::size_t limit) {
    return store_.recentEvents(limit);
}

} // namespace fxp::progression
