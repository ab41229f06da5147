#include <gtest/gtest.h>

#include "fxp/foundation/time_utils.hpp"
#include "fxp/progression/in_memory_progression_store.hpp"
#include "fxp/progression/progression_admin.hpp"
#include "fxp/progression/progression_engine.hpp"
#include "fxp/progression/progression_queries.hpp"

using namespace fxp::progression;
using fxp::foundation::makeUtc;
using fxp::ingest::Event;

namespace {

Timestamp at(unsigned day, unsigned minute = 0) {
    return *makeUtc(2024, 1, day, 0, minute, 0);
}

class ProgressionQueriesTest : public ::testing::Test {
protected:
    void SetUp() override {
        QuestDraft dogtags;
        dogtags.key = "dogtags";
        dogtags.title = "Collect dog tags";
        dogtags.eventType = "DOGTAG";
        dogtags.target = 2;
        dogtags.start = at(1);
        dogtags.end = at(8);
        ASSERT_TRUE(admin_.createQuest(dogtags));

        QuestDraft old = dogtags;
        old.key = "old";
        old.active = false;
        ASSERT_TRUE(admin_.createQuest(old));

        // Names are registered first so eligibility applies from their first event.
        for (const char* name : {"Alpha", "Bravo", "Charlie"}) {
            ASSERT_TRUE(engine_.apply(Event{at(1), "DEATH", name, {{"killer", "Scav"}}}));
            ASSERT_TRUE(admin_.setEligible(name, true));
        }

        apply("KILL", "Bravo", 1);
        apply("KILL", "Bravo", 2);
        apply("KILL", "Alpha", 3);
        apply("DOGTAG", "Charlie", 4);
        apply("DOGTAG", "Charlie", 5);
        apply("DOGTAG", "Alpha", 6);
    }

    void apply(const char* type, const char* actor, unsigned minute) {
        ASSERT_TRUE(engine_.apply(
            Event{at(2, minute), type, actor, {{"victim", "Target" + std::to_string(minute)}}}));
    }

    InMemoryProgressionStore store_;
    Timestamp now_ = at(3);
    ProgressionAdmin admin_{store_, [this] { return now_; }};
    ProgressionEngine engine_{store_, EngineConfig{}, [this] { return now_; }};
    ProgressionQueries queries_{store_};
};

} // namespace

TEST_F(ProgressionQueriesTest, Leaderboard) {
    auto top = queries_.topPlayers(10);
    ASSERT_TRUE(top);
    ASSERT_EQ(top.value().size(), 3u);
    // Bravo 200, Alpha 130, Charlie 60.
    EXPECT_EQ(top.value()[0].player.displayName, "Bravo");
    EXPECT_EQ(top.value()[0].stats.xp, 200);
    EXPECT_EQ(top.value()[0].stats.level, 2);
    EXPECT_EQ(top.value()[1].player.displayName, "Alpha");
    EXPECT_EQ(top.value()[2].player.displayName, "Charlie");

    EXPECT_EQ(queries_.topPlayers(1).value().size(), 1u);
}

TEST_F(ProgressionQueriesTest, PlayerCard) {
    auto card = queries_.playerCard("Alpha");
    ASSERT_TRUE(card);
    ASSERT_TRUE(card.value().has_value());
    EXPECT_EQ(card.value()->stats.kills, 1);
    EXPECT_EQ(card.value()->stats.dogtags, 1);
    EXPECT_EQ(card.value()->stats.deaths, 1);
    EXPECT_TRUE(card.value()->player.eligible);

    auto missing = queries_.playerCard("Nobody");
    ASSERT_TRUE(missing);
    EXPECT_FALSE(missing.value().has_value());
}

TEST_F(ProgressionQueriesTest, QuestBoardShowsActiveQuestsOnly) {
    auto board = queries_.questBoard();
    ASSERT_TRUE(board);
    ASSERT_EQ(board.value().size(), 1u);

    const auto& entry = board.value()[0];
    EXPECT_EQ(entry.quest.key, "dogtags");
    ASSERT_EQ(entry.standings.size(), 2u);
    EXPECT_EQ(entry.standings[0].displayName, "Charlie");
    EXPECT_EQ(entry.standings[0].progress, 2);
    EXPECT_TRUE(entry.standings[0].completedAt.has_value());
    EXPECT_EQ(entry.standings[1].displayName, "Alpha");
    EXPECT_FALSE(entry.standings[1].completedAt.has_value());
}

TEST_F(ProgressionQueriesTest, RecentEventsNewestFirst) {
    auto feed = queries_.recentEvents(2);
    ASSERT_TRUE(feed);
    ASSERT_EQ(feed.value().size(), 2u);
    EXPECT_EQ(feed.value()[0].event.actor, "Alpha");
    EXPECT_EQ(feed.value()[0].event.type, "DOGTAG");
    EXPECT_EQ(feed.value()[1].event.actor, "Charlie");
}
