#include <gtest/gtest.h>

#include <memory>

#include "fxp/foundation/time_utils.hpp"
#include "fxp/progression/in_memory_progression_store.hpp"
#include "fxp/progression/progression_admin.hpp"
#include "fxp/progression/progression_engine.hpp"
#include "support/faulty_progression_store.hpp"

using namespace fxp::progression;
using fxp::foundation::ErrorCode;
using fxp::foundation::makeUtc;
using fxp::ingest::Event;

namespace {

Timestamp at(unsigned day, unsigned hour = 0, unsigned minute = 0) {
    return *makeUtc(2024, 1, day, hour, minute, 0);
}

class ProgressionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        now_ = at(3, 12);
        engine_ = std::make_unique<ProgressionEngine>(store_, EngineConfig{},
                                                      [this] { return now_; });
    }

    void makeEngine(EngineConfig config) {
        engine_ = std::make_unique<ProgressionEngine>(store_, std::move(config),
                                                      [this] { return now_; });
    }

    PlayerId addPlayer(const std::string& name, bool eligible) {
        auto txn = store_.beginTransaction().value();
        auto player = txn->upsertPlayer(name, now_).value();
        EXPECT_TRUE(txn->setEligible(player.id, eligible));
        EXPECT_TRUE(txn->commit());
        return player.id;
    }

    Quest addQuest(const std::string& key, const std::string& type, std::int64_t target,
                   Timestamp start, Timestamp end) {
        Quest quest;
        quest.key = key;
        quest.title = key;
        quest.eventType = type;
        quest.target = target;
        quest.start = start;
        quest.end = end;
        auto txn = store_.beginTransaction().value();
        auto created = txn->createQuest(quest).value();
        EXPECT_TRUE(txn->commit());
        return created;
    }

    QuestProgress progressOf(PlayerId player, const Quest& quest) {
        auto row = store_.findProgress(player, quest.id).value();
        return row.value_or(QuestProgress{});
    }

    PlayerStats statsOf(const std::string& name) {
        auto player = store_.findPlayer(name).value();
        EXPECT_TRUE(player.has_value());
        return store_.findStats(player->id).value().value_or(PlayerStats{});
    }

    Event kill(unsigned minute, std::string killer = "PlayerA", std::string victim = "PlayerB") {
        return Event{at(1, 0, minute), "KILL", std::move(killer), {{"victim", std::move(victim)}}};
    }

    InMemoryProgressionStore store_;
    Timestamp now_{};
    std::unique_ptr<ProgressionEngine> engine_;
};

} // namespace

TEST_F(ProgressionEngineTest, FirstEventCreatesPlayerWithStats) {
    auto outcome = engine_->apply(kill(0));
    ASSERT_TRUE(outcome);
    EXPECT_TRUE(outcome.value().applied);

    auto player = store_.findPlayer("PlayerA").value();
    ASSERT_TRUE(player.has_value());
    EXPECT_FALSE(player->eligible);
    EXPECT_EQ(player->lastSeen, now_);
    EXPECT_EQ(outcome.value().playerId, player->id);

    auto stats = statsOf("PlayerA");
    EXPECT_EQ(stats.kills, 1);
    EXPECT_EQ(stats.xp, 0);
    EXPECT_EQ(stats.level, 1);

    auto log = store_.recentEvents(10).value();
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log[0].event, kill(0));
}

TEST_F(ProgressionEngineTest, NonEligiblePlayerGetsCountersButNoXp) {
    addPlayer("PlayerA", false);

    ASSERT_TRUE(engine_->apply(kill(0)));
    ASSERT_TRUE(engine_->apply(Event{at(1, 0, 1), "HEADSHOT", "PlayerA", {{"victim", "PlayerB"}}}));
    ASSERT_TRUE(engine_->apply(Event{at(1, 0, 2), "SURVIVE", "PlayerA", {}}));

    auto stats = statsOf("PlayerA");
    EXPECT_EQ(stats.kills, 1);
    EXPECT_EQ(stats.survivals, 1);
    EXPECT_EQ(stats.xp, 0);
    EXPECT_EQ(stats.level, 1);
    EXPECT_EQ(store_.recentEvents(10).value().size(), 3u);
}

TEST_F(ProgressionEngineTest, EligiblePlayerAccruesXpAlongTheCurve) {
    addPlayer("PlayerA", true);

    auto first = engine_->apply(kill(0));
    ASSERT_TRUE(first);
    EXPECT_EQ(first.value().xpAwarded, 100);

    auto second = engine_->apply(Event{at(1, 0, 0), "HEADSHOT", "PlayerA", {{"victim", "PlayerB"}}});
    ASSERT_TRUE(second);
    EXPECT_EQ(second.value().xpAwarded, 25);

    auto stats = statsOf("PlayerA");
    EXPECT_EQ(stats.xp, 125);
    EXPECT_EQ(stats.level, 1);
    // HEADSHOT has no counter of its own.
    EXPECT_EQ(stats.kills, 1);

    auto third = engine_->apply(Event{at(1, 0, 5), "SURVIVE", "PlayerA", {}});
    ASSERT_TRUE(third);
    EXPECT_TRUE(third.value().leveledUp());
    EXPECT_EQ(third.value().levelBefore, 1);
    EXPECT_EQ(third.value().levelAfter, 2);

    stats = statsOf("PlayerA");
    EXPECT_EQ(stats.xp, 275);
    EXPECT_EQ(stats.level, 2);
}

TEST_F(ProgressionEngineTest, OptingOutKeepsEarnedXp) {
    auto id = addPlayer("PlayerA", true);
    ASSERT_TRUE(engine_->apply(kill(0)));
    ASSERT_TRUE(engine_->apply(kill(1)));

    {
        auto txn = store_.beginTransaction().value();
        ASSERT_TRUE(txn->setEligible(id, false));
        ASSERT_TRUE(txn->commit());
    }
    ASSERT_TRUE(engine_->apply(kill(2)));

    auto stats = statsOf("PlayerA");
    EXPECT_EQ(stats.kills, 3);
    EXPECT_EQ(stats.xp, 200);
    EXPECT_EQ(stats.level, 2);
}

TEST_F(ProgressionEngineTest, XpAndLevelNeverDecrease) {
    addPlayer("PlayerA", true);
    std::int64_t lastXp = 0;
    std::int64_t lastLevel = 1;
    const char* types[] = {"KILL", "DEATH", "EXTRACT", "SURVIVE", "DOGTAG", "LOOT"};
    for (unsigned i = 0; i < 30; ++i) {
        Event event{at(1, 1, i), types[i % 6], "PlayerA", {}};
        ASSERT_TRUE(engine_->apply(event));
        auto stats = statsOf("PlayerA");
        EXPECT_GE(stats.xp, lastXp);
        EXPECT_GE(stats.level, lastLevel);
        EXPECT_EQ(stats.level, levelFromXp(stats.xp));
        lastXp = stats.xp;
        lastLevel = stats.level;
    }
}

TEST_F(ProgressionEngineTest, DuplicateEventChangesNothing) {
    addPlayer("PlayerA", true);
    ASSERT_TRUE(engine_->apply(kill(0)));
    auto before = statsOf("PlayerA");

    auto again = engine_->apply(kill(0));
    ASSERT_TRUE(again);
    EXPECT_FALSE(again.value().applied);
    EXPECT_TRUE(again.value().duplicate());
    EXPECT_EQ(statsOf("PlayerA"), before);
    EXPECT_EQ(store_.recentEvents(10).value().size(), 1u);

    // Same second, different victim: a distinct event.
    auto other = engine_->apply(kill(0, "PlayerA", "PlayerC"));
    ASSERT_TRUE(other);
    EXPECT_TRUE(other.value().applied);
}

TEST_F(ProgressionEngineTest, QuestCompletesOnceAndKeepsCounting) {
    auto id = addPlayer("PlayerA", false);
    auto quest = addQuest("kills", "KILL", 3, at(1), at(8));

    ApplyOutcome last;
    for (unsigned i = 0; i < 3; ++i) {
        auto outcome = engine_->apply(kill(i));
        ASSERT_TRUE(outcome);
        last = outcome.value();
    }
    ASSERT_EQ(last.completedQuests.size(), 1u);
    EXPECT_EQ(last.completedQuests[0], "kills");

    auto row = progressOf(id, quest);
    EXPECT_EQ(row.progress, 3);
    ASSERT_TRUE(row.completedAt.has_value());
    auto completedAt = *row.completedAt;

    now_ = at(4);
    auto fourth = engine_->apply(kill(10));
    ASSERT_TRUE(fourth);
    EXPECT_TRUE(fourth.value().completedQuests.empty());

    row = progressOf(id, quest);
    EXPECT_EQ(row.progress, 4);
    EXPECT_EQ(row.completedAt, completedAt);
}

TEST_F(ProgressionEngineTest, LoweredTargetCompletesOnTheNextEventOfAnyType) {
    auto id = addPlayer("PlayerA", false);
    auto quest = addQuest("tags", "DOGTAG", 3, at(1), at(8));

    for (unsigned i = 0; i < 2; ++i) {
        ASSERT_TRUE(engine_->apply(
            Event{at(1, 1, i), "DOGTAG", "PlayerA", {{"victim", "PlayerB"}}}));
    }
    EXPECT_FALSE(progressOf(id, quest).completedAt.has_value());

    ProgressionAdmin admin(store_, [this] { return now_; });
    QuestUpdate update;
    update.target = 2;
    ASSERT_TRUE(admin.updateQuest("tags", update));
    EXPECT_FALSE(progressOf(id, quest).completedAt.has_value());

    auto outcome = engine_->apply(kill(30));
    ASSERT_TRUE(outcome);
    ASSERT_EQ(outcome.value().completedQuests.size(), 1u);
    EXPECT_EQ(outcome.value().completedQuests[0], "tags");

    auto row = progressOf(id, quest);
    EXPECT_EQ(row.progress, 2);
    EXPECT_EQ(row.completedAt, now_);
}

TEST_F(ProgressionEngineTest, OnlyLiveQuestsOfTheSameTypeAdvance) {
    auto id = addPlayer("PlayerA", false);
    auto live = addQuest("live", "KILL", 5, at(1), at(8));
    auto future = addQuest("future", "KILL", 5, at(5), at(12));
    auto ended = addQuest("ended", "KILL", 5, at(1), at(3, 12));
    auto otherType = addQuest("dogtags", "DOGTAG", 5, at(1), at(8));

    ASSERT_TRUE(engine_->apply(kill(0)));

    EXPECT_EQ(progressOf(id, live).progress, 1);
    EXPECT_FALSE(store_.findProgress(id, future.id).value().has_value());
    EXPECT_FALSE(store_.findProgress(id, ended.id).value().has_value());
    EXPECT_FALSE(store_.findProgress(id, otherType.id).value().has_value());
}

TEST_F(ProgressionEngineTest, InactiveQuestIsIgnored) {
    auto id = addPlayer("PlayerA", false);
    auto quest = addQuest("kills", "KILL", 5, at(1), at(8));
    {
        auto txn = store_.beginTransaction().value();
        quest.active = false;
        ASSERT_TRUE(txn->updateQuest(quest));
        ASSERT_TRUE(txn->commit());
    }

    ASSERT_TRUE(engine_->apply(kill(0)));
    EXPECT_FALSE(store_.findProgress(id, quest.id).value().has_value());
}

TEST_F(ProgressionEngineTest, RequireAcceptanceSkipsUnacceptedQuests) {
    EngineConfig config;
    config.requireAcceptance = true;
    makeEngine(config);

    auto a = addPlayer("PlayerA", false);
    auto b = addPlayer("PlayerB", false);
    auto quest = addQuest("kills", "KILL", 2, at(1), at(8));
    {
        auto txn = store_.beginTransaction().value();
        ASSERT_TRUE(txn->ensureProgress(a, quest.id));
        ASSERT_TRUE(txn->commit());
    }

    ASSERT_TRUE(engine_->apply(kill(0, "PlayerA", "PlayerB")));
    ASSERT_TRUE(engine_->apply(kill(1, "PlayerB", "PlayerA")));

    EXPECT_EQ(progressOf(a, quest).progress, 1);
    EXPECT_FALSE(store_.findProgress(b, quest.id).value().has_value());
}

TEST_F(ProgressionEngineTest, EventWithoutActorIsRejected) {
    auto outcome = engine_->apply(Event{at(1), "KILL", "", {{"victim", "PlayerB"}}});
    ASSERT_FALSE(outcome);
    EXPECT_EQ(outcome.error().code(), ErrorCode::InvalidEvent);
    EXPECT_TRUE(store_.recentEvents(10).value().empty());
}

TEST_F(ProgressionEngineTest, CustomAwardTable) {
    EngineConfig config;
    config.awards = XpAwardTable::fromMap({{"LOOT", 40}}).value();
    makeEngine(config);
    addPlayer("PlayerA", true);

    auto outcome = engine_->apply(Event{at(1), "loot", "PlayerA", {}});
    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome.value().xpAwarded, 40);
    EXPECT_EQ(statsOf("PlayerA").xp, 40);
}

TEST(ProgressionEngineFailureTest, FailedCommitLeavesNoTrace) {
    fxp::testing::FaultyProgressionStore store;
    auto now = at(3);
    ProgressionEngine engine(store, EngineConfig{}, [now] { return now; });
    Event event{at(1), "SURVIVE", "PlayerA", {}};

    store.failCommits = 1;
    auto failed = engine.apply(event);
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().code(), ErrorCode::DatabaseError);
    EXPECT_FALSE(store.findPlayer("PlayerA").value().has_value());
    EXPECT_TRUE(store.recentEvents(10).value().empty());

    auto retried = engine.apply(event);
    ASSERT_TRUE(retried);
    EXPECT_TRUE(retried.value().applied);
    EXPECT_EQ(store.recentEvents(10).value().size(), 1u);
}

TEST(ProgressionEngineFailureTest, BeginFailureIsReturned) {
    fxp::testing::FaultyProgressionStore store;
    ProgressionEngine engine(store, EngineConfig{});
    store.failBegins = 1;

    auto failed = engine.apply(Event{at(1), "SURVIVE", "PlayerA", {}});
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().code(), ErrorCode::DatabaseError);
}
