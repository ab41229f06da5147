#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <random>
#include <thread>

#include "fxp/foundation/time_utils.hpp"
#include "fxp/progression/progression_admin.hpp"
#include "fxp/progression/progression_queries.hpp"
#include "fxp/service/ingest_service.hpp"

using namespace fxp::service;
using namespace std::chrono_literals;
using fxp::foundation::ErrorCode;
using fxp::foundation::makeUtc;
using fxp::foundation::Timestamp;
using fxp::progression::ProgressionAdmin;
using fxp::progression::ProgressionQueries;

namespace fs = std::filesystem;

namespace {

constexpr const char* kRules = R"(
patterns:
  KILL: '^\[(?P<ts>[^\]]+?)(?: UTC)?\]\s+(?P<killer>\S+) killed (?P<victim>\S+)(?:\s+(?P<headshot>HEADSHOT))?'
  DEATH: '^\[(?P<ts>[^\]]+?)(?: UTC)?\]\s+(?P<victim>\S+) was killed by (?P<killer>\S+)'
  EXTRACT: '^\[(?P<ts>[^\]]+?)(?: UTC)?\]\s+(?P<name>\S+) extracted'
  SURVIVE: '^\[(?P<ts>[^\]]+?)(?: UTC)?\]\s+(?P<name>\S+) survived'
  DOGTAG: '^\[(?P<ts>[^\]]+?)(?: UTC)?\]\s+(?P<name>\S+) looted dogtag of (?P<victim>\S+)'
headshot_keywords: [HEADSHOT]
)";

bool waitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = 5s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

class IngestPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        dir_ = fs::temp_directory_path() / ("fxp_pipeline_" + std::to_string(rd()));
        fs::create_directories(dir_);
        std::ofstream(dir_ / "rules.yaml") << kRules;

        settings_.source.path = dir_ / "server.log";
        settings_.source.pollInterval = 2ms;
        settings_.source.startAtEnd = false;
        settings_.rulesFile = dir_ / "rules.yaml";
        settings_.backend = StoreBackend::Memory;
        settings_.retry.backoff = 0ms;

        setNow(*makeUtc(2024, 1, 5, 12, 0, 0));
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void setNow(Timestamp ts) {
        nowSeconds_ = std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
    }

    fxp::foundation::Clock clock() {
        return [this] { return Timestamp(std::chrono::seconds(nowSeconds_.load())); };
    }

    void append(const std::string& text) {
        std::ofstream out(dir_ / "server.log", std::ios::app | std::ios::binary);
        out << text;
    }

    fs::path dir_;
    WorkerSettings settings_;
    std::atomic<std::int64_t> nowSeconds_{0};
};

} // namespace

TEST_F(IngestPipelineTest, LogLinesBecomeProgress) {
    append("[2024-01-05 10:00:00] Alpha killed Bravo HEADSHOT\n"
           "[2024-01-05 10:00:05] Bravo was killed by Alpha\n"
           "[2024-01-05 10:01:00] Alpha looted dogtag of Bravo\n"
           "[2024-01-05 10:20:00] Alpha extracted\n");

    IngestService service(settings_, clock());
    ASSERT_TRUE(service.start());
    EXPECT_TRUE(service.isRunning());

    // KILL + HEADSHOT, DEATH, DOGTAG, EXTRACT + SURVIVE.
    ASSERT_TRUE(waitUntil([&] { return service.counters().eventsApplied == 7; }));
    EXPECT_EQ(service.counters().linesRead, 4u);
    EXPECT_EQ(service.counters().linesWithEvents, 4u);

    ProgressionQueries queries(service.store());
    auto alpha = queries.playerCard("Alpha").value();
    ASSERT_TRUE(alpha.has_value());
    EXPECT_EQ(alpha->stats.kills, 1);
    EXPECT_EQ(alpha->stats.dogtags, 1);
    EXPECT_EQ(alpha->stats.extracts, 1);
    EXPECT_EQ(alpha->stats.survivals, 1);
    EXPECT_EQ(alpha->stats.xp, 0);

    auto bravo = queries.playerCard("Bravo").value();
    ASSERT_TRUE(bravo.has_value());
    EXPECT_EQ(bravo->stats.deaths, 1);

    // Seeded by the startup rotation and advanced by the DOGTAG and SURVIVE lines.
    auto board = queries.questBoard().value();
    ASSERT_EQ(board.size(), 2u);
    EXPECT_EQ(board[0].quest.key, "dogtags_week@2024-01-04");
    ASSERT_EQ(board[0].standings.size(), 1u);
    EXPECT_EQ(board[0].standings[0].progress, 1);
    EXPECT_EQ(board[1].quest.key, "survive_week@2024-01-04");
    EXPECT_EQ(board[1].standings[0].progress, 1);

    service.stop();
    EXPECT_FALSE(service.isRunning());
    EXPECT_FALSE(service.workerError().has_value());
}

TEST_F(IngestPipelineTest, OptedInPlayerLevelsUp) {
    IngestService service(settings_, clock());
    ASSERT_TRUE(service.start());

    append("[2024-01-05 10:00:00] Alpha was killed by Scav\n");
    ASSERT_TRUE(waitUntil([&] { return service.counters().eventsApplied == 1; }));

    ProgressionAdmin admin(service.store(), clock());
    ASSERT_TRUE(admin.setEligible("Alpha", true));

    append("[2024-01-05 10:10:00] Alpha killed Bravo HEADSHOT\n"
           "[2024-01-05 10:30:00] Alpha survived\n");
    ASSERT_TRUE(waitUntil([&] { return service.counters().eventsApplied == 4; }));

    ProgressionQueries queries(service.store());
    auto top = queries.topPlayers(1).value();
    ASSERT_EQ(top.size(), 1u);
    EXPECT_EQ(top[0].player.displayName, "Alpha");
    EXPECT_EQ(top[0].stats.xp, 275);
    EXPECT_EQ(top[0].stats.level, 2);
}

TEST_F(IngestPipelineTest, RotationMovesToTheNextCycle) {
    IngestService service(settings_, clock());
    ASSERT_TRUE(service.start());

    setNow(*makeUtc(2024, 1, 11, 0, 0, 1));
    auto report = service.rotateNow();
    ASSERT_TRUE(report);
    EXPECT_EQ(report.value().deactivated, 2u);
    ASSERT_EQ(report.value().seeded.size(), 2u);
    EXPECT_EQ(report.value().seeded[0], "dogtags_week@2024-01-11");

    auto second = service.rotateNow();
    ASSERT_TRUE(second);
    EXPECT_TRUE(second.value().seeded.empty());
}

TEST_F(IngestPipelineTest, StartFailsOnBadRules) {
    std::ofstream(dir_ / "rules.yaml", std::ios::trunc) << "patterns:\n  KILL: '(?P<ts>['\n";

    IngestService service(settings_, clock());
    auto started = service.start();
    ASSERT_FALSE(started);
    EXPECT_EQ(started.error().code(), ErrorCode::RuleCompileFailed);
    EXPECT_FALSE(service.isRunning());
}

TEST_F(IngestPipelineTest, StartTwiceIsRejected) {
    IngestService service(settings_, clock());
    ASSERT_TRUE(service.start());
    auto again = service.start();
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code(), ErrorCode::AlreadyExists);
}

TEST_F(IngestPipelineTest, RotateBeforeStartIsAnError) {
    IngestService service(settings_, clock());
    auto report = service.rotateNow();
    ASSERT_FALSE(report);
    EXPECT_EQ(report.error().code(), ErrorCode::StoreUnavailable);
}
