#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <thread>

#include "fxp/foundation/time_utils.hpp"
#include "fxp/ingest/rule_set.hpp"
#include "fxp/service/ingest_worker.hpp"
#include "support/faulty_progression_store.hpp"

using namespace fxp::service;
using namespace std::chrono_literals;
using fxp::foundation::ErrorCode;
using fxp::ingest::EventExtractor;
using fxp::ingest::LineSource;
using fxp::ingest::LineSourceConfig;
using fxp::ingest::RuleCompiler;
using fxp::ingest::RuleSet;
using fxp::progression::EngineConfig;
using fxp::progression::ProgressionEngine;

namespace fs = std::filesystem;

namespace {

constexpr const char* kRules = R"(
patterns:
  KILL: '^\[(?P<ts>[^\]]+)\] (?P<killer>\S+) killed (?P<victim>\S+)(?: (?P<headshot>HEADSHOT))?'
  SURVIVE: '^\[(?P<ts>[^\]]+)\] (?P<name>\S+) survived'
headshot_keywords: [HEADSHOT]
)";

class IngestWorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        dir_ = fs::temp_directory_path() / ("fxp_ingest_worker_" + std::to_string(rd()));
        fs::create_directories(dir_);

        LineSourceConfig cfg;
        cfg.path = dir_ / "server.log";
        cfg.pollInterval = 1ms;
        cfg.startAtEnd = false;
        source_ = std::make_unique<LineSource>(cfg);
        ASSERT_TRUE(source_->open());

        auto rules = RuleCompiler::compileString(kRules);
        ASSERT_TRUE(rules) << rules.error().message();
        extractor_ = std::make_unique<EventExtractor>(
            std::make_shared<const RuleSet>(std::move(rules).value()));

        auto now = *fxp::foundation::makeUtc(2024, 1, 2, 0, 0, 0);
        engine_ = std::make_unique<ProgressionEngine>(store_, EngineConfig{},
                                                      [now] { return now; });
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void append(const std::string& text) {
        std::ofstream out(dir_ / "server.log", std::ios::app | std::ios::binary);
        out << text;
    }

    std::unique_ptr<IngestWorker> makeWorker(int retries) {
        return std::make_unique<IngestWorker>(*source_, *extractor_, *engine_,
                                              RetryPolicy{retries, 0ms});
    }

    fs::path dir_;
    fxp::testing::FaultyProgressionStore store_;
    std::unique_ptr<LineSource> source_;
    std::unique_ptr<EventExtractor> extractor_;
    std::unique_ptr<ProgressionEngine> engine_;
};

} // namespace

TEST_F(IngestWorkerTest, ReturnsFalseWhenNoLineIsReady) {
    auto worker = makeWorker(0);
    auto processed = worker->processNext();
    ASSERT_TRUE(processed);
    EXPECT_FALSE(processed.value());
    EXPECT_EQ(worker->counters().linesRead, 0u);
}

TEST_F(IngestWorkerTest, AppliesEveryEventOfALine) {
    auto worker = makeWorker(0);
    append("[2024-01-01 00:00:00] PlayerA killed PlayerB HEADSHOT\n"
           "server heartbeat\n"
           "[2024-01-01 00:05:00] PlayerA survived\n");

    for (int i = 0; i < 3; ++i) {
        auto processed = worker->processNext();
        ASSERT_TRUE(processed);
        EXPECT_TRUE(processed.value());
    }
    EXPECT_FALSE(worker->processNext().value());

    auto counters = worker->counters();
    EXPECT_EQ(counters.linesRead, 3u);
    EXPECT_EQ(counters.linesWithEvents, 2u);
    EXPECT_EQ(counters.eventsApplied, 3u);
    EXPECT_EQ(counters.eventsDuplicate, 0u);
    EXPECT_EQ(source_->offset(), fs::file_size(dir_ / "server.log"));

    auto player = store_.findPlayer("PlayerA").value();
    ASSERT_TRUE(player.has_value());
    auto stats = store_.findStats(player->id).value();
    EXPECT_EQ(stats->kills, 1);
    EXPECT_EQ(stats->survivals, 1);
    EXPECT_EQ(store_.recentEvents(10).value().size(), 3u);
}

TEST_F(IngestWorkerTest, ReplayedLineIsCountedAsDuplicate) {
    auto worker = makeWorker(0);
    append("[2024-01-01 00:00:00] PlayerA killed PlayerB\n"
           "[2024-01-01 00:00:00] PlayerA killed PlayerB\n");

    ASSERT_TRUE(worker->processNext().value());
    ASSERT_TRUE(worker->processNext().value());

    auto counters = worker->counters();
    EXPECT_EQ(counters.eventsApplied, 1u);
    EXPECT_EQ(counters.eventsDuplicate, 1u);
    EXPECT_EQ(store_.recentEvents(10).value().size(), 1u);
}

TEST_F(IngestWorkerTest, TransientStoreFailureIsRetried) {
    auto worker = makeWorker(2);
    append("[2024-01-01 00:00:00] PlayerA killed PlayerB HEADSHOT\n");
    store_.failCommits = 2;

    auto processed = worker->processNext();
    ASSERT_TRUE(processed);
    EXPECT_TRUE(processed.value());

    auto counters = worker->counters();
    EXPECT_EQ(counters.applyRetries, 2u);
    EXPECT_EQ(counters.eventsApplied, 2u);
    EXPECT_EQ(store_.recentEvents(10).value().size(), 2u);
    EXPECT_GT(source_->offset(), 0u);
}

TEST_F(IngestWorkerTest, ExhaustedRetriesLeaveTheLineUncommitted) {
    auto worker = makeWorker(1);
    append("[2024-01-01 00:00:00] PlayerA survived\n");
    store_.failCommits = 2;

    auto failed = worker->processNext();
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().code(), ErrorCode::DatabaseError);
    EXPECT_EQ(source_->offset(), 0u);
    EXPECT_TRUE(store_.recentEvents(10).value().empty());

    // Once the store recovers the same line is applied exactly once.
    auto resumed = worker->processNext();
    ASSERT_TRUE(resumed);
    EXPECT_TRUE(resumed.value());
    EXPECT_EQ(worker->counters().linesRead, 1u);
    EXPECT_EQ(worker->counters().eventsApplied, 1u);
    EXPECT_EQ(store_.recentEvents(10).value().size(), 1u);
}

TEST_F(IngestWorkerTest, RunStopsOnRequest) {
    auto worker = makeWorker(0);
    fxp::foundation::GameResult<void> result = fxp::foundation::GameResult<void>::ok();
    std::thread runner([&] { result = worker->run(); });

    append("[2024-01-01 00:00:00] PlayerA survived\n");
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (worker->counters().eventsApplied == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    worker->stop();
    runner.join();

    EXPECT_TRUE(result);
    EXPECT_FALSE(worker->isRunning());
    EXPECT_EQ(worker->counters().eventsApplied, 1u);
}

TEST_F(IngestWorkerTest, RunReturnsFatalStoreError) {
    auto worker = makeWorker(0);
    append("[2024-01-01 00:00:00] PlayerA survived\n");
    store_.failBegins = 1;

    auto result = worker->run();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::DatabaseError);
    EXPECT_FALSE(worker->isRunning());
}
