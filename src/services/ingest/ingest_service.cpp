/// @file ingest_service.cpp
/// @brief IngestService implementation.

#include "fxp/service/ingest_service.hpp"

#include <atomic>
#include <mutex>
#include <utility>

#include "fxp/foundation/game_logger.hpp"
#include "fxp/foundation/job_scheduler.hpp"
#include "fxp/ingest/event_extractor.hpp"
#include "fxp/ingest/line_source.hpp"
#include "fxp/ingest/rule_set.hpp"
#include "fxp/progression/in_memory_progression_store.hpp"
#include "fxp/progression/progression_engine.hpp"
#include "fxp/progression/sql_progression_store.hpp"

namespace fxp::service {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

struct IngestService::Impl {
    WorkerSettings settings;
    foundation::Clock clock;

    std::unique_ptr<progression::IProgressionStore> store;
    std::unique_ptr<ingest::EventExtractor> extractor;
    std::unique_ptr<ingest::LineSource> source;
    std::unique_ptr<progression::ProgressionEngine> engine;
    std::unique_ptr<progression::QuestRotation> rotation;
    std::unique_ptr<IngestWorker> worker;

    std::atomic<bool> workerRunning{false};
    mutable std::mutex errorMutex;
    std::optional<GameError> workerError;

    // Worker loop plus the rotation tick. Declared last so that it is
    // destroyed, and its jobs drained, before anything they touch.
    foundation::JobScheduler scheduler{"fika_xp", 2};
    std::optional<foundation::JobScheduler::JobId> workerJob;
    std::optional<foundation::JobScheduler::JobId> rotationJob;

    GameResult<void> openStore() {
        if (settings.backend == StoreBackend::Memory) {
            store = std::make_unique<progression::InMemoryProgressionStore>();
            FXP_LOG_WARN(LogCategory::Database, "using the in-memory store; progress is not durable");
            return GameResult<void>::ok();
        }
        auto sql = std::make_unique<progression::SqlProgressionStore>();
        if (auto opened = sql->open(settings.database); !opened) {
            return opened;
        }
        store = std::move(sql);
        return GameResult<void>::ok();
    }

    void runRotation() {
        auto report = rotation->rotate(clock());
        if (!report) {
            FXP_LOG_ERROR(LogCategory::Quest,
                          "quest rotation failed: " + report.error().describe());
        }
    }
};

IngestService::IngestService(WorkerSettings settings, foundation::Clock clock)
    : impl_(std::make_unique<Impl>()) {
    impl_->settings = std::move(settings);
    impl_->clock = std::move(clock);
}

IngestService::~IngestService() {
    if (impl_) {
        stop();
    }
}

GameResult<void> IngestService::start() {
    if (impl_->workerJob) {
        return GameResult<void>::err(
            GameError(ErrorCode::AlreadyExists, "ingest service already started"));
    }
    const auto& s = impl_->settings;

    if (auto opened = impl_->openStore(); !opened) {
        return opened;
    }

    auto rules = ingest::RuleCompiler::compileFile(s.rulesFile);
    if (!rules) {
        FXP_LOG_ERROR(LogCategory::Parser, rules.error().describe());
        return GameResult<void>::err(rules.error());
    }
    impl_->extractor = std::make_unique<ingest::EventExtractor>(
        std::make_shared<const ingest::RuleSet>(std::move(rules).value()), impl_->clock);

    impl_->source = std::make_unique<ingest::LineSource>(s.source);
    if (auto opened = impl_->source->open(); !opened) {
        return opened;
    }

    impl_->engine = std::make_unique<progression::ProgressionEngine>(*impl_->store, s.engine,
                                                                     impl_->clock);
    impl_->rotation = std::make_unique<progression::QuestRotation>(*impl_->store, s.rotation);
    impl_->worker = std::make_unique<IngestWorker>(*impl_->source, *impl_->extractor,
                                                   *impl_->engine, s.retry);

    auto initial = impl_->rotation->rotate(impl_->clock());
    if (!initial) {
        return GameResult<void>::err(initial.error());
    }

    impl_->workerRunning = true;
    auto job = impl_->scheduler.submit(
        "ingest-loop", [impl = impl_.get()] {
            auto result = impl->worker->run();
            if (!result) {
                FXP_LOG_ERROR(LogCategory::Ingest, "ingestion worker stopped: " +
                                                   result.error().describe());
                std::lock_guard lock(impl->errorMutex);
                impl->workerError = result.error();
            }
            impl->workerRunning = false;
        });
    if (!job) {
        impl_->workerRunning = false;
        return GameResult<void>::err(job.error());
    }
    impl_->workerJob = job.value();

    auto tick = impl_->scheduler.every(
        "quest-rotation", std::chrono::duration_cast<std::chrono::milliseconds>(s.rotationInterval),
        [impl = impl_.get()] { impl->runRotation(); });
    if (!tick) {
        stop();
        return GameResult<void>::err(tick.error());
    }
    impl_->rotationJob = tick.value();

    FXP_LOG_INFO(LogCategory::Core,
                 "ingest service started: log=" + s.source.path.string() +
                 " rules=" + s.rulesFile.string() + " rules_loaded=" +
                 std::to_string(impl_->extractor->rules().size()) + " store=" +
                 (s.backend == StoreBackend::Memory ? std::string("memory")
                                                    : s.database.connectionString) +
                 " acceptance=" + (s.engine.requireAcceptance ? "explicit" : "implicit"));
    return GameResult<void>::ok();
}

void IngestService::stop() {
    if (impl_->rotationJob) {
        if (auto cancelled = impl_->scheduler.cancel(*impl_->rotationJob); !cancelled) {
            FXP_LOG_DEBUG(LogCategory::Core, cancelled.error().describe());
        }
        impl_->rotationJob.reset();
    }
    if (impl_->worker) {
        impl_->worker->stop();
    }
    if (impl_->workerJob) {
        if (auto waited = impl_->scheduler.join(*impl_->workerJob); !waited) {
            FXP_LOG_ERROR(LogCategory::Core, waited.error().describe());
        }
        impl_->workerJob.reset();
        FXP_LOG_INFO(LogCategory::Core, "ingest service stopped");
    }
}

void IngestService::tick(std::chrono::milliseconds delta) {
    impl_->scheduler.advance(delta);
}

bool IngestService::isRunning() const {
    return impl_->workerRunning.load();
}

std::optional<GameError> IngestService::workerError() const {
    std::lock_guard lock(impl_->errorMutex);
    return impl_->workerError;
}

GameResult<progression::RotationReport> IngestService::rotateNow() {
    if (!impl_->rotation) {
        return GameResult<progression::RotationReport>::err(
            GameError(ErrorCode::StoreUnavailable, "ingest service not started"));
    }
    return impl_->rotation->rotate(impl_->clock());
}

progression::IProgressionStore& IngestService::store() {
    return *impl_->store;
}

IngestCounters IngestService::counters() const {
    return impl_->worker ? impl_->worker->counters() : IngestCounters{};
}

} // namespace fxp::service
