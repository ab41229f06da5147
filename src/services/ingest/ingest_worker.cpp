/// @file ingest_worker.cpp
/// @brief IngestWorker implementation.

#include "fxp/service/ingest_worker.hpp"

#include <thread>
#include <utility>

#include "fxp/foundation/game_logger.hpp"

namespace fxp::service {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

IngestWorker::IngestWorker(ingest::LineSource& source, const ingest::EventExtractor& extractor,
                           progression::ProgressionEngine& engine, RetryPolicy retry)
    : source_(source), extractor_(extractor), engine_(engine), retry_(retry) {}

GameResult<void> IngestWorker::applyPending() {
    auto& events = *pending_;
    while (pendingApplied_ < events.size()) {
        const auto& event = events[pendingApplied_];
        auto outcome = engine_.apply(event);
        if (!outcome) {
            if (outcome.error().code() == ErrorCode::InvalidEvent) {
                FXP_LOG_DEBUG(LogCategory::Ingest, "rejected event: " +
                                                   outcome.error().describe());
                ++eventsRejected_;
                ++pendingApplied_;
                continue;
            }
            return GameResult<void>::err(outcome.error());
        }
        if (outcome.value().applied) {
            ++eventsApplied_;
        } else {
            ++eventsDuplicate_;
        }
        ++pendingApplied_;
    }
    return GameResult<void>::ok();
}

GameResult<bool> IngestWorker::processNext() {
    if (!pending_) {
        auto line = source_.next();
        if (!line) {
            if (line.error().code() == ErrorCode::SourceUnavailable) {
                return GameResult<bool>::err(line.error());
            }
            FXP_LOG_WARN(LogCategory::Ingest, line.error().describe());
            return GameResult<bool>::ok(false);
        }
        if (!line.value()) {
            return GameResult<bool>::ok(false);
        }

        ++linesRead_;
        pending_ = extractor_.parse(*line.value());
        pendingApplied_ = 0;
        if (!pending_->empty()) {
            ++linesWithEvents_;
        }
    }

    auto applied = applyPending();
    for (int attempt = 1; !applied && attempt <= retry_.maxApplyRetries; ++attempt) {
        ++applyRetries_;
        FXP_LOG_WARN(LogCategory::Ingest,
                     "apply failed at offset " + std::to_string(source_.offset()) + " (" +
                     applied.error().describe() + "), retry " +
                     std::to_string(attempt) + "/" + std::to_string(retry_.maxApplyRetries));
        std::this_thread::sleep_for(retry_.backoff);
        applied = applyPending();
    }
    if (!applied) {
        FXP_LOG_ERROR(LogCategory::Ingest,
                      "giving up on line at offset " + std::to_string(source_.offset()) + ": " +
                      applied.error().describe());
        return GameResult<bool>::err(applied.error());
    }

    source_.commit();
    pending_.reset();
    pendingApplied_ = 0;
    return GameResult<bool>::ok(true);
}

GameResult<void> IngestWorker::run() {
    running_ = true;
    FXP_LOG_INFO(LogCategory::Ingest, "ingestion worker started on " + source_.path().string());

    while (!stopRequested_.load()) {
        auto processed = processNext();
        if (!processed) {
            running_ = false;
            return GameResult<void>::err(processed.error());
        }
        if (!processed.value()) {
            source_.waitForData();
        }
    }

    running_ = false;
    FXP_LOG_INFO(LogCategory::Ingest,
                 "ingestion worker stopped after " + std::to_string(linesRead_.load()) + " lines");
    return GameResult<void>::ok();
}

void IngestWorker::stop() noexcept {
    stopRequested_ = true;
}

IngestCounters IngestWorker::counters() const {
    IngestCounters c;
    c.linesRead = linesRead_.load();
    c.linesWithEvents = linesWithEvents_.load();
    c.eventsApplied = eventsApplied_.load();
    c.eventsDuplicate = eventsDuplicate_.load();
    c.eventsRejected = eventsRejected_.load();
    c.applyRetries = applyRetries_.load();
    return c;
}

} // namespace fxp::service
