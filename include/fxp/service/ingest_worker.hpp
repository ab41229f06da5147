#pragma once

/// @file ingest_worker.hpp
/// @brief Single-source ingestion loop: line -> events -> progression.

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "fxp/foundation/game_result.hpp"
#include "fxp/ingest/event_extractor.hpp"
#include "fxp/ingest/line_source.hpp"
#include "fxp/progression/progression_engine.hpp"
#include "fxp/service/worker_settings.hpp"

namespace fxp::service {

/// Counters exposed for logging and tests.
struct IngestCounters {
    std::uint64_t linesRead = 0;
    std::uint64_t linesWithEvents = 0;
    std::uint64_t eventsApplied = 0;
    std::uint64_t eventsDuplicate = 0;
    std::uint64_t eventsRejected = 0;
    std::uint64_t applyRetries = 0;
};

/// Processes one line end-to-end before reading the next.
///
/// The source cursor is committed only after every event of the line has
/// been applied (or recognised as already applied). A store failure is
/// retried up to RetryPolicy::maxApplyRetries times with the configured
/// backoff, using the events parsed on the first attempt; after that the
/// worker stops and reports the error, leaving the line uncommitted.
class IngestWorker {
public:
    IngestWorker(ingest::LineSource& source, const ingest::EventExtractor& extractor,
                 progression::ProgressionEngine& engine, RetryPolicy retry = {});

    IngestWorker(const IngestWorker&) = delete;
    IngestWorker& operator=(const IngestWorker&) = delete;

    /// Handle at most one line.
    /// @return true when a line was consumed, false when none was ready,
    ///         or the store error that exhausted the retries.
    [[nodiscard]] foundation::GameResult<bool> processNext();

    /// Loop until stop() or a fatal error; waits on the source when idle.
    [[nodiscard]] foundation::GameResult<void> run();

    /// Ask run() to return after the current line.
    void stop() noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    [[nodiscard]] IngestCounters counters() const;

private:
    foundation::GameResult<void> applyPending();

    ingest::LineSource& source_;
    const ingest::EventExtractor& extractor_;
    progression::ProgressionEngine& engine_;
    RetryPolicy retry_;

    // Events of the uncommitted line, kept so retries reuse the same
    // timestamps (and therefore identities).
    std::optional<std::vector<ingest::Event>> pending_;
    std::size_t pendingApplied_ = 0;

    std::atomic<bool> stopRequested_{false};
    std::atomic<bool> running_{false};

    std::atomic<std::uint64_t> linesRead_{0};
    std::atomic<std::uint64_t> linesWithEvents_{0};
    std::atomic<std::uint64_t> eventsApplied_{0};
    std::atomic<std::uint64_t> eventsDuplicate_{0};
    std::atomic<std::uint64_t> eventsRejected_{0};
    std::atomic<std::uint64_t> applyRetries_{0};
};

} // namespace fxp::service
