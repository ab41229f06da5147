#pragma once

/// @file ingest_service.hpp
/// @brief Wires store, rules, line source, engine, rotation and the job
///        scheduler into the running ingestion process.

#include <chrono>
#include <memory>
#include <optional>

#include "fxp/foundation/game_error.hpp"
#include "fxp/foundation/game_result.hpp"
#include "fxp/foundation/types.hpp"
#include "fxp/progression/progression_store.hpp"
#include "fxp/progression/quest_rotation.hpp"
#include "fxp/service/ingest_worker.hpp"
#include "fxp/service/worker_settings.hpp"

namespace fxp::service {

/// The ingestion process.
///
/// start() opens the store, compiles the rules (any failure aborts
/// startup), opens the log, runs one quest rotation, then schedules the
/// worker loop as a job and the rotation as a recurring tick job.
///
/// Usage:
/// @code
///   IngestService service(settings);
///   if (!service.start()) { return EXIT_FAILURE; }
///   while (!signals.shutdownRequested() && service.isRunning()) {
///       service.tick(100ms);
///       std::this_thread::sleep_for(100ms);
///   }
///   service.stop();
/// @endcode
class IngestService {
public:
    explicit IngestService(WorkerSettings settings,
                           foundation::Clock clock = foundation::systemNow);
    ~IngestService();

    IngestService(const IngestService&) = delete;
    IngestService& operator=(const IngestService&) = delete;

    [[nodiscard]] foundation::GameResult<void> start();

    /// Stop the worker between lines and wait for it. Idempotent.
    void stop();

    /// Advance the scheduler's tick timers (drives quest rotation).
    void tick(std::chrono::milliseconds delta);

    /// False once the worker has stopped, including after a fatal error.
    [[nodiscard]] bool isRunning() const;

    /// The error that stopped the worker, if any.
    [[nodiscard]] std::optional<foundation::GameError> workerError() const;

    /// Run a rotation immediately (admin "rotate now").
    [[nodiscard]] foundation::GameResult<progression::RotationReport> rotateNow();

    [[nodiscard]] progression::IProgressionStore& store();

    [[nodiscard]] IngestCounters counters() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace fxp::service
