#pragma once

/// @file job_scheduler.hpp
/// @brief Labelled one-shot and periodic jobs on a kcenon thread pool.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "fxp/foundation/game_result.hpp"

namespace fxp::foundation {

/// Runs the long-lived ingestion loop and the periodic quest rotation.
///
/// Periodic jobs are driven by advance(), so the caller owns the clock and
/// tests can step time without sleeping.
///
/// @code
///   JobScheduler scheduler("ingest", 2);
///   auto loop = scheduler.submit("ingest-loop", [&] { worker.run(); });
///   scheduler.every("quest-rotation", std::chrono::minutes(5), [&] { rotation.rotate(now()); });
///   while (running) { scheduler.advance(100ms); std::this_thread::sleep_for(100ms); }
///   scheduler.join(loop.value());
/// @endcode
class JobScheduler {
public:
    using JobId = std::uint64_t;
    using JobFunc = std::function<void()>;

    JobScheduler(std::string name, std::size_t workers);

    /// Waits for running jobs; pending one-shot jobs still run.
    ~JobScheduler();

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;

    /// Queue @p job to run once. An exception it throws is reported by join().
    [[nodiscard]] GameResult<JobId> submit(std::string label, JobFunc job);

    /// Register @p job to run each time @p period of advance() time passes.
    /// Exceptions are logged and do not disable the job.
    [[nodiscard]] GameResult<JobId> every(std::string label, std::chrono::milliseconds period,
                                          JobFunc job);

    /// Move periodic timers forward and dispatch the jobs that came due.
    /// A job still running from its previous period is skipped.
    /// @return the number of jobs dispatched.
    std::size_t advance(std::chrono::milliseconds elapsed);

    /// Block until one-shot job @p id finishes, then forget it.
    [[nodiscard]] GameResult<void> join(JobId id);

    /// Skip a one-shot job that has not started, or retire a periodic job.
    [[nodiscard]] GameResult<void> cancel(JobId id);

    /// Jobs submitted or registered and not yet joined or cancelled.
    [[nodiscard]] std::size_t trackedJobs() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace fxp::foundation
