/// @file job_scheduler.cpp
/// @brief JobScheduler over kcenon thread_system.

#include "fxp/foundation/job_scheduler.hpp"

#include <kcenon/thread/core/job_builder.h>
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "fxp/foundation/game_logger.hpp"

namespace fxp::foundation {

namespace {

using Flag = std::shared_ptr<std::atomic<bool>>;

Flag makeFlag() {
    return std::make_shared<std::atomic<bool>>(false);
}

} // namespace

struct JobScheduler::Impl {
    struct Job {
        std::string label;
        JobFunc func;
        /// Zero for one-shot jobs.
        std::chrono::milliseconds period{0};
        std::chrono::milliseconds untilDue{0};
        /// One-shot: skip when set before start. Periodic: a run is in flight.
        Flag flag = makeFlag();
        std::shared_future<void> done;

        [[nodiscard]] bool periodic() const { return period.count() > 0; }
    };

    std::string name;
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::atomic<JobId> nextId{1};
    mutable std::mutex mutex;
    std::unordered_map<JobId, Job> jobs;

    bool enqueue(const std::string& jobName, std::function<void()> body) {
        auto job = kcenon::thread::job_builder()
                       .name(jobName)
                       .work([body = std::move(body)]() -> kcenon::common::VoidResult {
                           body();
                           return kcenon::common::VoidResult::ok(std::monostate{});
                       })
                       .build();
        return !pool->enqueue(std::move(job)).is_err();
    }
};

JobScheduler::JobScheduler(std::string name, std::size_t workers)
    : impl_(std::make_unique<Impl>()) {
    impl_->name = std::move(name);
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>(impl_->name);

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> threads;
    for (std::size_t i = 0; i < std::max<std::size_t>(workers, 1); ++i) {
        threads.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(threads));
    impl_->pool->start();
}

JobScheduler::~JobScheduler() {
    impl_->pool->stop(false);
}

GameResult<JobScheduler::JobId> JobScheduler::submit(std::string label, JobFunc job) {
    const auto id = impl_->nextId.fetch_add(1);
    auto promise = std::make_shared<std::promise<void>>();

    Impl::Job entry;
    entry.label = std::move(label);
    entry.done = promise->get_future().share();
    auto skip = entry.flag;
    auto jobName = impl_->name + "/" + entry.label;

    // Tracked before it is queued so join() cannot miss a job that finishes first.
    {
        std::lock_guard lock(impl_->mutex);
        impl_->jobs.emplace(id, std::move(entry));
    }

    bool queued = impl_->enqueue(jobName, [fn = std::move(job), skip, promise] {
        try {
            if (!skip->load()) {
                fn();
            }
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });
    if (!queued) {
        std::lock_guard lock(impl_->mutex);
        impl_->jobs.erase(id);
        return GameResult<JobId>::err(
            GameError(ErrorCode::JobScheduleFailed, "thread pool rejected the job", jobName));
    }
    return GameResult<JobId>::ok(id);
}

GameResult<JobScheduler::JobId> JobScheduler::every(std::string label,
                                                    std::chrono::milliseconds period,
                                                    JobFunc job) {
    if (period.count() <= 0) {
        return GameResult<JobId>::err(
            GameError(ErrorCode::InvalidArgument, "period must be positive", std::move(label)));
    }
    const auto id = impl_->nextId.fetch_add(1);

    Impl::Job entry;
    entry.label = std::move(label);
    entry.func = std::move(job);
    entry.period = period;
    entry.untilDue = period;

    std::lock_guard lock(impl_->mutex);
    impl_->jobs.emplace(id, std::move(entry));
    return GameResult<JobId>::ok(id);
}

std::size_t JobScheduler::advance(std::chrono::milliseconds elapsed) {
    std::size_t dispatched = 0;
    std::lock_guard lock(impl_->mutex);

    for (auto& [id, job] : impl_->jobs) {
        if (!job.periodic()) {
            continue;
        }
        job.untilDue -= elapsed;
        if (job.untilDue.count() > 0) {
            continue;
        }
        job.untilDue = job.period;

        auto busy = job.flag;
        if (busy->exchange(true)) {
            FXP_LOG_DEBUG(LogCategory::Core, job.label + " still running; period skipped");
            continue;
        }

        bool queued = impl_->enqueue(impl_->name + "/" + job.label,
                                     [fn = job.func, busy, label = job.label] {
            try {
                fn();
            } catch (const std::exception& e) {
                FXP_LOG_ERROR(LogCategory::Core, label + " failed: " + e.what());
            }
            busy->store(false);
        });
        if (queued) {
            ++dispatched;
        } else {
            busy->store(false);
            FXP_LOG_WARN(LogCategory::Core, "thread pool rejected " + job.label);
        }
    }
    return dispatched;
}

GameResult<void> JobScheduler::join(JobId id) {
    std::shared_future<void> done;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->jobs.find(id);
        if (it == impl_->jobs.end() || it->second.periodic()) {
            return GameResult<void>::err(
                GameError(ErrorCode::JobNotFound, "no one-shot job " + std::to_string(id)));
        }
        done = it->second.done;
    }

    done.wait();
    std::string label;
    {
        std::lock_guard lock(impl_->mutex);
        if (auto it = impl_->jobs.find(id); it != impl_->jobs.end()) {
            label = std::move(it->second.label);
            impl_->jobs.erase(it);
        }
    }

    try {
        done.get();
    } catch (const std::exception& e) {
        return GameResult<void>::err(GameError(ErrorCode::ThreadError, e.what(), label));
    }
    return GameResult<void>::ok();
}

GameResult<void> JobScheduler::cancel(JobId id) {
    std::lock_guard lock(impl_->mutex);
    auto it = impl_->jobs.find(id);
    if (it == impl_->jobs.end()) {
        return GameResult<void>::err(
            GameError(ErrorCode::JobNotFound, "no job " + std::to_string(id)));
    }

    auto& job = it->second;
    if (job.periodic()) {
        impl_->jobs.erase(it);
        return GameResult<void>::ok();
    }
    if (job.done.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        return GameResult<void>::err(
            GameError(ErrorCode::JobCancelled, "job already finished", job.label));
    }
    job.flag->store(true);
    return GameResult<void>::ok();
}

std::size_t JobScheduler::trackedJobs() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->jobs.size();
}

} // namespace fxp::foundation
