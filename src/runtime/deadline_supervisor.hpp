#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include "core/errors/run_errors.hpp"
#include "core/logging/logger.hpp"
#include "process/process_tree_reaper.hpp"

namespace overseer::runtime {

struct TimedOut {
    std::chrono::milliseconds deadline{0};
    std::string label;
    std::size_t reclaimed_processes = 0;
};

// One unit of work with its wall-clock bound. Arguments are bound into
// `work` by the caller. Anything `work` captures by reference must outlive
// the worker thread, which keeps running after a timeout; capture shared
// ownership when the caller may return first.
template <typename T>
struct DeadlineTask {
    std::string label;
    std::function<core::errors::Result<T>()> work;
    std::chrono::milliseconds deadline{0};
};

// Exactly one of: the work's value, the error it returned, or TimedOut.
template <typename T>
using DeadlineResult = std::variant<T, core::errors::Error, TimedOut>;

template <typename T>
bool timed_out(const DeadlineResult<T>& result) {
    return std::holds_alternative<TimedOut>(result);
}

template <typename T>
bool is_failure(const DeadlineResult<T>& result) {
    return std::holds_alternative<core::errors::Error>(result);
}

template <typename T>
const core::errors::Error& get_failure(const DeadlineResult<T>& result) {
    return std::get<core::errors::Error>(result);
}

template <typename T>
const TimedOut& get_timeout(const DeadlineResult<T>& result) {
    return std::get<TimedOut>(result);
}

template <typename T>
const T& get_value(const DeadlineResult<T>& result) {
    return std::get<T>(result);
}

// Runs work on its own thread under a deadline. On expiry every descendant
// process of the current process is reclaimed and TimedOut is returned; the
// worker thread itself is detached, not stopped.
class DeadlineSupervisor {
public:
    explicit DeadlineSupervisor(core::logging::LogSink& log,
                                process::ReaperOptions reaper_options = {});

    template <typename T>
    DeadlineResult<T> run_with_deadline(DeadlineTask<T> task) const {
        if (!task.work) {
            return core::errors::Error{core::errors::ErrorCategory::Input,
                                       "Deadline task has no work: " + task.label,
                                       "empty_deadline_task"};
        }

        std::packaged_task<core::errors::Result<T>()> packaged(std::move(task.work));
        auto future = packaged.get_future();
        std::thread worker(std::move(packaged));
        worker.detach();

        if (future.wait_for(task.deadline) == std::future_status::ready) {
            // get() rethrows anything the work threw.
            core::errors::Result<T> outcome = future.get();
            if (core::errors::is_error(outcome)) {
                return core::errors::get_error(outcome);
            }
            return std::move(std::get<T>(outcome));
        }

        TimedOut timeout;
        timeout.deadline = task.deadline;
        timeout.label = task.label;
        timeout.reclaimed_processes = reclaim_descendants(task.label, task.deadline);
        return timeout;
    }

    const process::ProcessTreeReaper& reaper() const { return reaper_; }

private:
    std::size_t reclaim_descendants(const std::string& label,
                                    std::chrono::milliseconds deadline) const;

    core::logging::LogSink& log_;
    process::ProcessTreeReaper reaper_;
};

}  // namespace overseer::runtime
