// executor.hpp -- run jobs one at a time on a dedicated Ruby thread

#ifndef __GARNET_EXECUTOR_HPP
#define __GARNET_EXECUTOR_HPP

#include "base.hpp"
#include "log.hpp"

#include <functional>
#include <future>
#include <memory>

namespace garnet {

// Ruby only runs on the thread that set it up. A serial_executor owns such a
// thread: it sets up Ruby there, then runs queued jobs strictly one after
// another in submission order, never concurrently with each other or with
// setup/teardown. Any thread may submit work.

enum executor_state {
    // thread not started yet
    executor_created,
    // accepting and running jobs
    executor_running,
    // stop() was called. Queued jobs still run; new ones are rejected.
    executor_stop_requested,
    // teardown has finished and the thread has exited
    executor_stopped
};

typedef std::function<void()> executor_job;

// what the executor thread does before the first job and after the last one
struct executor_hooks {
    std::function<void()> setup;
    std::function<void()> teardown;
};

// soft_setup() and cleanup() of the Ruby runtime
executor_hooks ruby_executor_hooks();

// state shared by the executor object and its thread
struct executor_shared;

class serial_executor {
private:
    shared_ptr<executor_shared> shared;

public:
    // Start the thread. name is used for the thread name (truncated to what
    // the platform allows) and in log messages. If log is null, the global
    // logger is used.
    explicit serial_executor(const string& name = "garnet-ruby",
            const executor_hooks& hooks = ruby_executor_hooks(),
            logger* log = nullptr);
    // Does not stop the thread. An executor that's never stopped keeps its
    // thread (and Ruby) alive until the process exits.
    ~serial_executor();

    serial_executor(const serial_executor&) = delete;
    serial_executor& operator=(const serial_executor&) = delete;

    // Queue a job. Returns false (and drops the job) once stop has been
    // requested. Exceptions escaping a job are logged and otherwise ignored;
    // use submit() to observe them.
    bool enqueue(executor_job job);

    // Queue fn and get a future for its result. Exceptions thrown by fn come
    // out of the future. If the job is rejected, the future reports
    // std::future_errc::broken_promise.
    template<class F> auto submit(F&& fn) -> std::future<decltype(fn())> {
        typedef decltype(fn()) result_type;
        auto task = std::make_shared<std::packaged_task<result_type()>>(
                std::forward<F>(fn));
        auto res = task->get_future();
        enqueue([task]() { (*task)(); });
        return res;
    }

    // Request a stop and wait until queued jobs and teardown have finished.
    // Further calls do nothing (but still wait). Called from a job, this only
    // requests the stop, since waiting would deadlock.
    void stop();

    executor_state state() const;
    // true when called from a job running on this executor
    bool on_executor_thread() const;
    const string& name() const;
};

}

#endif
