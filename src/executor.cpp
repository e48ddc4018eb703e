#include "executor.hpp"

#include "runtime.hpp"

#include <condition_variable>
#include <mutex>
#include <thread>

#include <pthread.h>

namespace garnet {

struct executor_shared {
    const string name;
    const executor_hooks hooks;
    logger* const log;

    // guards everything below
    std::mutex mtx;
    std::condition_variable cv;
    dyn_array<executor_job> jobs;
    executor_state state = executor_created;
    std::thread::id thread_id;

    executor_shared(const string& name, const executor_hooks& hooks, logger* log)
        : name{name}
        , hooks{hooks}
        , log{log} {
    }
};

executor_hooks ruby_executor_hooks() {
    executor_hooks res;
    res.setup = [] { soft_setup(); };
    res.teardown = [] { cleanup(); };
    return res;
}

static void run_hook(executor_shared* st,
        const std::function<void()>& hook,
        const char* which) {
    if (!hook) {
        return;
    }
    try {
        hook();
    } catch (const std::exception& e) {
        st->log->log_error("executor",
                st->name + ": " + which + " hook threw: " + e.what());
    } catch (...) {
        st->log->log_error("executor",
                st->name + ": " + which + " hook threw a non-standard exception");
    }
}

static void run_job(executor_shared* st, executor_job& job) {
    try {
        job();
    } catch (const std::exception& e) {
        st->log->log_error("executor",
                st->name + ": job threw: " + e.what());
    } catch (...) {
        st->log->log_error("executor",
                st->name + ": job threw a non-standard exception");
    }
}

static void executor_main(shared_ptr<executor_shared> st) {
    // Linux limits thread names to 15 characters
    int rc = pthread_setname_np(pthread_self(), st->name.substr(0, 15).c_str());
    if (rc != 0) {
        st->log->log_warning("executor",
                st->name + ": couldn't name thread (error " + std::to_string(rc) + ")");
    }

    run_hook(st.get(), st->hooks.setup, "setup");

    std::unique_lock<std::mutex> lock{st->mtx};
    if (st->state == executor_created) {
        st->state = executor_running;
    }
    st->log->log_info("executor", st->name + ": running");

    while (true) {
        st->cv.wait(lock, [&st] {
            return !st->jobs.empty() || st->state == executor_stop_requested;
        });
        if (st->jobs.empty()) {
            // stop requested and everything queued before it has run
            break;
        }
        dyn_array<executor_job> batch;
        batch.swap(st->jobs);
        lock.unlock();
        for (auto& job : batch) {
            run_job(st.get(), job);
        }
        // destroy the jobs (and whatever they captured) before relocking
        batch.clear();
        lock.lock();
    }

    // no more jobs can arrive now
    lock.unlock();
    run_hook(st.get(), st->hooks.teardown, "teardown");
    lock.lock();

    st->state = executor_stopped;
    st->log->log_info("executor", st->name + ": stopped");
    st->cv.notify_all();
}

serial_executor::serial_executor(const string& name,
        const executor_hooks& hooks,
        logger* log)
    : shared{std::make_shared<executor_shared>(name, hooks,
            log == nullptr ? get_logger() : log)} {
    std::thread t{executor_main, shared};
    std::lock_guard<std::mutex> lock{shared->mtx};
    shared->thread_id = t.get_id();
    t.detach();
}

serial_executor::~serial_executor() {
}

bool serial_executor::enqueue(executor_job job) {
    std::unique_lock<std::mutex> lock{shared->mtx};
    if (shared->state == executor_stop_requested
            || shared->state == executor_stopped) {
        lock.unlock();
        shared->log->log_warning("executor",
                shared->name + ": job rejected, executor is stopping");
        return false;
    }
    shared->jobs.push_back(std::move(job));
    shared->cv.notify_all();
    return true;
}

void serial_executor::stop() {
    std::unique_lock<std::mutex> lock{shared->mtx};
    if (shared->state == executor_created
            || shared->state == executor_running) {
        shared->state = executor_stop_requested;
        shared->cv.notify_all();
    }
    if (std::this_thread::get_id() == shared->thread_id) {
        return;
    }
    shared->cv.wait(lock, [this] {
        return shared->state == executor_stopped;
    });
}

executor_state serial_executor::state() const {
    std::lock_guard<std::mutex> lock{shared->mtx};
    return shared->state;
}

bool serial_executor::on_executor_thread() const {
    std::lock_guard<std::mutex> lock{shared->mtx};
    return std::this_thread::get_id() == shared->thread_id;
}

const string& serial_executor::name() const {
    return shared->name;
}

}
