#define BOOST_TEST_MODULE Serial Executor Test Module
#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include "base.hpp"
#include "config.hpp"
#include "error.hpp"
#include "executor.hpp"
#include "ffi/protect.hpp"
#include "gvl.hpp"
#include "log.hpp"
#include "runtime.hpp"
#include "values.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>

using namespace garnet;

// Everything except the last test case uses fake setup/teardown hooks, so Ruby
// is only started once, at the end.

// thread-safe event log
struct recorder {
    std::mutex mtx;
    dyn_array<string> events;

    void add(const string& e) {
        std::lock_guard<std::mutex> lock{mtx};
        events.push_back(e);
    }
    dyn_array<string> get() {
        std::lock_guard<std::mutex> lock{mtx};
        return events;
    }
};

static executor_hooks recording_hooks(recorder* rec) {
    executor_hooks res;
    res.setup = [rec] { rec->add("setup"); };
    res.teardown = [rec] { rec->add("teardown"); };
    return res;
}

BOOST_AUTO_TEST_CASE( executor_order_test ) {
    logger log{nullptr, nullptr};
    recorder rec;
    serial_executor exec{"order-test", recording_hooks(&rec), &log};
    for (int i = 0; i < 100; ++i) {
        BOOST_TEST((exec.enqueue([&rec, i] { rec.add(std::to_string(i)); })));
    }
    exec.stop();
    BOOST_TEST((exec.state() == executor_stopped));

    auto events = rec.get();
    BOOST_REQUIRE((events.size() == 102));
    BOOST_TEST((events.front() == "setup"));
    for (int i = 0; i < 100; ++i) {
        BOOST_TEST((events[i + 1] == std::to_string(i)));
    }
    BOOST_TEST((events.back() == "teardown"));
}

BOOST_AUTO_TEST_CASE( executor_multithread_test ) {
    logger log{nullptr, nullptr};
    recorder rec;
    serial_executor exec{"multi-test", executor_hooks{}, &log};

    const int num_threads = 4;
    const int per_thread = 250;
    std::atomic<int> active{0};
    std::atomic<bool> overlapped{false};
    std::mutex order_mtx;
    dyn_array<dyn_array<int>> seen(num_threads);

    dyn_array<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < per_thread; ++i) {
                exec.enqueue([&, t, i] {
                    if (++active != 1) {
                        overlapped = true;
                    }
                    {
                        std::lock_guard<std::mutex> lock{order_mtx};
                        seen[t].push_back(i);
                    }
                    --active;
                });
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    exec.stop();

    BOOST_TEST((!overlapped));
    for (int t = 0; t < num_threads; ++t) {
        // each submitter's jobs run in the order it submitted them
        BOOST_REQUIRE((seen[t].size() == (size_t)per_thread));
        for (int i = 0; i < per_thread; ++i) {
            BOOST_TEST((seen[t][i] == i));
        }
    }
}

BOOST_AUTO_TEST_CASE( executor_drain_test ) {
    logger log{nullptr, nullptr};
    recorder rec;
    serial_executor exec{"drain-test", recording_hooks(&rec), &log};
    exec.enqueue([] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    });
    std::atomic<int> ran{0};
    for (int i = 0; i < 10; ++i) {
        exec.enqueue([&ran] { ++ran; });
    }
    exec.stop();
    // everything queued before the stop still ran, then teardown
    BOOST_TEST((ran == 10));
    BOOST_TEST((rec.get().back() == "teardown"));

    BOOST_TEST((!exec.enqueue([&ran] { ++ran; })));
    auto f = exec.submit([] { return 1; });
    BOOST_CHECK_THROW(f.get(), std::future_error);
    BOOST_TEST((ran == 10));
}

BOOST_AUTO_TEST_CASE( executor_double_stop_test ) {
    logger log{nullptr, nullptr};
    recorder rec;
    serial_executor exec{"stop-test", recording_hooks(&rec), &log};
    exec.stop();
    exec.stop();
    BOOST_TEST((exec.state() == executor_stopped));
    auto events = rec.get();
    BOOST_TEST((events == (dyn_array<string>{"setup", "teardown"})));
}

BOOST_AUTO_TEST_CASE( executor_concurrent_stop_test ) {
    logger log{nullptr, nullptr};
    recorder rec;
    serial_executor exec{"cstop-test", recording_hooks(&rec), &log};
    exec.enqueue([] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    });
    std::thread other{[&exec] { exec.stop(); }};
    exec.stop();
    other.join();
    BOOST_TEST((exec.state() == executor_stopped));
    BOOST_TEST((rec.get().size() == 2));
}

BOOST_AUTO_TEST_CASE( executor_submit_test ) {
    logger log{nullptr, nullptr};
    serial_executor exec{"submit-test", executor_hooks{}, &log};

    auto f = exec.submit([] { return 6 * 7; });
    BOOST_TEST((f.get() == 42));

    auto g = exec.submit([]() -> int { throw std::runtime_error{"job failed"}; });
    BOOST_CHECK_THROW(g.get(), std::runtime_error);

    auto h = exec.submit([&exec] { return exec.on_executor_thread(); });
    BOOST_TEST((h.get()));
    BOOST_TEST((!exec.on_executor_thread()));
    BOOST_TEST((exec.name() == "submit-test"));

    exec.stop();
}

BOOST_AUTO_TEST_CASE( executor_throwing_job_test ) {
    std::ostringstream err;
    logger log{&err, nullptr};
    serial_executor exec{"throw-test", executor_hooks{}, &log};
    exec.enqueue([] { throw std::runtime_error{"bad job"}; });
    std::atomic<bool> ran{false};
    exec.enqueue([&ran] { ran = true; });
    exec.stop();
    // the loop survived and the failure was logged
    BOOST_TEST((ran));
    BOOST_TEST((err.str().find("bad job") != string::npos));
}

BOOST_AUTO_TEST_CASE( executor_non_standard_throw_test ) {
    std::ostringstream err;
    logger log{&err, nullptr};
    executor_hooks hooks;
    hooks.setup = [] { throw 7; };
    serial_executor exec{"int-throw-test", hooks, &log};
    exec.enqueue([] { throw 42; });
    std::atomic<bool> ran{false};
    exec.enqueue([&ran] { ran = true; });
    exec.stop();
    BOOST_TEST((ran));
    BOOST_TEST((exec.state() == executor_stopped));
    BOOST_TEST((err.str().find("setup hook threw a non-standard exception")
            != string::npos));
    BOOST_TEST((err.str().find("job threw a non-standard exception")
            != string::npos));
}

BOOST_AUTO_TEST_CASE( executor_stop_from_job_test ) {
    logger log{nullptr, nullptr};
    recorder rec;
    serial_executor exec{"self-stop", recording_hooks(&rec), &log};
    std::atomic<bool> later{false};
    exec.enqueue([&exec] { exec.stop(); });
    exec.stop();
    BOOST_TEST((exec.state() == executor_stopped));
    BOOST_TEST((!exec.enqueue([&later] { later = true; })));
    BOOST_TEST((rec.get().back() == "teardown"));
}

// Last: starts and stops the real runtime, which can only happen once.
BOOST_AUTO_TEST_CASE( executor_ruby_test ) {
    runtime_options opts;
    opts.load_paths = {"/garnet/first", "/garnet/second"};
    configure(opts);
    logger log{nullptr, nullptr};
    serial_executor exec{"ruby-test", ruby_executor_hooks(), &log};

    // configured directories go to the front of $LOAD_PATH, in order
    auto p = exec.submit([] {
        string res;
        if (!vget_string(res, eval("$LOAD_PATH.first(2).join(',')").get())) {
            res = "<not a string>";
        }
        return res;
    });
    BOOST_TEST((p.get() == "/garnet/first,/garnet/second"));

    auto f = exec.submit([] {
        long res = 0;
        check_status(protect_to_long(res, eval("[1, 2, 3].sum * 7").get()));
        return res;
    });
    BOOST_TEST((f.get() == 42));

    auto g = exec.submit([] { return runtime_state() == vm_setup && is_ruby_thread(); });
    BOOST_TEST((g.get()));

    // Ruby errors come back as descriptions; the exception object itself stays
    // on the Ruby thread
    auto h = exec.submit([]() -> string {
        try {
            eval("raise 'from the executor'");
        } catch (const ruby_exception& e) {
            return e.message;
        }
        return "";
    });
    BOOST_TEST((h.get() == "RuntimeError: from the executor"));

    // give up the GVL inside a job and take it back
    auto k = exec.submit([] {
        long res = 0;
        call_without_gvl([&res] {
            call_with_gvl([&res] {
                check_status(protect_to_long(res, eval("6 * 7").get()));
            });
        });
        return res;
    });
    BOOST_TEST((k.get() == 42));

    // an unblocking function that throws something odd is logged, and the
    // exception stays out of Ruby's frames
    std::ostringstream err;
    logger ubf_log{&err, nullptr};
    set_logger(&ubf_log);
    auto u = exec.submit([] {
        eval("$garnet_stop_waking = false\n"
             "$garnet_waker = Thread.new do\n"
             "  until $garnet_stop_waking\n"
             "    Thread.main.wakeup\n"
             "    sleep 0.01\n"
             "  end\n"
             "end");
        std::atomic<bool> woken{false};
        call_without_gvl([&woken] {
                    auto deadline = std::chrono::steady_clock::now()
                        + std::chrono::seconds(5);
                    while (!woken && std::chrono::steady_clock::now() < deadline) {
                        std::this_thread::sleep_for(std::chrono::milliseconds(1));
                    }
                },
                [&woken] {
                    woken = true;
                    throw 42;
                });
        eval("$garnet_stop_waking = true; $garnet_waker.join");
        return woken.load();
    });
    BOOST_TEST((u.get()));
    set_logger(nullptr);
    BOOST_TEST((err.str().find("Unblocking function threw a non-standard exception")
            != string::npos));

    exec.stop();
    BOOST_TEST((runtime_state() == vm_cleaned_up));
    BOOST_TEST((!soft_setup()));
    BOOST_CHECK_THROW(setup(), setup_error);
}
