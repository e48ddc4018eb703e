#include "gvl.hpp"

#include "log.hpp"

#include <ruby.h>
#include <ruby/thread.h>

#include <exception>

namespace garnet {

// Ruby calls back through C frames, so nothing may be thrown across them. The
// callbacks stash any exception here for the caller to rethrow.
struct gvl_call {
    const std::function<void()>* fn;
    std::exception_ptr err;
};

static void* gvl_callback(void* data) {
    auto call = (gvl_call*)data;
    try {
        (*call->fn)();
    } catch (...) {
        call->err = std::current_exception();
    }
    return nullptr;
}

static void ubf_callback(void* data) {
    auto fn = (const std::function<void()>*)data;
    try {
        (*fn)();
    } catch (const std::exception& e) {
        get_logger()->log_error("runtime",
                string{"Unblocking function threw: "} + e.what());
    } catch (...) {
        get_logger()->log_error("runtime",
                "Unblocking function threw a non-standard exception");
    }
}

static void finish(const gvl_call& call) {
    if (call.err) {
        std::rethrow_exception(call.err);
    }
}

void call_without_gvl(const std::function<void()>& fn, unblock_kind unblock) {
    gvl_call call = {&fn, nullptr};
    rb_unblock_function_t* ubf = nullptr;
    if (unblock == unblock_io) {
        ubf = RUBY_UBF_IO;
    }
    rb_thread_call_without_gvl(gvl_callback, &call, ubf, nullptr);
    finish(call);
}

void call_without_gvl(const std::function<void()>& fn,
        const std::function<void()>& unblock) {
    gvl_call call = {&fn, nullptr};
    rb_thread_call_without_gvl(gvl_callback, &call,
            ubf_callback, (void*)&unblock);
    finish(call);
}

void call_with_gvl(const std::function<void()>& fn) {
    gvl_call call = {&fn, nullptr};
    rb_thread_call_with_gvl(gvl_callback, &call);
    finish(call);
}

bool is_ruby_thread() {
    return ruby_native_thread_p() != 0;
}

}
