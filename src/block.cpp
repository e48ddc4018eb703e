#include "block.hpp"

#include "error.hpp"
#include "ffi/dispatch.hpp"
#include "ffi/protect.hpp"
#include "log.hpp"
#include "runtime.hpp"
#include "values.hpp"

#include <ruby.h>

#include <mutex>

namespace garnet {

// describe a failed protected call as a dispatch signal
static void signal_from_status(const call_status& status, dispatch_signal* out) {
    switch (status.kind) {
    case status_success:
        out->kind = signal_value;
        out->value = status.value;
        break;
    case status_exception:
        out->kind = signal_raise;
        out->value = status.value;
        break;
    case status_jump:
        out->kind = signal_jump;
        out->value = (rvalue)status.tag;
        break;
    }
}

// Raise a RuntimeError for a host exception. Making the exception object can
// fail too, in which case we raise whatever that raised instead.
static void signal_runtime_error(const string& message, dispatch_signal* out) {
    get_logger()->log_info("dispatch",
            "Host block threw, raising RuntimeError: " + message);
    auto status = protect_exc_new(rb_eRuntimeError, message.c_str());
    if (status.ok()) {
        out->kind = signal_raise;
        out->value = status.value;
    } else {
        signal_from_status(status, out);
    }
}

static void host_block_dispatch(void* context,
        int argc,
        const rvalue* argv,
        rvalue block_arg,
        dispatch_signal* out) {
    (void)block_arg;
    auto fn = (const block_function*)context;
    try {
        dyn_array<rooted_value> args;
        args.reserve(argc);
        for (int i = 0; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }
        // The result box goes away when we return, but by then the thunk is
        // holding the value on the native stack where the GC can see it.
        auto res = (*fn)(args);
        out->kind = signal_value;
        out->value = res.get();
    } catch (const iter_break& e) {
        out->kind = e.has_value() ? signal_break_value : signal_break;
        out->value = e.value();
    } catch (const ruby_exception& e) {
        out->kind = signal_raise;
        out->value = e.exception();
    } catch (const ruby_jump& e) {
        out->kind = signal_jump;
        out->value = (rvalue)e.tag;
    } catch (const std::exception& e) {
        signal_runtime_error(e.what(), out);
    } catch (...) {
        signal_runtime_error("Unknown host exception in block.", out);
    }
}

static void proc_block_dispatch(rvalue context,
        int argc,
        const rvalue* argv,
        rvalue block_arg,
        dispatch_signal* out) {
    signal_from_status(protect_proc_call(context, argc, argv, block_arg), out);
}

static std::once_flag dispatch_installed;

void install_block_dispatch() {
    std::call_once(dispatch_installed, [] {
        register_block_dispatcher(host_block_dispatch);
        register_value_block_dispatcher(proc_block_dispatch);
    });
}

// unwrap the arguments. The boxes keep them rooted while Ruby uses the array.
static dyn_array<rvalue> arg_values(const dyn_array<rooted_value>& args) {
    dyn_array<rvalue> res;
    res.reserve(args.size());
    for (auto& a : args) {
        res.push_back(a.get());
    }
    return res;
}

rooted_value call_with_block(rvalue recv,
        rid method,
        const dyn_array<rooted_value>& args,
        const block_function& fn) {
    install_block_dispatch();
    auto argv = arg_values(args);
    auto status = protect_block_call(recv, method, (int)argv.size(),
            argv.data(), (void*)&fn);
    return rooted_value{check_status(status)};
}

rooted_value call_with_block(rvalue recv,
        const string& method,
        const dyn_array<rooted_value>& args,
        const block_function& fn) {
    return call_with_block(recv, get_id(method), args, fn);
}

rooted_value call_with_proc(rvalue recv,
        rid method,
        const dyn_array<rooted_value>& args,
        rvalue proc) {
    install_block_dispatch();
    auto argv = arg_values(args);
    auto status = protect_block_call_value(recv, method, (int)argv.size(),
            argv.data(), proc);
    return rooted_value{check_status(status)};
}

rooted_value call_with_proc(rvalue recv,
        const string& method,
        const dyn_array<rooted_value>& args,
        rvalue proc) {
    return call_with_proc(recv, get_id(method), args, proc);
}

}
