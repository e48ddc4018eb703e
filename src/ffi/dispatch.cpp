#include "ffi/dispatch.hpp"

#include <ruby.h>

namespace garnet {

// Registered dispatchers. Written once during initialization (single writer),
// read on the Ruby thread on every block call.
static block_dispatcher host_dispatcher = nullptr;
static value_block_dispatcher host_value_dispatcher = nullptr;

void register_block_dispatcher(block_dispatcher dispatcher) {
    host_dispatcher = dispatcher;
}

void register_value_block_dispatcher(value_block_dispatcher dispatcher) {
    host_value_dispatcher = dispatcher;
}

// Carry out a dispatch signal. Only the signal_value case returns; the rest
// longjmp. By the time we get here the host dispatcher has returned, so no host
// frames are skipped.
static VALUE carry_out(const dispatch_signal* sig) {
    switch (sig->kind) {
    case signal_value:
        return sig->value;
    case signal_raise:
        rb_exc_raise(sig->value);
    case signal_break:
        rb_iter_break();
    case signal_break_value:
        rb_iter_break_value(sig->value);
    case signal_jump:
        rb_jump_tag((int)sig->value);
    }
    rb_raise(rb_eRuntimeError, "Mangled dispatch signal: %d", (int)sig->kind);
}

rvalue pvoid_block_thunk(rvalue yielded_arg,
        rvalue context,
        int argc,
        const rvalue* argv,
        rvalue block_arg) {
    (void)yielded_arg;
    if (host_dispatcher == nullptr) {
        rb_raise(rb_eRuntimeError, "No host block dispatcher registered.");
    }
    dispatch_signal sig = {signal_value, Qnil};
    host_dispatcher((void*)context, argc, argv, block_arg, &sig);
    return carry_out(&sig);
}

rvalue value_block_thunk(rvalue yielded_arg,
        rvalue context,
        int argc,
        const rvalue* argv,
        rvalue block_arg) {
    (void)yielded_arg;
    if (host_value_dispatcher == nullptr) {
        rb_raise(rb_eRuntimeError, "No value block dispatcher registered.");
    }
    dispatch_signal sig = {signal_value, Qnil};
    host_value_dispatcher(context, argc, argv, block_arg, &sig);
    return carry_out(&sig);
}

}
