// dispatch.hpp -- route Ruby block invocations to host code

#ifndef __GARNET_FFI_DISPATCH_HPP
#define __GARNET_FFI_DISPATCH_HPP

#include "base.hpp"

namespace garnet {

// Ruby calls C blocks through a plain function pointer plus a single VALUE of
// user data. We can't hand it arbitrary host closures, so every block call goes
// through one of two thunks below. The thunk forwards to a dispatcher function
// registered once at startup, passing the user data along as the context. The
// dispatcher runs the host code and then describes what Ruby should do next by
// filling in a dispatch_signal. Back in the thunk (which is safe to longjmp
// from) we carry out the signal.

enum signal_kind {
    // return value from the block
    signal_value,
    // raise value, which must be an exception object
    signal_raise,
    // terminate the enclosing iteration, like Ruby's `break`
    signal_break,
    // terminate the enclosing iteration with value as its result
    signal_break_value,
    // continue a non-local exit captured by an inner protected call. value is
    // the jump tag (see call_status::tag).
    signal_jump
};

struct dispatch_signal {
    signal_kind kind;
    rvalue value;
};

// Dispatcher for blocks whose context is an opaque host pointer. Must not throw
// or longjmp; everything is reported through out.
typedef void (*block_dispatcher)(void* context,
        int argc,
        const rvalue* argv,
        rvalue block_arg,
        dispatch_signal* out);

// Dispatcher for blocks whose context is a Ruby value (a Proc)
typedef void (*value_block_dispatcher)(rvalue context,
        int argc,
        const rvalue* argv,
        rvalue block_arg,
        dispatch_signal* out);

// Install the process-wide dispatchers. These are meant to be set once during
// initialization, before any block calls, from a single thread.
void register_block_dispatcher(block_dispatcher dispatcher);
void register_value_block_dispatcher(value_block_dispatcher dispatcher);

// The block functions handed to rb_block_call(). The signatures match
// rb_block_call_func. These may longjmp.
rvalue pvoid_block_thunk(rvalue yielded_arg,
        rvalue context,
        int argc,
        const rvalue* argv,
        rvalue block_arg);
rvalue value_block_thunk(rvalue yielded_arg,
        rvalue context,
        int argc,
        const rvalue* argv,
        rvalue block_arg);

}

#endif
