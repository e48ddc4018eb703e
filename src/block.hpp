// block.hpp -- pass host closures and Ruby procs to Ruby methods as blocks

#ifndef __GARNET_BLOCK_HPP
#define __GARNET_BLOCK_HPP

#include "base.hpp"
#include "value_box.hpp"

#include <functional>

namespace garnet {

// A block implemented in C++. It receives the values Ruby yields (a block with
// one parameter still gets a one-element array) and returns the block's
// result.
//
// Block functions communicate with the iterating method by throwing:
// - iter_break terminates the iteration, optionally with a result value;
// - ruby_exception re-raises the exception into Ruby;
// - ruby_jump continues a jump captured by an inner protected call;
// - any other exception is converted into a Ruby RuntimeError.
// Nothing thrown by a block function ever unwinds through Ruby's frames.
typedef std::function<rooted_value(const dyn_array<rooted_value>&)>
    block_function;

// Register the host dispatchers with the dispatch thunks. Safe to call any
// number of times from any thread; only the first call does anything. Runtime
// setup calls this.
void install_block_dispatch();

// Call recv.method(*args) with fn as the block. fn is only used for the
// duration of the call, so it must not be kept by Ruby (as e.g. Proc.new or
// define_method would). Throws ruby_exception/ruby_jump on failure.
rooted_value call_with_block(rvalue recv,
        rid method,
        const dyn_array<rooted_value>& args,
        const block_function& fn);
rooted_value call_with_block(rvalue recv,
        const string& method,
        const dyn_array<rooted_value>& args,
        const block_function& fn);

// Call recv.method(*args, &proc). Private methods can be called this way.
rooted_value call_with_proc(rvalue recv,
        rid method,
        const dyn_array<rooted_value>& args,
        rvalue proc);
rooted_value call_with_proc(rvalue recv,
        const string& method,
        const dyn_array<rooted_value>& args,
        rvalue proc);

}

#endif
