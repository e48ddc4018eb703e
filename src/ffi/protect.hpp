// protect.hpp -- protected calls into the Ruby runtime

#ifndef __GARNET_FFI_PROTECT_HPP
#define __GARNET_FFI_PROTECT_HPP

#include "base.hpp"

namespace garnet {

// Ruby reports errors by longjmp()ing to the nearest rb_protect() (or rescue)
// frame. Any C++ frame between the throwing call and that point is abandoned
// without running destructors. Every Ruby call that can raise therefore goes
// through one of the functions below. Each one packs its arguments into a plain
// record and runs a single relay function under rb_protect(). The relay holds no
// locks, no objects with destructors and no host state, so it's safe to jump
// over. Anything needing cleanup happens in the caller after we return.

// NOTES ON SAFETY: These must only be called on the thread that owns the Ruby
// runtime, after setup and before cleanup. Argument arrays must stay valid (and
// visible to the GC) for the duration of the call.

enum status_kind {
    // the call completed; value holds the result
    status_success,
    // the call raised; value holds the exception object
    status_exception,
    // some other non-local exit (throw, a break from an escaped proc, ...)
    // escaped the call. tag holds Ruby's jump state and value its internal jump
    // record. The jump can be continued with a signal_jump dispatch signal.
    status_jump
};

struct call_status {
    status_kind kind;
    rvalue value;
    int tag;

    bool ok() const {
        return kind == status_success;
    }
};

// method call by selector
call_status protect_funcall(rvalue recv, rid mid, int argc, const rvalue* argv);
// load (and run) a Ruby source file. If wrap is true, the file is run under an
// anonymous module.
call_status protect_load(const char* filename, bool wrap);
// Kernel#require. Success value is true, or false if already loaded.
call_status protect_require(const char* name);
// evaluate a string of Ruby code at the top level
call_status protect_eval(const char* code);

// intern a name as an ID. (Can technically raise if the ID table is full.)
call_status protect_intern(rid& out, const char* name);

// look up a constant. If scope is RV_NIL, looks at the top level (Object).
// const_get searches ancestors; const_get_at only the given scope.
call_status protect_const_get(rvalue scope, rid id);
call_status protect_const_get_at(rvalue scope, rid id);
call_status protect_const_set(rvalue scope, rid id, rvalue v);
// read a class variable, e.g. @@count
call_status protect_cvar_get(rvalue klass, rid id);

// Kernel#inspect
call_status protect_inspect(rvalue v);
// Kernel#String
call_status protect_to_s(rvalue v);
// make a new exception of class klass with the given message
call_status protect_exc_new(rvalue klass, const char* message);
// make a new String from a NUL-terminated C string
call_status protect_str_new(const char* str);

// read and write global variables, e.g. "$LOAD_PATH". Assignment can run
// arbitrary hooks, and reading a virtual global runs code too.
call_status protect_gv_get(const char* name);
call_status protect_gv_set(const char* name, rvalue v);

// Call a method passing the registered host block dispatcher as its block. The
// dispatcher receives context each time Ruby yields. (See dispatch.hpp.)
call_status protect_block_call(rvalue recv, rid mid, int argc,
        const rvalue* argv, void* context);
// Call a method passing a Ruby Proc (or anything with to_proc) as its block.
// This goes through the value block dispatcher so the method is called as a
// function call (private methods are reachable), unlike
// rb_funcall_with_block().
call_status protect_block_call_value(rvalue recv, rid mid, int argc,
        const rvalue* argv, rvalue proc);
// Proc#call with an optional block argument (RV_NIL for none)
call_status protect_proc_call(rvalue proc, int argc, const rvalue* argv,
        rvalue block_arg);
// yield to the block of the currently executing Ruby method
call_status protect_yield(int argc, const rvalue* argv);

// Numeric unboxing. These go through Kernel#Integer / Kernel#Float, so strings
// and other convertible objects are accepted, and raise (RangeError,
// TypeError, ...) on values that don't fit. to_ulong also raises TypeError for
// negative values rather than wrapping them around.
call_status protect_to_long(long& out, rvalue v);
call_status protect_to_ulong(unsigned long& out, rvalue v);
call_status protect_to_double(f64& out, rvalue v);

}

#endif
