// error.hpp -- host exceptions for Ruby errors, plus a short error history

#ifndef __GARNET_ERROR_HPP
#define __GARNET_ERROR_HPP

#include "base.hpp"
#include "ffi/protect.hpp"
#include "value_box.hpp"

namespace garnet {

// A Ruby exception that escaped a protected call. The exception object is kept
// rooted for as long as this is alive, so it can be re-raised into Ruby later
// (the block dispatcher does exactly that). Must be created and destroyed on the
// Ruby thread while Ruby is running, so don't let one escape through a future.
class ruby_exception : public garnet_exception {
private:
    rooted_value exc;

public:
    explicit ruby_exception(rvalue exception);

    // the Ruby exception object
    rvalue exception() const;
};

// A non-exception non-local exit (throw, a break out of an escaped proc) that
// escaped a protected call. The jump stays pending in Ruby's errinfo; tag is
// what's needed to continue it.
class ruby_jump : public garnet_exception {
public:
    const int tag;

    explicit ruby_jump(int tag);
};

// Thrown by a host block function to terminate the Ruby iteration calling it,
// like Ruby's `break`. If a value is given, it becomes the result of the
// iterating method call.
class iter_break : public garnet_exception {
private:
    optional<rooted_value> result;

public:
    iter_break();
    explicit iter_break(rvalue value);

    bool has_value() const;
    // RV_NIL if no value was given
    rvalue value() const;
};

// Return the value of a successful call, otherwise record and throw the
// corresponding ruby_exception or ruby_jump.
rvalue check_status(const call_status& status);

// Error history. Every exception thrown by garnet is described here first, so
// code that only sees an empty result can find out what went wrong. Only the
// most recent max_error_history entries are kept, oldest first.
constexpr size_t max_error_history = 12;

void record_error(const string& description);
dyn_array<string> error_history();
// most recent entry, if any
optional<string> last_error();
void clear_error_history();

// record e in the error history, then throw it
template<class E> [[noreturn]] void raise_error(const E& e) {
    record_error(e.what());
    throw e;
}

}

#endif
