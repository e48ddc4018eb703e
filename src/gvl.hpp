// gvl.hpp -- giving up and reacquiring Ruby's global VM lock

#ifndef __GARNET_GVL_HPP
#define __GARNET_GVL_HPP

#include "base.hpp"

#include <functional>

namespace garnet {

// Even with several Ruby threads, only one runs Ruby code at a time: the one
// holding the GVL. A Ruby thread that's about to do lengthy non-Ruby work can
// release it so the others make progress. Code running without the GVL must not
// touch Ruby at all, except through call_with_gvl().

// how Ruby interrupts a thread running without the GVL (e.g. on Thread#kill)
enum unblock_kind {
    // no unblocking function; the thread is interrupted when fn returns
    unblock_none,
    // RUBY_UBF_IO: signal the thread until it wakes up from blocking I/O
    unblock_io
};

// Run fn without the GVL. Must be called on a Ruby thread holding the GVL.
// Exceptions thrown by fn are rethrown here, after the GVL is reacquired.
void call_without_gvl(const std::function<void()>& fn,
        unblock_kind unblock = unblock_none);
// Same, with a custom unblocking function. unblock is called by Ruby on some
// other thread and must make fn return promptly. It must not throw.
void call_without_gvl(const std::function<void()>& fn,
        const std::function<void()>& unblock);

// From inside call_without_gvl(), take the GVL back to run fn. This can't be
// used to attach an arbitrary native thread to Ruby.
void call_with_gvl(const std::function<void()>& fn);

// true if the calling thread is known to Ruby (its main thread or one made by
// Thread.new), i.e. it's a thread where Ruby may be called
bool is_ruby_thread();

}

#endif
