// value_box.hpp -- keep Ruby values visible to the garbage collector

#ifndef __GARNET_VALUE_BOX_HPP
#define __GARNET_VALUE_BOX_HPP

#include "base.hpp"

namespace garnet {

// Ruby's collector finds live values by scanning its own native stack and the
// addresses registered with rb_gc_register_address(). A value stored anywhere
// else (a host object, a closure capture, a container) is invisible to it. A
// value_box is a fixed heap address holding exactly one value. Heap values get
// that address registered as a GC root for the lifetime of the box, so the
// value is kept alive no matter what the native stack looks like.
struct value_box {
    // the value being held. Set to RV_UNDEF when the box is released.
    rvalue value;
    // whether &value is currently registered with the collector
    bool registered;
};

// The collector's root registration primitives. These are reached through a
// table so that tests can observe every registration.
struct gc_root_hooks {
    void (*register_address)(rvalue* addr);
    void (*unregister_address)(rvalue* addr);
};

// rb_gc_register_address() and rb_gc_unregister_address()
gc_root_hooks default_gc_root_hooks();
// Replace the hooks. Must not be called while any registered box is alive.
void set_gc_root_hooks(const gc_root_hooks& hooks);

// Allocate a box holding v. If v is a heap value, the box's address is
// registered as a root; immediate values are never registered (Ruby may not
// even be initialized). Out of memory here calls abort(): there is no safe way
// to report a half-made box.
value_box* box_alloc(rvalue v);
// Make a new, independently registered box holding the same value.
value_box* box_dup(const value_box* box);
// Unregister (if registered), set the value to RV_UNDEF and free the box. Each
// box must be freed exactly once.
void box_free(value_box* box);

// rooted_value owns a single value_box. Copies get their own box (and their own
// registration); moving transfers the box. A moved-from rooted_value holds
// nothing and reads as RV_UNDEF.
class rooted_value {
private:
    value_box* box;

public:
    // holds nil
    rooted_value();
    explicit rooted_value(rvalue v);
    rooted_value(const rooted_value& other);
    rooted_value(rooted_value&& other) noexcept;
    ~rooted_value();

    rooted_value& operator=(const rooted_value& other);
    rooted_value& operator=(rooted_value&& other) noexcept;

    rvalue get() const;
    // true if this rooted_value has a box (i.e. was not moved from)
    bool has_box() const;
    // true if the held value is registered as a GC root
    bool is_registered() const;
    // replace the held value, registering the new one as needed
    void reset(rvalue v);
};

}

#endif
