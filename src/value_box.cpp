#include "value_box.hpp"

#include "log.hpp"
#include "values.hpp"

#include <ruby.h>

#include <cstdlib>

namespace garnet {

// Registration uses Ruby's global address list, which is a singly-linked list.
// That's fine for the number of host-held values we expect. If it ever shows
// up in profiles, the alternative is a single registered holder object marking
// all the boxes itself.
static gc_root_hooks root_hooks = {
    rb_gc_register_address,
    rb_gc_unregister_address
};

gc_root_hooks default_gc_root_hooks() {
    return gc_root_hooks{rb_gc_register_address, rb_gc_unregister_address};
}

void set_gc_root_hooks(const gc_root_hooks& hooks) {
    root_hooks = hooks;
}

value_box* box_alloc(rvalue v) {
    auto box = (value_box*)malloc(sizeof(value_box));
    if (box == nullptr) {
        get_logger()->log_error("box", "Out of memory allocating a value box.");
        abort();
    }
    box->value = v;
    box->registered = false;

    // Registering a special constant would be harmless to the collector, but
    // boxes of nil/true/false get made before Ruby is set up and after it's
    // cleaned up, and then we mustn't call into the GC at all. So test first.
    if (!vis_special_const(v)) {
        root_hooks.register_address(&box->value);
        box->registered = true;
    }
    return box;
}

value_box* box_dup(const value_box* box) {
    return box_alloc(box->value);
}

void box_free(value_box* box) {
    if (box->registered) {
        root_hooks.unregister_address(&box->value);
        box->registered = false;
    }
    box->value = RV_UNDEF;
    free(box);
}


rooted_value::rooted_value()
    : box{box_alloc(RV_NIL)} {
}

rooted_value::rooted_value(rvalue v)
    : box{box_alloc(v)} {
}

rooted_value::rooted_value(const rooted_value& other)
    : box{other.box == nullptr ? nullptr : box_dup(other.box)} {
}

rooted_value::rooted_value(rooted_value&& other) noexcept
    : box{other.box} {
    other.box = nullptr;
}

rooted_value::~rooted_value() {
    if (box != nullptr) {
        box_free(box);
    }
}

rooted_value& rooted_value::operator=(const rooted_value& other) {
    if (this != &other) {
        auto tmp = other.box == nullptr ? nullptr : box_dup(other.box);
        if (box != nullptr) {
            box_free(box);
        }
        box = tmp;
    }
    return *this;
}

rooted_value& rooted_value::operator=(rooted_value&& other) noexcept {
    if (this != &other) {
        if (box != nullptr) {
            box_free(box);
        }
        box = other.box;
        other.box = nullptr;
    }
    return *this;
}

rvalue rooted_value::get() const {
    return box == nullptr ? RV_UNDEF : box->value;
}

bool rooted_value::has_box() const {
    return box != nullptr;
}

bool rooted_value::is_registered() const {
    return box != nullptr && box->registered;
}

void rooted_value::reset(rvalue v) {
    // register the new value before letting go of the old one
    auto tmp = box_alloc(v);
    if (box != nullptr) {
        box_free(box);
    }
    box = tmp;
}

}
