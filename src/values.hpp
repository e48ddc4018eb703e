// values.hpp -- utility functions for working with Ruby values

#ifndef __GARNET_VALUES_HPP
#define __GARNET_VALUES_HPP

#include "base.hpp"

namespace garnet {

// special constants. These mirror Qnil, Qtrue, Qfalse and Qundef for the Ruby
// version garnet is built against.
extern const rvalue RV_NIL;
extern const rvalue RV_TRUE;
extern const rvalue RV_FALSE;
// Qundef. Never a valid Ruby object; used to mark released or moved-from
// handles.
extern const rvalue RV_UNDEF;

// type information

// true for immediate values (fixnums, flonums, static symbols, nil, true, false
// and undef). These are never collected and are safe to touch before Ruby is
// initialized.
bool vis_special_const(rvalue v);
// Ruby truthiness: everything except nil and false
bool vtest(rvalue v);
// true for instances of Exception (or a subclass)
bool vis_exception(rvalue v);
// true for instances of Proc
bool vis_proc(rvalue v);

// creating values. These allocate for out-of-range integers and non-flonum
// doubles, so Ruby must be running unless the result is known to be immediate.
rvalue vbox_long(long v);
rvalue vbox_ulong(unsigned long v);
rvalue vbox_double(f64 v);

// name of the class of a value, e.g. "String". Never raises.
string vclass_name(rvalue v);
// copy the bytes of a Ruby String. Returns false (leaving out untouched) if v is
// not a String.
bool vget_string(string& out, rvalue v);

}

#endif
