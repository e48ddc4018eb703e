#include "values.hpp"

#include <ruby.h>

#include <type_traits>

namespace garnet {

static_assert(std::is_same<VALUE, rvalue>::value,
        "rvalue must be the same type as Ruby's VALUE");
static_assert(std::is_same<ID, rid>::value,
        "rid must be the same type as Ruby's ID");

const rvalue RV_NIL = Qnil;
const rvalue RV_TRUE = Qtrue;
const rvalue RV_FALSE = Qfalse;
const rvalue RV_UNDEF = Qundef;

bool vis_special_const(rvalue v) {
    return RB_SPECIAL_CONST_P(v);
}

bool vtest(rvalue v) {
    return RTEST(v);
}

bool vis_exception(rvalue v) {
    // heap check first: jump records left in errinfo are T_IMEMO, not objects
    if (RB_SPECIAL_CONST_P(v) || !RB_TYPE_P(v, T_OBJECT)) {
        return false;
    }
    return RTEST(rb_obj_is_kind_of(v, rb_eException));
}

bool vis_proc(rvalue v) {
    return RTEST(rb_obj_is_proc(v));
}

rvalue vbox_long(long v) {
    return LONG2NUM(v);
}

rvalue vbox_ulong(unsigned long v) {
    return ULONG2NUM(v);
}

rvalue vbox_double(f64 v) {
    return DBL2NUM(v);
}

string vclass_name(rvalue v) {
    if (v == Qundef) {
        return "<undef>";
    }
    return string{rb_obj_classname(v)};
}

bool vget_string(string& out, rvalue v) {
    if (!RB_TYPE_P(v, T_STRING)) {
        return false;
    }
    out.assign(RSTRING_PTR(v), RSTRING_LEN(v));
    return true;
}

}
