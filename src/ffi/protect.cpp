#include "ffi/protect.hpp"

#include "ffi/dispatch.hpp"
#include "values.hpp"

#include <ruby.h>

#include <type_traits>

// The protected flow goes:
//
//   caller -> rb_protect                 // Ruby does setjmp()
//       protect_thunk <- rb_protect      // Ruby calls back into us
//           protect_thunk -> rb_xxx      // the call that may raise
//           protect_thunk <- rb_xxx
//       protect_thunk -> rb_protect
//   caller <- rb_protect
//
// and when rb_xxx raises, Ruby longjmp()s straight from inside rb_xxx back to
// rb_protect, skipping the rest of protect_thunk. That's why protect_thunk is
// the only code that runs inside the protected region and why it touches
// nothing but the protect_data record.

namespace garnet {

enum protect_job {
    job_load,
    job_require,
    job_eval,
    job_intern,
    job_const_get,
    job_const_get_at,
    job_const_set,
    job_cvar_get,
    job_inspect,
    job_to_s,
    job_exc_new,
    job_str_new,
    job_gv_get,
    job_gv_set,
    job_funcall,
    job_block_call,
    job_block_call_value,
    job_proc_call,
    job_yield,
    job_to_long,
    job_to_ulong,
    job_to_double
};

// Arguments and out-parameters for a single protected job. This lives in the
// caller's frame, outside the protected region.
struct protect_data {
    protect_job job;

    rvalue value;
    rid id;
    // second value argument: constant value, block argument, Proc block
    rvalue arg;
    bool wrap;
    // file name, code, identifier or message
    const char* str;
    int argc;
    const rvalue* argv;
    void* context;

    rid id_result;
    long long_result;
    unsigned long ulong_result;
    f64 double_result;
};

// anything with a destructor here would be skipped on a raise
static_assert(std::is_trivially_destructible<protect_data>::value,
        "protect_data must be safe to abandon");

static bool numeric_ish(VALUE v) {
    return NIL_P(v)
        || FIXNUM_P(v)
        || RB_FLOAT_TYPE_P(v)
        || RB_TYPE_P(v, T_BIGNUM);
}

// Ruby will happily convert -1 to ULONG_MAX. We'd rather raise.
static unsigned long obj2ulong(VALUE v) {
    // drill down to something we can compare to zero
    while (!numeric_ish(v)) {
        v = rb_Integer(v);
    }

    bool negative = false;
    if (FIXNUM_P(v)) {
        negative = FIX2LONG(v) < 0;
    } else if (RB_FLOAT_TYPE_P(v)) {
        negative = NUM2DBL(v) < 0;
    } else if (RB_TYPE_P(v, T_BIGNUM)) {
        negative = RBIGNUM_NEGATIVE_P(v);
    }
    if (negative) {
        rb_raise(rb_eTypeError,
                "Value is negative and cannot be expressed as unsigned.");
    }
    return rb_num2ulong(v);
}

// Callback made by Ruby from rb_protect. OK to raise from here.
static VALUE protect_thunk(VALUE arg) {
    auto d = (protect_data*)arg;
    VALUE rc = Qnil;

    switch (d->job) {
    case job_load:
        rb_load(rb_str_new_cstr(d->str), d->wrap ? 1 : 0);
        break;
    case job_require:
        rc = rb_require(d->str);
        break;
    case job_eval:
        rc = rb_eval_string(d->str);
        break;
    case job_intern:
        d->id_result = rb_intern(d->str);
        break;
    case job_const_get:
        rc = rb_const_get(d->value, d->id);
        break;
    case job_const_get_at:
        rc = rb_const_get_at(d->value, d->id);
        break;
    case job_const_set:
        rb_const_set(d->value, d->id, d->arg);
        rc = d->arg;
        break;
    case job_cvar_get:
        rc = rb_cvar_get(d->value, d->id);
        break;
    case job_inspect:
        rc = rb_inspect(d->value);
        break;
    case job_to_s:
        rc = rb_String(d->value);
        break;
    case job_exc_new:
        rc = rb_exc_new_cstr(d->value, d->str);
        break;
    case job_str_new:
        rc = rb_str_new_cstr(d->str);
        break;
    case job_gv_get:
        rc = rb_gv_get(d->str);
        break;
    case job_gv_set:
        rc = rb_gv_set(d->str, d->arg);
        break;
    case job_funcall:
        rc = rb_funcallv(d->value, d->id, d->argc, d->argv);
        break;
    case job_block_call:
        rc = rb_block_call(d->value, d->id, d->argc, d->argv,
                pvoid_block_thunk, (VALUE)d->context);
        break;
    case job_block_call_value:
        rc = rb_block_call(d->value, d->id, d->argc, d->argv,
                value_block_thunk, d->arg);
        break;
    case job_proc_call:
        rc = rb_proc_call_with_block(d->value, d->argc, d->argv, d->arg);
        break;
    case job_yield:
        rc = rb_yield_values2(d->argc, d->argv);
        break;
    case job_to_long:
        d->long_result = NUM2LONG(rb_Integer(d->value));
        break;
    case job_to_ulong:
        d->ulong_result = obj2ulong(d->value);
        break;
    case job_to_double:
        d->double_result = NUM2DBL(rb_Float(d->value));
        break;
    }
    return rc;
}

// Run the job and classify what happened.
static call_status run_protected(protect_data* data) {
    int state = 0;
    VALUE rc = rb_protect(protect_thunk, (VALUE)data, &state);
    if (state == 0) {
        return call_status{status_success, rc, 0};
    }

    VALUE err = rb_errinfo();
    if (vis_exception(err)) {
        // Ownership of the exception passes to the caller. Leaving it in
        // errinfo would make Ruby think it's still being raised.
        rb_set_errinfo(Qnil);
        return call_status{status_exception, err, state};
    }
    // throw/break/etc. Leave errinfo alone; rb_jump_tag() needs it to continue
    // the jump.
    return call_status{status_jump, err, state};
}

static protect_data make_data(protect_job job) {
    protect_data d = {};
    d.job = job;
    d.value = Qnil;
    d.arg = Qnil;
    return d;
}

static VALUE scope_or_object(rvalue scope) {
    return NIL_P(scope) ? rb_cObject : scope;
}

call_status protect_funcall(rvalue recv, rid mid, int argc, const rvalue* argv) {
    auto d = make_data(job_funcall);
    d.value = recv;
    d.id = mid;
    d.argc = argc;
    d.argv = argv;
    return run_protected(&d);
}

// rb_load_protect() exists but only protects the file lookup, not exceptions
// raised by the code being loaded.
call_status protect_load(const char* filename, bool wrap) {
    auto d = make_data(job_load);
    d.str = filename;
    d.wrap = wrap;
    return run_protected(&d);
}

call_status protect_require(const char* name) {
    auto d = make_data(job_require);
    d.str = name;
    return run_protected(&d);
}

call_status protect_eval(const char* code) {
    auto d = make_data(job_eval);
    d.str = code;
    return run_protected(&d);
}

call_status protect_intern(rid& out, const char* name) {
    auto d = make_data(job_intern);
    d.str = name;
    auto res = run_protected(&d);
    if (res.ok()) {
        out = d.id_result;
    }
    return res;
}

call_status protect_const_get(rvalue scope, rid id) {
    auto d = make_data(job_const_get);
    d.value = scope_or_object(scope);
    d.id = id;
    return run_protected(&d);
}

call_status protect_const_get_at(rvalue scope, rid id) {
    auto d = make_data(job_const_get_at);
    d.value = scope_or_object(scope);
    d.id = id;
    return run_protected(&d);
}

call_status protect_const_set(rvalue scope, rid id, rvalue v) {
    auto d = make_data(job_const_set);
    d.value = scope_or_object(scope);
    d.id = id;
    d.arg = v;
    return run_protected(&d);
}

call_status protect_cvar_get(rvalue klass, rid id) {
    auto d = make_data(job_cvar_get);
    d.value = klass;
    d.id = id;
    return run_protected(&d);
}

call_status protect_inspect(rvalue v) {
    auto d = make_data(job_inspect);
    d.value = v;
    return run_protected(&d);
}

call_status protect_to_s(rvalue v) {
    auto d = make_data(job_to_s);
    d.value = v;
    return run_protected(&d);
}

call_status protect_exc_new(rvalue klass, const char* message) {
    auto d = make_data(job_exc_new);
    d.value = klass;
    d.str = message;
    return run_protected(&d);
}

call_status protect_str_new(const char* str) {
    auto d = make_data(job_str_new);
    d.str = str;
    return run_protected(&d);
}

call_status protect_gv_get(const char* name) {
    auto d = make_data(job_gv_get);
    d.str = name;
    return run_protected(&d);
}

call_status protect_gv_set(const char* name, rvalue v) {
    auto d = make_data(job_gv_set);
    d.str = name;
    d.arg = v;
    return run_protected(&d);
}

call_status protect_block_call(rvalue recv, rid mid, int argc,
        const rvalue* argv, void* context) {
    auto d = make_data(job_block_call);
    d.value = recv;
    d.id = mid;
    d.argc = argc;
    d.argv = argv;
    d.context = context;
    return run_protected(&d);
}

call_status protect_block_call_value(rvalue recv, rid mid, int argc,
        const rvalue* argv, rvalue proc) {
    auto d = make_data(job_block_call_value);
    d.value = recv;
    d.id = mid;
    d.argc = argc;
    d.argv = argv;
    d.arg = proc;
    return run_protected(&d);
}

call_status protect_proc_call(rvalue proc, int argc, const rvalue* argv,
        rvalue block_arg) {
    auto d = make_data(job_proc_call);
    d.value = proc;
    d.argc = argc;
    d.argv = argv;
    d.arg = block_arg;
    return run_protected(&d);
}

call_status protect_yield(int argc, const rvalue* argv) {
    auto d = make_data(job_yield);
    d.argc = argc;
    d.argv = argv;
    return run_protected(&d);
}

call_status protect_to_long(long& out, rvalue v) {
    auto d = make_data(job_to_long);
    d.value = v;
    auto res = run_protected(&d);
    if (res.ok()) {
        out = d.long_result;
    }
    return res;
}

call_status protect_to_ulong(unsigned long& out, rvalue v) {
    auto d = make_data(job_to_ulong);
    d.value = v;
    auto res = run_protected(&d);
    if (res.ok()) {
        out = d.ulong_result;
    }
    return res;
}

call_status protect_to_double(f64& out, rvalue v) {
    auto d = make_data(job_to_double);
    d.value = v;
    auto res = run_protected(&d);
    if (res.ok()) {
        out = d.double_result;
    }
    return res;
}

}
