#include "runtime.hpp"

#include "block.hpp"
#include "config.hpp"
#include "error.hpp"
#include "ffi/protect.hpp"
#include "log.hpp"
#include "values.hpp"

#include <ruby.h>
#include <ruby/version.h>

#include <mutex>
#include <unordered_map>

namespace garnet {

struct runtime_data {
    vm_state state = vm_unknown;
    // description of the setup failure in state vm_setup_error
    string setup_message;
    std::unordered_map<string, rid> id_cache;
    // recursive because interning can run Ruby code (finalizers, ...) which
    // could come back here
    std::recursive_mutex mtx;
};

static runtime_data& rt() {
    static runtime_data data;
    return data;
}

static bool ruby_started_elsewhere() {
    // rb_mKernel is one of the first things made by ruby_setup()
    return rb_mKernel != 0;
}

// Push the configured directories on $LOAD_PATH and set $VERBOSE.
static void apply_options(const runtime_options& opts) {
    auto load_path = check_status(protect_gv_get("$LOAD_PATH"));
    rid unshift_id;
    check_status(protect_intern(unshift_id, "unshift"));
    // unshift in reverse so the first path ends up first
    for (auto it = opts.load_paths.rbegin(); it != opts.load_paths.rend(); ++it) {
        auto dir = check_status(protect_str_new(it->c_str()));
        check_status(protect_funcall(load_path, unshift_id, 1, &dir));
    }
    if (opts.verbose) {
        check_status(protect_gv_set("$VERBOSE", RV_TRUE));
    }
}

static void do_setup() {
    if (ruby_started_elsewhere()) {
        raise_error(setup_error{
                "Ruby has already been set up (via the C API?) in this process."});
    }

    // Records the base of this thread's stack for the collector. Ruby 3.4
    // stopped doing this inside ruby_setup().
    RUBY_INIT_STACK;

    int rc = ruby_setup();
    if (rc != 0) {
        raise_error(setup_error{
                "ruby_setup() failed with status " + std::to_string(rc)});
    }

    // ruby_options() fills in the default load path and loads rubygems. The
    // empty -e script stops it from reading a program from stdin.
    auto opts = current_options();
    string arg0 = opts.program_name;
    string arg1 = "-e ";
    char* argv[] = {arg0.data(), arg1.data()};
    auto node = ruby_options(2, argv);

    // node is the compiled empty program. A non-program here is an exit
    // request or error from option processing.
    int exit_status = 0;
    int node_status = ruby_executable_node(node, &exit_status);
    if (node_status != 1 || exit_status != 0) {
        ruby_cleanup(0);
        raise_error(setup_error{"ruby_executable_node() gave node status "
                + std::to_string(node_status) + ", exit status "
                + std::to_string(exit_status)});
    }

    install_block_dispatch();
    apply_options(opts);
}

bool setup() {
    auto& r = rt();
    std::lock_guard<std::recursive_mutex> lock{r.mtx};
    switch (r.state) {
    case vm_setup_error:
        raise_error(setup_error{r.setup_message});
    case vm_setup:
        return false;
    case vm_cleaned_up:
        raise_error(setup_error{"Ruby has already been cleaned up."});
    case vm_unknown:
        break;
    }

    try {
        do_setup();
    } catch (const garnet_exception& e) {
        r.state = vm_setup_error;
        r.setup_message = e.message;
        get_logger()->log_error("runtime", e.what());
        throw;
    }
    r.state = vm_setup;
    get_logger()->log_info("runtime", string{"Set up "} + ::ruby_description);
    return true;
}

bool soft_setup() {
    try {
        setup();
        return true;
    } catch (const garnet_exception& e) {
        get_logger()->log_warning("runtime",
                string{"Soft setup failed: "} + e.what());
        return false;
    }
}

int cleanup() {
    auto& r = rt();
    std::lock_guard<std::recursive_mutex> lock{r.mtx};
    if (r.state != vm_setup) {
        return 0;
    }
    r.state = vm_cleaned_up;
    r.id_cache.clear();
    int rc = ruby_cleanup(0);
    get_logger()->log_info("runtime",
            "Cleaned up with status " + std::to_string(rc));
    return rc;
}

vm_state runtime_state() {
    auto& r = rt();
    std::lock_guard<std::recursive_mutex> lock{r.mtx};
    return r.state;
}

rid get_id(const string& name) {
    auto& r = rt();
    std::lock_guard<std::recursive_mutex> lock{r.mtx};
    setup();
    auto it = r.id_cache.find(name);
    if (it != r.id_cache.end()) {
        return it->second;
    }
    rid res;
    check_status(protect_intern(res, name.c_str()));
    r.id_cache[name] = res;
    return res;
}

rooted_value eval(const string& code) {
    setup();
    return rooted_value{check_status(protect_eval(code.c_str()))};
}

void load(const string& filename, bool wrap) {
    setup();
    check_status(protect_load(filename.c_str(), wrap));
}

bool require(const string& name) {
    setup();
    return vtest(check_status(protect_require(name.c_str())));
}

void collect_garbage() {
    setup();
    check_status(protect_funcall(rb_mGC, get_id("start"), 0, nullptr));
}

string ruby_version() {
    return string{::ruby_version};
}

string ruby_description() {
    return string{::ruby_description};
}

}
