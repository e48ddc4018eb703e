// runtime.hpp -- lifecycle of the process-wide Ruby runtime

#ifndef __GARNET_RUNTIME_HPP
#define __GARNET_RUNTIME_HPP

#include "base.hpp"
#include "value_box.hpp"

namespace garnet {

// Ruby can be set up once per process and can't be restarted after cleanup.
enum vm_state {
    // setup has not been attempted
    vm_unknown,
    // setup was attempted and failed. It won't be retried.
    vm_setup_error,
    // Ruby is running
    vm_setup,
    // Ruby has been shut down
    vm_cleaned_up
};

// Set up Ruby on the calling thread, which becomes Ruby's main thread. All
// later use of Ruby must happen on this thread. Returns true if this call did
// the setup, false if Ruby was already running. Throws setup_error if Ruby
// can't be started, was started by someone else in this process, or has been
// cleaned up.
bool setup();
// Like setup(), but reports failure by logging and returning false.
bool soft_setup();
// Shut Ruby down. Only the first call after a successful setup does anything.
// Returns Ruby's exit status (0 if everything went fine).
int cleanup();
vm_state runtime_state();

// Interned ID for name. IDs are cached, so repeated lookups are cheap. Throws
// if Ruby can't be set up.
rid get_id(const string& name);

// evaluate some Ruby code at the top level and return the result
rooted_value eval(const string& code);
// load (and run) a Ruby file. With wrap, the file runs in an anonymous module.
void load(const string& filename, bool wrap = false);
// Kernel#require. Returns false if the feature was already loaded.
bool require(const string& name);
// run a full garbage collection
void collect_garbage();

// the version of the linked Ruby library, e.g. "2.5.9"
string ruby_version();
// e.g. "ruby 2.5.9p229 (2021-04-05 revision 67939) [x86_64-linux]"
string ruby_description();

}

#endif
