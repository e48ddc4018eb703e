// config.hpp -- options for starting the Ruby runtime

#ifndef __GARNET_CONFIG_HPP
#define __GARNET_CONFIG_HPP

#include "base.hpp"

#ifndef GARNET_VERSION
#define GARNET_VERSION "0.0.0"
#endif

namespace garnet {

struct runtime_options {
    // passed to Ruby as argv[0]; shows up as $0 and in some messages
    string program_name = "garnet";
    // directories added to the front of $LOAD_PATH after setup, in order
    dyn_array<string> load_paths;
    // sets Ruby's $VERBOSE to true
    bool verbose = false;
};

// Default options adjusted from the environment:
//   GARNET_LOAD_PATH  colon-separated directories for load_paths
//   GARNET_VERBOSE    any of 1/true/yes/on turns on verbose
runtime_options runtime_options_from_env();

// Set the options used by the next runtime setup. Has no effect on a runtime
// that's already set up.
void configure(const runtime_options& opts);
// the options that setup will use
runtime_options current_options();

// split a colon-separated path list, dropping empty entries
dyn_array<string> split_path_list(const string& s);
// interpret a boolean environment setting. Unset/empty is false.
bool parse_flag(const char* s);

}

#endif
