#include "base.hpp"
#include "config.hpp"
#include "error.hpp"
#include "executor.hpp"
#include "ffi/protect.hpp"
#include "runtime.hpp"
#include "values.hpp"

#include <iostream>

using namespace garnet;

void show_usage() {
    std::cout <<
        "Usage: garnet [options] [PATH]\n"
        "Description:\n"
        "  Run Ruby code on a dedicated runtime thread and print the result.\n"
        "  garnet " GARNET_VERSION "\n"
        "Options/Arguments:\n"
        "  -h            Show this help message and exit.\n"
        "  -e code       Evaluate code instead of loading a file.\n"
        "  -I dir        Add a directory to $LOAD_PATH. Can occur multiple times.\n"
        "  -v            Run with $VERBOSE set to true.\n"
        "  PATH          Ruby file to load.\n"
        "Load path directories are also taken from GARNET_LOAD_PATH\n"
        "(colon-separated). GARNET_VERBOSE=1 is the same as -v.\n"
        ;
}

struct runner_options {
    // Ruby source file to load
    string src = "";
    // code given with -e. Takes the place of src.
    optional<string> code;
    // if true, show help and exit
    bool help = false;
    bool verbose = false;
    // extra $LOAD_PATH directories
    dyn_array<string> include;

    // if true, the argument list was malformed and the other fields are not
    // guaranteed to be properly initialized
    bool err = false;
    string message = "";
};

// fill in a runner_options object from the command line. Malformed arguments
// set opt->err.
void process_args(int argc, char** argv, runner_options* opt) {
    for (int i = 1; i < argc; ++i) {
        string s{argv[i]};
        if (s[0] == '-') {
            switch(s[1]) {
            case 'h':
                opt->help = true;
                if (s[2] != '\0') {
                    opt->err = true;
                    opt->message = "Unrecognized option: " + s;
                }
                // no sense doing further processing at this point
                return;
            case 'v':
                opt->verbose = true;
                if (s[2] != '\0') {
                    opt->err = true;
                    opt->message = "Unrecognized option: " + s;
                    return;
                }
                break;
            case 'e':
                if (opt->code.has_value() || opt->src != "") {
                    opt->err = true;
                    opt->message = "Multiple programs provided.";
                    return;
                }
                // can have -e code or -ecode syntax
                if (s[2] == '\0') {
                    if (i == argc - 1) {
                        opt->err = true;
                        opt->message = "Option -e requires an argument.";
                        return;
                    }
                    opt->code = string{argv[++i]};
                } else {
                    opt->code = s.substr(2);
                }
                break;
            case 'I':
                if (s[2] == '\0') {
                    if (i == argc - 1) {
                        opt->err = true;
                        opt->message = "Option -I requires an argument.";
                        return;
                    }
                    opt->include.push_back(argv[++i]);
                } else {
                    opt->include.push_back(s.substr(2));
                }
                break;
            default:
                opt->err = true;
                opt->message = "Unrecognized option: " + s;
                return;
            }
        } else {
            // filename
            if (opt->code.has_value() || opt->src != "") {
                opt->err = true;
                opt->message = "Multiple programs provided.";
                return;
            }
            opt->src = s;
        }
    }
    if (!opt->code.has_value() && opt->src == "") {
        opt->err = true;
        opt->message = "No program provided.";
    }
}

// Runs on the executor thread. Returns the inspected result.
static string run_program(const runner_options& opt) {
    if (!setup()) {
        // the executor's own setup hook normally got here first
        get_logger()->log_info("runtime", "Ruby was already set up.");
    }
    rooted_value res;
    if (opt.code.has_value()) {
        res = eval(*opt.code);
    } else {
        load(opt.src);
    }
    string out;
    if (!vget_string(out, check_status(protect_inspect(res.get())))) {
        out = "#<" + vclass_name(res.get()) + ">";
    }
    return out;
}

int main(int argc, char** argv) {
    runner_options opt;
    process_args(argc, argv, &opt);
    if (opt.help) {
        show_usage();
        return 0;
    } else if (opt.err) {
        std::cout << "Error processing command line arguments:\n  "
                  << opt.message << '\n';
        return -1;
    }

    auto ropts = runtime_options_from_env();
    ropts.load_paths.insert(ropts.load_paths.begin(),
            opt.include.begin(), opt.include.end());
    ropts.verbose = ropts.verbose || opt.verbose;
    configure(ropts);

    serial_executor exec{"garnet-ruby"};
    auto result = exec.submit([&opt] {
        try {
            return run_program(opt);
        } catch (const ruby_exception& e) {
            // The exception object can't leave the Ruby thread, so send back a
            // description only.
            throw garnet_exception{e.subsystem, e.message};
        }
    });

    int rc = 0;
    try {
        std::cout << result.get() << '\n';
    } catch (const garnet_exception& e) {
        std::cout << "Error: " << e.message << '\n';
        rc = -1;
    } catch (const std::exception& e) {
        std::cout << "Error: " << e.what() << '\n';
        rc = -1;
    }
    exec.stop();
    return rc;
}
