#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>

namespace garnet {

static std::mutex options_mtx;
static runtime_options configured;

dyn_array<string> split_path_list(const string& s) {
    dyn_array<string> res;
    size_t start = 0;
    while (start <= s.size()) {
        auto end = s.find(':', start);
        if (end == string::npos) {
            end = s.size();
        }
        if (end > start) {
            res.push_back(s.substr(start, end - start));
        }
        start = end + 1;
    }
    return res;
}

bool parse_flag(const char* s) {
    if (s == nullptr) {
        return false;
    }
    string v{s};
    std::transform(v.begin(), v.end(), v.begin(),
            [](unsigned char c) { return (char)std::tolower(c); });
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

runtime_options runtime_options_from_env() {
    runtime_options res;
    auto path = std::getenv("GARNET_LOAD_PATH");
    if (path != nullptr) {
        res.load_paths = split_path_list(path);
    }
    res.verbose = parse_flag(std::getenv("GARNET_VERBOSE"));
    return res;
}

void configure(const runtime_options& opts) {
    std::lock_guard<std::mutex> lock{options_mtx};
    configured = opts;
}

runtime_options current_options() {
    std::lock_guard<std::mutex> lock{options_mtx};
    return configured;
}

}
