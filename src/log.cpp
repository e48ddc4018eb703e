#include "log.hpp"

#include <atomic>

namespace garnet {

logger::logger(std::ostream* err_out, std::ostream* info_out)
    : err_out{err_out}
    , info_out{info_out} {
}

void logger::log_error(const string& subsystem, const string& message) {
    if (err_out == nullptr) {
        return;
    }
    std::lock_guard<std::mutex> lock{mtx};
    (*err_out) << "[ERROR] " << subsystem << ":\n\t"
               << message << '\n';
}

void logger::log_warning(const string& subsystem, const string& message) {
    if (err_out == nullptr) {
        return;
    }
    std::lock_guard<std::mutex> lock{mtx};
    (*err_out) << "[WARNING] " << subsystem << ":\n\t"
               << message << '\n';
}

void logger::log_info(const string& subsystem, const string& message) {
    if (info_out == nullptr) {
        return;
    }
    std::lock_guard<std::mutex> lock{mtx};
    (*info_out) << "[INFO] " << subsystem << ":\n\t"
                << message << '\n';
}

static logger* default_logger() {
#ifdef GARNET_DEBUG
    static logger log{&std::cerr, &std::cerr};
#else
    static logger log{&std::cerr, nullptr};
#endif
    return &log;
}

static std::atomic<logger*> current_logger{nullptr};

logger* get_logger() {
    auto res = current_logger.load();
    return res == nullptr ? default_logger() : res;
}

void set_logger(logger* log) {
    current_logger.store(log);
}

}
