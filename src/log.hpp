#ifndef __GARNET_LOG_HPP
#define __GARNET_LOG_HPP

#include "base.hpp"

#include <mutex>

namespace garnet {

class logger {
private:
    std::ostream* err_out;
    std::ostream* info_out;
    // the executor thread and host threads log concurrently
    std::mutex mtx;

public:
    // info_out and err_out must be externally managed and ensured to outlive
    // the logger. They may be null, in which case messages are simply ignored.
    logger(std::ostream* err_out, std::ostream* info_out);

    // an error goes to err_out and indicates a stoppage of control flow
    void log_error(const string& subsystem, const string& message);
    // a warning goes to err_out but is not considered fatal
    void log_warning(const string& subsystem, const string& message);
    // info messages are logged to info_out
    void log_info(const string& subsystem, const string& message);
};

// The process-wide logger used by the embedding layer. By default errors and
// warnings go to std::cerr and info messages are discarded (unless built with
// GARNET_DEBUG). The pointer passed to set_logger() must outlive all use of
// garnet; passing nullptr restores the default.
logger* get_logger();
void set_logger(logger* log);

}


#endif
