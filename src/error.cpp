#include "error.hpp"

#include "values.hpp"

#include <deque>
#include <mutex>

namespace garnet {

// Build "Class: message" for an exception object. This runs Ruby code (the
// exception's #message), so it must not raise itself.
static string describe_exception(rvalue exc) {
    string res = vclass_name(exc);
    rid message_id;
    string msg;
    if (protect_intern(message_id, "message").ok()) {
        auto s = protect_funcall(exc, message_id, 0, nullptr);
        if (s.ok() && vget_string(msg, s.value)) {
            return res + ": " + msg;
        }
    }
    // #message is broken, fall back on inspect
    auto s = protect_inspect(exc);
    if (s.ok() && vget_string(msg, s.value)) {
        return res + ": " + msg;
    }
    return res;
}

ruby_exception::ruby_exception(rvalue exception)
    : garnet_exception{"ruby", describe_exception(exception)}
    , exc{exception} {
}

rvalue ruby_exception::exception() const {
    return exc.get();
}

ruby_jump::ruby_jump(int tag)
    : garnet_exception{"ruby",
        "Non-local exit (jump tag " + std::to_string(tag) + ")"}
    , tag{tag} {
}

iter_break::iter_break()
    : garnet_exception{"dispatch", "break"}
    , result{std::nullopt} {
}

iter_break::iter_break(rvalue value)
    : garnet_exception{"dispatch", "break with value"}
    , result{rooted_value{value}} {
}

bool iter_break::has_value() const {
    return result.has_value();
}

rvalue iter_break::value() const {
    return result.has_value() ? result->get() : RV_NIL;
}

rvalue check_status(const call_status& status) {
    switch (status.kind) {
    case status_success:
        break;
    case status_exception:
        raise_error(ruby_exception{status.value});
    case status_jump:
        raise_error(ruby_jump{status.tag});
    }
    return status.value;
}

static std::mutex history_mtx;
static std::deque<string> history;

void record_error(const string& description) {
    std::lock_guard<std::mutex> lock{history_mtx};
    history.push_back(description);
    while (history.size() > max_error_history) {
        history.pop_front();
    }
}

dyn_array<string> error_history() {
    std::lock_guard<std::mutex> lock{history_mtx};
    return dyn_array<string>{history.begin(), history.end()};
}

optional<string> last_error() {
    std::lock_guard<std::mutex> lock{history_mtx};
    if (history.empty()) {
        return std::nullopt;
    }
    return history.back();
}

void clear_error_history() {
    std::lock_guard<std::mutex> lock{history_mtx};
    history.clear();
}

}
