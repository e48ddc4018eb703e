// base.hpp -- common types and error handling code for garnet

#ifndef __GARNET_BASE_HPP
#define __GARNET_BASE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <sstream>
#include <string>
#include <vector>
#include <iostream>

namespace garnet {

/// aliases imported from std
template<class T> using optional = std::optional<T>;
template<class T> using dyn_array = std::vector<T>;
using string = std::string;

template<class T> using shared_ptr = std::shared_ptr<T>;

/// integer/float typedefs by bitwidth
typedef uint8_t u8;
typedef uint16_t u16;
typedef uint32_t u32;
typedef uint64_t u64;

typedef int8_t i8;
typedef int16_t i16;
typedef int32_t i32;
typedef int64_t i64;

typedef double f64;

// Ruby stores every value and every interned identifier in a single pointer
// sized word. These are the host spellings of VALUE and ID. They are the same
// type as the Ruby typedefs (checked in values.cpp), so no ruby header is needed
// to pass them around.
typedef uintptr_t rvalue;
typedef uintptr_t rid;

// we rely on VALUE fitting in 64 bits when boxing numbers
static_assert(sizeof(rvalue) == 8);

// Base class for exceptions thrown by garnet into host code. These never cross
// a Ruby stack frame; the block dispatcher converts them before returning to
// Ruby.
class garnet_exception : public std::exception {
    // formatted message. Kept as a member so the pointer returned by what()
    // lives as long as the exception.
    string formatted;

public:
    const string subsystem;
    const string message;

    garnet_exception(const string& subsystem, const string& message)
        : subsystem{subsystem}
        , message{message} {
        std::ostringstream ss;
        ss << "[" << subsystem << "] " << message;
        formatted = ss.str();
    }

    const char* what() const noexcept override {
        return formatted.c_str();
    }
};

// Thrown when the Ruby runtime cannot be set up, or is used after cleanup.
class setup_error : public garnet_exception {
public:
    explicit setup_error(const string& message)
        : garnet_exception{"runtime", message} {
    }
};

}

#endif
