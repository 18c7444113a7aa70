#pragma once
// Shared helpers for edidkit bindings

#include <nanobind/nanobind.h>

#include <edidkit.hpp>

#include <sstream>
#include <stdexcept>
#include <string>

namespace nb = nanobind;

namespace edidkit_python {

// Exception type pointers (set during module init)
extern PyObject* decode_error_type;
extern PyObject* io_error_type;

// C++ types the Python exceptions are registered against; never thrown, so
// unrelated std::runtime_error exceptions keep nanobind's default mapping
class DecodeFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class IOFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Raise edidkit.DecodeError from a failed decode
 *
 * Message format: "<message> at byte <offset> (<context>)"
 */
[[noreturn]] inline void raise_decode_error(const edidkit::DecodeError& err) {
    std::ostringstream oss;
    oss << err.message() << " at byte " << err.offset << " (" << err.context << ")";
    PyErr_SetString(decode_error_type, oss.str().c_str());
    throw nb::python_error();
}

/// Unwrap a decode result or raise DecodeError
inline edidkit::DisplayRecord unwrap(edidkit::DecodeResult<edidkit::DisplayRecord> result) {
    if (!result.has_value()) {
        raise_decode_error(result.error());
    }
    return *std::move(result);
}

} // namespace edidkit_python
