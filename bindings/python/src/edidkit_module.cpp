// edidkit Python Bindings
// Main module entry point - includes component bindings

#include <nanobind/nanobind.h>

// Binding components
#include "core_bindings.hpp"
#include "error_bindings.hpp"
#include "record_bindings.hpp"

namespace nb = nanobind;

// Define the exception type pointers (declared extern in py_types.hpp)
namespace edidkit_python {
PyObject* decode_error_type = nullptr;
PyObject* io_error_type = nullptr;
} // namespace edidkit_python

NB_MODULE(edidkit, m) {
    m.doc() = "edidkit - EDID 1.4 base block decoder";

    // Bind components in dependency order:
    // 1. Value types and enums - no dependencies
    edidkit_python::bind_core(m);

    // 2. Error types (sets decode_error_type, io_error_type)
    edidkit_python::bind_errors(m);

    // 3. Descriptors, DisplayRecord and decode() - needs value types and both error types
    edidkit_python::bind_record(m);
}
