#pragma once
// Error bindings: DecodeErrorCode, DecodeError exception

#include <nanobind/nanobind.h>

#include <edidkit/types.hpp>

#include "py_types.hpp"

#include <stdexcept>
#include <string>

namespace nb = nanobind;
using namespace nb::literals;

namespace edidkit_python {

inline void bind_errors(nb::module_& m) {
    // =========================================================================
    // DecodeErrorCode enum
    // =========================================================================

    nb::enum_<edidkit::DecodeErrorCode>(m, "DecodeErrorCode",
                                        "Reason a base block decode was aborted")
        .value("header_invalid", edidkit::DecodeErrorCode::header_invalid,
               "First 8 bytes are not the fixed header pattern")
        .value("unexpected_end_of_data", edidkit::DecodeErrorCode::unexpected_end_of_data,
               "Input ended before the block was complete")
        .value("missing_preferred_timing", edidkit::DecodeErrorCode::missing_preferred_timing,
               "First detailed slot does not hold a timing")
        .value("malformed_timing_geometry", edidkit::DecodeErrorCode::malformed_timing_geometry,
               "Blanking shorter than front porch plus sync width")
        .value("malformed_descriptor", edidkit::DecodeErrorCode::malformed_descriptor,
               "Descriptor terminator, padding or guard byte mismatch")
        .value("source_failure", edidkit::DecodeErrorCode::source_failure,
               "Underlying read failed")
        .def("__str__", [](edidkit::DecodeErrorCode c) {
            return std::string(edidkit::decode_error_string(c));
        });

    // =========================================================================
    // Custom Exceptions
    // =========================================================================

    // DecodeError - malformed or truncated EDID data
    auto decode_error = nb::exception<DecodeFailure>(m, "DecodeError", PyExc_ValueError);
    decode_error_type = decode_error.ptr();

    // EDIDIOError - file could not be opened
    auto io_error = nb::exception<IOFailure>(m, "EDIDIOError", PyExc_OSError);
    io_error_type = io_error.ptr();
}

} // namespace edidkit_python
