#pragma once
// Record bindings: descriptors, DisplayRecord, decode functions

#include <nanobind/nanobind.h>
#include <nanobind/stl/array.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/variant.h>
#include <nanobind/stl/vector.h>

#include <edidkit.hpp>
#include <edidkit/edidkit_io.hpp>

#include "py_types.hpp"

#include <span>
#include <stdexcept>
#include <string>

namespace nb = nanobind;
using namespace nb::literals;

namespace edidkit_python {

inline void bind_record(nb::module_& m) {
    // =========================================================================
    // Descriptors
    // =========================================================================

    nb::class_<edidkit::SerialNumberDescriptor>(m, "SerialNumberDescriptor")
        .def_ro("text", &edidkit::SerialNumberDescriptor::text);

    nb::class_<edidkit::OtherStringDescriptor>(m, "OtherStringDescriptor")
        .def_ro("text", &edidkit::OtherStringDescriptor::text);

    nb::class_<edidkit::MonitorNameDescriptor>(m, "MonitorNameDescriptor")
        .def_ro("text", &edidkit::MonitorNameDescriptor::text);

    nb::class_<edidkit::NoSecondaryTiming>(m, "NoSecondaryTiming");

    nb::class_<edidkit::GtfSecondaryTiming>(m, "GtfSecondaryTiming")
        .def_ro("start_horizontal_freq", &edidkit::GtfSecondaryTiming::start_horizontal_freq)
        .def_ro("c", &edidkit::GtfSecondaryTiming::c)
        .def_ro("m", &edidkit::GtfSecondaryTiming::m)
        .def_ro("k", &edidkit::GtfSecondaryTiming::k)
        .def_ro("j", &edidkit::GtfSecondaryTiming::j);

    nb::class_<edidkit::OpaqueSecondaryTiming>(m, "OpaqueSecondaryTiming")
        .def_ro("selector", &edidkit::OpaqueSecondaryTiming::selector)
        .def_ro("data", &edidkit::OpaqueSecondaryTiming::data);

    nb::class_<edidkit::RangeLimitsDescriptor>(m, "RangeLimitsDescriptor")
        .def_ro("min_vertical_rate", &edidkit::RangeLimitsDescriptor::min_vertical_rate)
        .def_ro("max_vertical_rate", &edidkit::RangeLimitsDescriptor::max_vertical_rate)
        .def_ro("min_horizontal_rate", &edidkit::RangeLimitsDescriptor::min_horizontal_rate)
        .def_ro("max_horizontal_rate", &edidkit::RangeLimitsDescriptor::max_horizontal_rate)
        .def_ro("max_pixel_clock", &edidkit::RangeLimitsDescriptor::max_pixel_clock)
        .def_ro("secondary_timing", &edidkit::RangeLimitsDescriptor::secondary_timing);

    nb::class_<edidkit::ManufacturerDescriptor>(m, "ManufacturerDescriptor")
        .def_ro("tag", &edidkit::ManufacturerDescriptor::tag)
        .def_ro("data", &edidkit::ManufacturerDescriptor::data);

    nb::class_<edidkit::UndefinedDescriptor>(m, "UndefinedDescriptor")
        .def_ro("tag", &edidkit::UndefinedDescriptor::tag)
        .def_ro("data", &edidkit::UndefinedDescriptor::data);

    // =========================================================================
    // DisplayRecord
    // =========================================================================

    nb::class_<edidkit::DisplayRecord>(m, "DisplayRecord", "Decoded EDID base block")
        .def_prop_ro("product", &edidkit::DisplayRecord::product)
        .def_prop_ro("version", &edidkit::DisplayRecord::version)
        .def_prop_ro("display", &edidkit::DisplayRecord::display)
        .def_prop_ro("color", &edidkit::DisplayRecord::color)
        .def_prop_ro("timings", &edidkit::DisplayRecord::timings)
        .def_prop_ro("descriptors", &edidkit::DisplayRecord::descriptors)
        .def_prop_ro("extension_count", &edidkit::DisplayRecord::extension_count)
        .def_prop_ro("monitor_name",
                     [](const edidkit::DisplayRecord& r) { return edidkit::monitor_name(r); })
        .def_prop_ro("serial_number",
                     [](const edidkit::DisplayRecord& r) {
                         return edidkit::serial_number_string(r);
                     })
        .def_prop_ro("range_limits",
                     [](const edidkit::DisplayRecord& r) { return edidkit::range_limits(r); })
        .def("__repr__", [](const edidkit::DisplayRecord& r) {
            return "DisplayRecord(manufacturer=" + r.product().manufacturer_id.pnp_id() +
                   ", name=" + edidkit::monitor_name(r).value_or("?") + ")";
        });

    // =========================================================================
    // Decode functions
    // =========================================================================

    m.def(
        "decode",
        [](nb::bytes data) {
            std::span<const uint8_t> bytes(static_cast<const uint8_t*>(data.data()),
                                           data.size());
            return unwrap(edidkit::decode(bytes));
        },
        "data"_a, "Decode a 128-byte EDID base block. Raises DecodeError on malformed input.");

    m.def(
        "decode_file",
        [](const std::string& path) {
            auto reader = [&path] {
                try {
                    return edidkit::EDIDFileReader(path);
                } catch (const std::runtime_error& e) {
                    PyErr_SetString(io_error_type, e.what());
                    throw nb::python_error();
                }
            }();
            return unwrap(reader.decode());
        },
        "path"_a,
        "Decode the base block of an EDID file (sysfs node or raw dump). Raises EDIDIOError "
        "if the file cannot be opened and DecodeError on malformed input.");
}

} // namespace edidkit_python
