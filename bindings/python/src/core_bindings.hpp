#pragma once
// Core bindings: enums, product info, display parameters, color, timings

#include <nanobind/nanobind.h>
#include <nanobind/stl/array.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/variant.h>
#include <nanobind/stl/vector.h>

#include <edidkit.hpp>

#include <sstream>

namespace nb = nanobind;
using namespace nb::literals;

namespace edidkit_python {

inline void bind_core(nb::module_& m) {
    // =========================================================================
    // Enums
    // =========================================================================

    nb::enum_<edidkit::DisplayType>(m, "DisplayType", "Display color type")
        .value("monochrome", edidkit::DisplayType::monochrome)
        .value("rgb_color", edidkit::DisplayType::rgb_color)
        .value("other_color", edidkit::DisplayType::other_color)
        .value("undefined", edidkit::DisplayType::undefined);

    nb::enum_<edidkit::AspectRatio>(m, "AspectRatio", "Standard timing aspect ratio")
        .value("ratio_16_10", edidkit::AspectRatio::ratio_16_10)
        .value("ratio_4_3", edidkit::AspectRatio::ratio_4_3)
        .value("ratio_5_4", edidkit::AspectRatio::ratio_5_4)
        .value("ratio_16_9", edidkit::AspectRatio::ratio_16_9);

    nb::enum_<edidkit::StereoMode>(m, "StereoMode", "Detailed timing stereo mode")
        .value("none", edidkit::StereoMode::none)
        .value("field_sequential_right", edidkit::StereoMode::field_sequential_right)
        .value("field_sequential_left", edidkit::StereoMode::field_sequential_left)
        .value("interleaved_right_even", edidkit::StereoMode::interleaved_right_even)
        .value("interleaved_left_even", edidkit::StereoMode::interleaved_left_even)
        .value("interleaved_four_way", edidkit::StereoMode::interleaved_four_way)
        .value("side_by_side", edidkit::StereoMode::side_by_side);

    nb::enum_<edidkit::SyncPolarity>(m, "SyncPolarity", "Sync pulse polarity")
        .value("negative", edidkit::SyncPolarity::negative)
        .value("positive", edidkit::SyncPolarity::positive);

    nb::enum_<edidkit::EstablishedTiming>(m, "EstablishedTiming", "VESA established timings")
        .value("h720_v400_f70", edidkit::EstablishedTiming::h720_v400_f70)
        .value("h720_v400_f88", edidkit::EstablishedTiming::h720_v400_f88)
        .value("h640_v480_f60", edidkit::EstablishedTiming::h640_v480_f60)
        .value("h640_v480_f67", edidkit::EstablishedTiming::h640_v480_f67)
        .value("h640_v480_f72", edidkit::EstablishedTiming::h640_v480_f72)
        .value("h640_v480_f75", edidkit::EstablishedTiming::h640_v480_f75)
        .value("h800_v600_f56", edidkit::EstablishedTiming::h800_v600_f56)
        .value("h800_v600_f60", edidkit::EstablishedTiming::h800_v600_f60)
        .value("h800_v600_f72", edidkit::EstablishedTiming::h800_v600_f72)
        .value("h800_v600_f75", edidkit::EstablishedTiming::h800_v600_f75)
        .value("h832_v624_f75", edidkit::EstablishedTiming::h832_v624_f75)
        .value("h1024_v768_f87", edidkit::EstablishedTiming::h1024_v768_f87)
        .value("h1024_v768_f60", edidkit::EstablishedTiming::h1024_v768_f60)
        .value("h1024_v768_f70", edidkit::EstablishedTiming::h1024_v768_f70)
        .value("h1024_v768_f75", edidkit::EstablishedTiming::h1024_v768_f75)
        .value("h1280_v1024_f75", edidkit::EstablishedTiming::h1280_v1024_f75)
        .value("h1152_v870_f75", edidkit::EstablishedTiming::h1152_v870_f75)
        .def("__str__", [](edidkit::EstablishedTiming t) {
            return std::string(edidkit::established_timing_name(t));
        });

    // =========================================================================
    // Product information
    // =========================================================================

    nb::class_<edidkit::ManufacturerId>(m, "ManufacturerId", "Packed three-letter vendor code")
        .def_ro("codes", &edidkit::ManufacturerId::codes, "Raw 5-bit code units")
        .def_prop_ro("pnp_id", &edidkit::ManufacturerId::pnp_id, "Three-letter PNP id")
        .def("__str__", &edidkit::ManufacturerId::pnp_id);

    nb::class_<edidkit::ManufactureDate>(m, "ManufactureDate")
        .def_ro("week", &edidkit::ManufactureDate::week)
        .def_ro("year", &edidkit::ManufactureDate::year);

    nb::class_<edidkit::ProductInfo>(m, "ProductInfo")
        .def_ro("manufacturer_id", &edidkit::ProductInfo::manufacturer_id)
        .def_ro("product_code", &edidkit::ProductInfo::product_code)
        .def_ro("serial_number", &edidkit::ProductInfo::serial_number)
        .def_ro("manufacture_date", &edidkit::ProductInfo::manufacture_date);

    nb::class_<edidkit::SpecVersion>(m, "SpecVersion")
        .def_ro("version", &edidkit::SpecVersion::version)
        .def_ro("revision", &edidkit::SpecVersion::revision)
        .def("__str__", [](const edidkit::SpecVersion& v) {
            std::ostringstream oss;
            oss << static_cast<int>(v.version) << "." << static_cast<int>(v.revision);
            return oss.str();
        });

    // =========================================================================
    // Display parameters
    // =========================================================================

    nb::class_<edidkit::SignalLevel>(m, "SignalLevel")
        .def_ro("high", &edidkit::SignalLevel::high)
        .def_ro("low", &edidkit::SignalLevel::low);

    nb::class_<edidkit::SupportedSync>(m, "SupportedSync")
        .def_ro("serrated_vsync", &edidkit::SupportedSync::serrated_vsync)
        .def_ro("sync_on_green", &edidkit::SupportedSync::sync_on_green)
        .def_ro("composite_sync", &edidkit::SupportedSync::composite_sync)
        .def_ro("separate_sync", &edidkit::SupportedSync::separate_sync);

    nb::class_<edidkit::AnalogInput>(m, "AnalogInput")
        .def_ro("signal_level", &edidkit::AnalogInput::signal_level)
        .def_ro("setup_expected", &edidkit::AnalogInput::setup_expected)
        .def_ro("supported_sync", &edidkit::AnalogInput::supported_sync);

    nb::class_<edidkit::DigitalInput>(m, "DigitalInput")
        .def_ro("dfp_compatible", &edidkit::DigitalInput::dfp_compatible);

    nb::class_<edidkit::ImageSize>(m, "ImageSize")
        .def_ro("width_cm", &edidkit::ImageSize::width_cm)
        .def_ro("height_cm", &edidkit::ImageSize::height_cm);

    nb::class_<edidkit::DpmsFeatures>(m, "DpmsFeatures")
        .def_ro("standby_supported", &edidkit::DpmsFeatures::standby_supported)
        .def_ro("suspend_supported", &edidkit::DpmsFeatures::suspend_supported)
        .def_ro("low_power_supported", &edidkit::DpmsFeatures::low_power_supported)
        .def_ro("display_type", &edidkit::DpmsFeatures::display_type)
        .def_ro("default_srgb", &edidkit::DpmsFeatures::default_srgb)
        .def_ro("preferred_timing_mode", &edidkit::DpmsFeatures::preferred_timing_mode)
        .def_ro("default_gtf_supported", &edidkit::DpmsFeatures::default_gtf_supported);

    nb::class_<edidkit::DisplayParameters>(m, "DisplayParameters")
        .def_ro("input", &edidkit::DisplayParameters::input, "AnalogInput or DigitalInput")
        .def_ro("max_size", &edidkit::DisplayParameters::max_size)
        .def_ro("gamma", &edidkit::DisplayParameters::gamma)
        .def_ro("dpms", &edidkit::DisplayParameters::dpms);

    // =========================================================================
    // Color characteristics
    // =========================================================================

    nb::class_<edidkit::Chromaticity>(m, "Chromaticity")
        .def_ro("x", &edidkit::Chromaticity::x)
        .def_ro("y", &edidkit::Chromaticity::y)
        .def("__repr__", [](const edidkit::Chromaticity& c) {
            std::ostringstream oss;
            oss << "Chromaticity(x=" << c.x << ", y=" << c.y << ")";
            return oss.str();
        });

    nb::class_<edidkit::WhitePoint>(m, "WhitePoint")
        .def_ro("index", &edidkit::WhitePoint::index)
        .def_ro("point", &edidkit::WhitePoint::point)
        .def_ro("gamma", &edidkit::WhitePoint::gamma);

    nb::class_<edidkit::ColorCharacteristics>(m, "ColorCharacteristics")
        .def_ro("red", &edidkit::ColorCharacteristics::red)
        .def_ro("green", &edidkit::ColorCharacteristics::green)
        .def_ro("blue", &edidkit::ColorCharacteristics::blue)
        .def_ro("white", &edidkit::ColorCharacteristics::white)
        .def_ro("white_points", &edidkit::ColorCharacteristics::white_points);

    // =========================================================================
    // Timings
    // =========================================================================

    nb::class_<edidkit::StandardTiming>(m, "StandardTiming")
        .def_ro("horizontal_resolution", &edidkit::StandardTiming::horizontal_resolution)
        .def_ro("aspect_ratio", &edidkit::StandardTiming::aspect_ratio)
        .def_ro("refresh_rate", &edidkit::StandardTiming::refresh_rate)
        .def_prop_ro("vertical_resolution", &edidkit::StandardTiming::vertical_resolution);

    nb::class_<edidkit::AxisPair>(m, "AxisPair")
        .def_ro("horizontal", &edidkit::AxisPair::horizontal)
        .def_ro("vertical", &edidkit::AxisPair::vertical);

    nb::class_<edidkit::SyncOnGreen>(m, "SyncOnGreen");
    nb::class_<edidkit::SyncOnRgb>(m, "SyncOnRgb");
    nb::class_<edidkit::DigitalSyncLine>(m, "DigitalSyncLine")
        .def_ro("polarity", &edidkit::DigitalSyncLine::polarity);

    nb::class_<edidkit::CompositeSync>(m, "CompositeSync")
        .def_ro("serrated", &edidkit::CompositeSync::serrated)
        .def_ro("line", &edidkit::CompositeSync::line);

    nb::class_<edidkit::SeparateSync>(m, "SeparateSync")
        .def_ro("horizontal", &edidkit::SeparateSync::horizontal)
        .def_ro("vertical", &edidkit::SeparateSync::vertical);

    nb::class_<edidkit::DetailedTiming>(m, "DetailedTiming")
        .def_ro("pixel_clock", &edidkit::DetailedTiming::pixel_clock, "Pixel clock in Hz")
        .def_ro("active", &edidkit::DetailedTiming::active)
        .def_ro("blanking", &edidkit::DetailedTiming::blanking)
        .def_ro("front_porch", &edidkit::DetailedTiming::front_porch)
        .def_ro("sync_width", &edidkit::DetailedTiming::sync_width)
        .def_ro("back_porch", &edidkit::DetailedTiming::back_porch)
        .def_ro("image_size", &edidkit::DetailedTiming::image_size)
        .def_ro("border", &edidkit::DetailedTiming::border)
        .def_ro("interlaced", &edidkit::DetailedTiming::interlaced)
        .def_ro("stereo", &edidkit::DetailedTiming::stereo)
        .def_ro("sync", &edidkit::DetailedTiming::sync)
        .def_prop_ro("refresh_rate_hz", &edidkit::DetailedTiming::refresh_rate_hz);

    nb::class_<edidkit::Timings>(m, "Timings")
        .def_ro("established", &edidkit::Timings::established)
        .def_ro("standard", &edidkit::Timings::standard)
        .def_ro("detailed", &edidkit::Timings::detailed)
        .def("supports", &edidkit::Timings::supports, "timing"_a);
}

} // namespace edidkit_python
