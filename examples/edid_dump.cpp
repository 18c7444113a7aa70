#include <exception>
#include <iomanip>
#include <iostream>
#include <string>
#include <variant>

#include <edidkit.hpp>
#include <edidkit/edidkit_io.hpp>

using namespace edidkit;

namespace {

template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

const char* polarityName(SyncPolarity polarity) {
    return polarity == SyncPolarity::positive ? "+" : "-";
}

void printProduct(const DisplayRecord& record) {
    const auto& product = record.product();
    std::cout << "Product\n";
    std::cout << "  Manufacturer: " << product.manufacturer_id.pnp_id() << "\n";
    std::cout << "  Product code: 0x" << std::hex << std::setw(4) << std::setfill('0')
              << product.product_code << std::dec << std::setfill(' ') << "\n";
    std::cout << "  Serial: " << product.serial_number << "\n";
    std::cout << "  Manufactured: week " << static_cast<int>(product.manufacture_date.week)
              << " of " << product.manufacture_date.year << "\n";
    std::cout << "  EDID version: " << static_cast<int>(record.version().version) << "."
              << static_cast<int>(record.version().revision) << "\n\n";
}

void printDisplay(const DisplayParameters& display) {
    std::cout << "Display\n";
    std::visit(Overloaded{[](const AnalogInput& analog) {
                              std::cout << "  Input: analog (" << analog.signal_level.high
                                        << " V / " << analog.signal_level.low << " V)\n";
                          },
                          [](const DigitalInput& digital) {
                              std::cout << "  Input: digital"
                                        << (digital.dfp_compatible ? " (DFP 1.x)" : "") << "\n";
                          }},
               display.input);
    if (display.max_size) {
        std::cout << "  Max image size: " << display.max_size->width_cm << " x "
                  << display.max_size->height_cm << " cm\n";
    }
    if (display.gamma) {
        std::cout << "  Gamma: " << *display.gamma << "\n";
    }
    std::cout << "  Preferred timing mode: " << (display.dpms.preferred_timing_mode ? "yes" : "no")
              << "\n\n";
}

void printColor(const ColorCharacteristics& color) {
    auto point = [](const char* label, const Chromaticity& c) {
        std::cout << "  " << label << ": (" << std::fixed << std::setprecision(4) << c.x << ", "
                  << c.y << ")\n"
                  << std::defaultfloat;
    };
    std::cout << "Chromaticity\n";
    point("Red", color.red);
    point("Green", color.green);
    point("Blue", color.blue);
    point("White", color.white);
    for (const auto& white : color.white_points) {
        std::cout << "  White point " << static_cast<int>(white.index) << ": (" << white.point.x
                  << ", " << white.point.y << "), gamma " << white.gamma << "\n";
    }
    std::cout << "\n";
}

void printTimings(const Timings& timings) {
    std::cout << "Timings\n";
    for (auto timing : timings.established) {
        std::cout << "  Established: " << established_timing_name(timing) << "\n";
    }
    for (const auto& timing : timings.standard) {
        std::cout << "  Standard: " << timing.horizontal_resolution << "x"
                  << timing.vertical_resolution() << "@" << static_cast<int>(timing.refresh_rate)
                  << "\n";
    }
    for (const auto& timing : timings.detailed) {
        std::cout << "  Detailed: " << timing.active.horizontal << "x" << timing.active.vertical
                  << (timing.interlaced ? "i" : "") << " @ "
                  << static_cast<double>(timing.pixel_clock) / 1e6 << " MHz";
        if (auto refresh = timing.refresh_rate_hz()) {
            std::cout << " (" << std::fixed << std::setprecision(2) << *refresh << " Hz)"
                      << std::defaultfloat;
        }
        std::visit(Overloaded{[](const SeparateSync& sync) {
                                  std::cout << " sync " << polarityName(sync.horizontal) << "h"
                                            << polarityName(sync.vertical) << "v";
                              },
                              [](const CompositeSync&) { std::cout << " composite sync"; }},
                   timing.sync);
        std::cout << "\n";
    }
    std::cout << "\n";
}

void printDescriptors(const DescriptorList& descriptors) {
    std::cout << "Descriptors\n";
    for (const auto& descriptor : descriptors) {
        std::cout << "  [0x" << std::hex << std::setw(2) << std::setfill('0')
                  << static_cast<int>(descriptor_tag(descriptor)) << std::dec
                  << std::setfill(' ') << "] ";
        std::visit(
            Overloaded{
                [](const MonitorNameDescriptor& d) { std::cout << "Name: " << d.text; },
                [](const SerialNumberDescriptor& d) { std::cout << "Serial: " << d.text; },
                [](const OtherStringDescriptor& d) { std::cout << "Text: " << d.text; },
                [](const RangeLimitsDescriptor& d) {
                    std::cout << "Range: " << static_cast<int>(d.min_vertical_rate) << "-"
                              << static_cast<int>(d.max_vertical_rate) << " Hz V, "
                              << d.min_horizontal_rate / 1000 << "-"
                              << d.max_horizontal_rate / 1000 << " kHz H, max "
                              << d.max_pixel_clock / 1'000'000 << " MHz";
                },
                [](const ManufacturerDescriptor&) { std::cout << "Manufacturer data"; },
                [](const UndefinedDescriptor&) { std::cout << "Undefined"; }},
            descriptor);
        std::cout << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    DecodeResult<DisplayRecord> record =
        make_decode_error(DecodeErrorCode::source_failure, 0, "input");
    try {
        if (argc > 1) {
            EDIDFileReader reader(argv[1]);
            record = reader.decode();
        } else {
            StreamSource source(std::cin);
            record = decode(source);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (!record) {
        const auto& error = record.error();
        std::cerr << "Decode failed: " << error.message() << " at byte " << error.offset << " ("
                  << error.context << ")\n";
        return 1;
    }

    printProduct(*record);
    printDisplay(record->display());
    printColor(record->color());
    printTimings(record->timings());
    printDescriptors(record->descriptors());
    std::cout << "\nExtension blocks: " << static_cast<int>(record->extension_count()) << "\n";
    return 0;
}
