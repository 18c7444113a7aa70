// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <algorithm>
#include <array>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <cstddef>
#include <cstdint>

#include "../byte_source.hpp"
#include "../types.hpp"
#include "byte_cursor.hpp"
#include "color_characteristics.hpp"
#include "decode_result.hpp"
#include "descriptor.hpp"
#include "detailed_timing.hpp"
#include "display_parameters.hpp"
#include "product_info.hpp"
#include "timing_tables.hpp"

namespace edidkit {

/// All timings advertised by the base block
struct Timings {
    std::vector<EstablishedTiming> established; ///< Catalogue order, no duplicates
    std::vector<StandardTiming> standard;       ///< Base entries, then descriptor entries
    std::vector<DetailedTiming> detailed;       ///< Index 0 is the preferred timing

    /// Whether an established timing is advertised
    [[nodiscard]] bool supports(EstablishedTiming timing) const noexcept {
        return std::find(established.begin(), established.end(), timing) != established.end();
    }

    bool operator==(const Timings&) const = default;
};

using DescriptorList = std::vector<Descriptor>;

namespace detail {
struct RecordBuilder;
} // namespace detail

/**
 * @brief Decoded EDID base block
 *
 * Produced only by decode(). Every sub-record is complete; a partially
 * decoded block is never returned.
 */
class DisplayRecord {
public:
    [[nodiscard]] const ProductInfo& product() const noexcept { return product_; }
    [[nodiscard]] const SpecVersion& version() const noexcept { return version_; }
    [[nodiscard]] const DisplayParameters& display() const noexcept { return display_; }
    [[nodiscard]] const ColorCharacteristics& color() const noexcept { return color_; }
    [[nodiscard]] const Timings& timings() const noexcept { return timings_; }

    /// Descriptors in slot order (padding descriptors omitted)
    [[nodiscard]] const DescriptorList& descriptors() const noexcept { return descriptors_; }

    /// Raw extension block count byte
    [[nodiscard]] uint8_t extension_count() const noexcept { return extension_count_; }

    bool operator==(const DisplayRecord&) const = default;

private:
    friend struct detail::RecordBuilder;

    DisplayRecord(ProductInfo product, SpecVersion version, DisplayParameters display,
                  ColorCharacteristics color, Timings timings, DescriptorList descriptors,
                  uint8_t extension_count)
        : product_(std::move(product)),
          version_(version),
          display_(std::move(display)),
          color_(std::move(color)),
          timings_(std::move(timings)),
          descriptors_(std::move(descriptors)),
          extension_count_(extension_count) {}

    ProductInfo product_;
    SpecVersion version_;
    DisplayParameters display_;
    ColorCharacteristics color_;
    Timings timings_;
    DescriptorList descriptors_;
    uint8_t extension_count_{0};
};

namespace detail {

/// Contributions from the four slots
struct SlotAccumulator {
    std::vector<DetailedTiming> detailed;
    DescriptorAccumulator descriptors;
};

template <typename Cursor>
DecodeResult<void> decode_header(Cursor& cursor) {
    cursor.set_context("header");
    auto first = cursor.next_u32_le();
    if (!first) {
        return unexpected(first.error());
    }
    if (*first != header_word_0) {
        return cursor.fail(DecodeErrorCode::header_invalid);
    }
    auto second = cursor.next_u32_le();
    if (!second) {
        return unexpected(second.error());
    }
    if (*second != header_word_1) {
        return cursor.fail(DecodeErrorCode::header_invalid);
    }
    return {};
}

/**
 * Decode one detailed timing / descriptor slot.
 *
 * A non-zero pixel clock is a detailed timing. A zero clock introduces a
 * tagged descriptor, except in slot 0 where the preferred timing is
 * mandatory.
 */
template <typename Cursor>
DecodeResult<void> decode_slot(Cursor& cursor, std::size_t index, SlotAccumulator& out) {
    cursor.set_context("pixel clock");
    auto clock = cursor.next_u16_le();
    if (!clock) {
        return unexpected(clock.error());
    }
    if (*clock == 0) {
        if (index == 0) {
            return cursor.fail(DecodeErrorCode::missing_preferred_timing);
        }
        return decode_descriptor(cursor, out.descriptors);
    }

    cursor.set_context("detailed timing");
    auto rest = cursor.template next_bytes<slot_size - 2>();
    if (!rest) {
        return unexpected(rest.error());
    }
    std::array<uint8_t, slot_size> slot{};
    slot[0] = static_cast<uint8_t>(*clock & 0xFF);
    slot[1] = static_cast<uint8_t>(*clock >> 8);
    std::copy(rest->begin(), rest->end(), slot.begin() + 2);

    auto timing = decode_detailed_timing(slot, cursor.offset());
    if (!timing) {
        return unexpected(timing.error());
    }
    out.detailed.push_back(*timing);
    return {};
}

struct RecordBuilder {
    static DisplayRecord build(ProductInfo product, SpecVersion version,
                               DisplayParameters display, ColorCharacteristics color,
                               std::vector<EstablishedTiming> established,
                               SlotAccumulator slots, uint8_t extension_count) {
        color.white_points = std::move(slots.descriptors.white_points);
        Timings timings{.established = std::move(established),
                        .standard = std::move(slots.descriptors.standard_timings),
                        .detailed = std::move(slots.detailed)};
        return DisplayRecord(std::move(product), version, std::move(display), std::move(color),
                             std::move(timings), std::move(slots.descriptors.descriptors),
                             extension_count);
    }
};

} // namespace detail

/**
 * @brief Decode a 128-byte EDID base block from a byte source
 *
 * Reads up to and including the extension count byte (at most 127 bytes;
 * fewer when a padding descriptor shortens its slot). The checksum byte is
 * left unread. Decoding is fail-fast: the first malformed field aborts with
 * a DecodeError and no record is produced.
 *
 * @param source Byte source positioned at the start of the block
 * @return The decoded record, or the first error encountered
 */
template <ByteSource Source>
DecodeResult<DisplayRecord> decode(Source& source) {
    detail::ByteCursor<Source> cursor(source);

    if (auto header = detail::decode_header(cursor); !header) {
        return unexpected(header.error());
    }
    auto product = detail::decode_product_info(cursor);
    if (!product) {
        return unexpected(product.error());
    }
    auto version = detail::decode_version(cursor);
    if (!version) {
        return unexpected(version.error());
    }
    auto display = detail::decode_display_parameters(cursor);
    if (!display) {
        return unexpected(display.error());
    }
    auto color = detail::decode_color_characteristics(cursor);
    if (!color) {
        return unexpected(color.error());
    }
    auto tables = detail::decode_timing_tables(cursor);
    if (!tables) {
        return unexpected(tables.error());
    }

    detail::SlotAccumulator slots;
    slots.descriptors.standard_timings = std::move(tables->standard);
    for (std::size_t index = 0; index < slot_count; ++index) {
        if (auto slot = detail::decode_slot(cursor, index, slots); !slot) {
            return unexpected(slot.error());
        }
    }

    cursor.set_context("extension count");
    auto extension_count = cursor.next_byte();
    if (!extension_count) {
        return unexpected(extension_count.error());
    }

    return detail::RecordBuilder::build(std::move(*product), *version, std::move(*display),
                                        std::move(*color), std::move(tables->established),
                                        std::move(slots), *extension_count);
}

// ============================================================================
// Descriptor lookups
// ============================================================================

namespace detail {

template <typename T>
[[nodiscard]] const T* find_descriptor(const DisplayRecord& record) noexcept {
    for (const auto& descriptor : record.descriptors()) {
        if (const auto* found = std::get_if<T>(&descriptor)) {
            return found;
        }
    }
    return nullptr;
}

} // namespace detail

/// Text of the first monitor name descriptor
[[nodiscard]] inline std::optional<std::string> monitor_name(const DisplayRecord& record) {
    if (const auto* d = detail::find_descriptor<MonitorNameDescriptor>(record)) {
        return d->text;
    }
    return std::nullopt;
}

/// Text of the first serial number descriptor
[[nodiscard]] inline std::optional<std::string> serial_number_string(const DisplayRecord& record) {
    if (const auto* d = detail::find_descriptor<SerialNumberDescriptor>(record)) {
        return d->text;
    }
    return std::nullopt;
}

/// First range limits descriptor
[[nodiscard]] inline std::optional<RangeLimitsDescriptor> range_limits(const DisplayRecord& record) {
    if (const auto* d = detail::find_descriptor<RangeLimitsDescriptor>(record)) {
        return *d;
    }
    return std::nullopt;
}

} // namespace edidkit
