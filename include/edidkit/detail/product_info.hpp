// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <array>
#include <string>

#include <cstdint>

#include "bitfield.hpp"
#include "byte_cursor.hpp"
#include "decode_result.hpp"

namespace edidkit {

/**
 * Manufacturer ID (bytes 0x08-0x09)
 *
 * Three 5-bit code units packed into one 16-bit word:
 *   Bit 15: Reserved | Code 0 [14:10] | Code 1 [9:5] | Code 2 [4:0]
 *
 * Unpacking and character mapping are kept separate: `codes` holds the raw
 * unpacked units, raw_chars() casts them directly to characters, and pnp_id()
 * applies the conventional mapping where 1 is 'A' and 26 is 'Z'.
 */
struct ManufacturerId {
    struct Code0Field : detail::BitField<uint16_t, 10, 5> {};
    struct Code1Field : detail::BitField<uint16_t, 5, 5> {};
    struct Code2Field : detail::BitField<uint16_t, 0, 5> {};

    using Layout = detail::BitFieldLayout<Code0Field, Code1Field, Code2Field>;

    std::array<uint8_t, 3> codes{}; ///< Raw 5-bit units, each in [0, 31]

    /// Unpack the three 5-bit units from the little-endian word
    static constexpr ManufacturerId unpack(uint16_t word) noexcept {
        return ManufacturerId{
            .codes = {Code0Field::extract(word), Code1Field::extract(word),
                      Code2Field::extract(word)}};
    }

    /// The raw units cast directly to characters (byte-exact)
    [[nodiscard]] std::string raw_chars() const {
        return std::string{static_cast<char>(codes[0]), static_cast<char>(codes[1]),
                           static_cast<char>(codes[2])};
    }

    /// Conventional three-letter PNP ID ('@' + unit)
    [[nodiscard]] std::string pnp_id() const {
        return std::string{static_cast<char>('@' + codes[0]), static_cast<char>('@' + codes[1]),
                           static_cast<char>('@' + codes[2])};
    }

    bool operator==(const ManufacturerId&) const = default;
};

/// Week and year of manufacture (bytes 0x10-0x11)
struct ManufactureDate {
    static constexpr uint16_t year_base = 1990;

    uint8_t week{0};  ///< Raw week byte, not range-checked
    uint16_t year{0}; ///< Stored byte + 1990

    bool operator==(const ManufactureDate&) const = default;
};

/// Product identification (bytes 0x08-0x11)
struct ProductInfo {
    ManufacturerId manufacturer_id;
    uint16_t product_code{0};
    uint32_t serial_number{0};
    ManufactureDate manufacture_date;

    bool operator==(const ProductInfo&) const = default;
};

/// EDID structure version and revision (bytes 0x12-0x13)
struct SpecVersion {
    uint8_t version{0};
    uint8_t revision{0};

    bool operator==(const SpecVersion&) const = default;
};

namespace detail {

template <typename Cursor>
DecodeResult<ProductInfo> decode_product_info(Cursor& cursor) {
    cursor.set_context("manufacturer id");
    auto id_word = cursor.next_u16_le();
    if (!id_word) {
        return unexpected(id_word.error());
    }

    cursor.set_context("product code");
    auto product_code = cursor.next_u16_le();
    if (!product_code) {
        return unexpected(product_code.error());
    }

    cursor.set_context("serial number");
    auto serial = cursor.next_u32_le();
    if (!serial) {
        return unexpected(serial.error());
    }

    cursor.set_context("manufacture date");
    auto date = cursor.template next_bytes<2>();
    if (!date) {
        return unexpected(date.error());
    }

    return ProductInfo{
        .manufacturer_id = ManufacturerId::unpack(*id_word),
        .product_code = *product_code,
        .serial_number = *serial,
        .manufacture_date = ManufactureDate{
            .week = (*date)[0],
            .year = static_cast<uint16_t>((*date)[1] + ManufactureDate::year_base)}};
}

template <typename Cursor>
DecodeResult<SpecVersion> decode_version(Cursor& cursor) {
    cursor.set_context("version");
    auto bytes = cursor.template next_bytes<2>();
    if (!bytes) {
        return unexpected(bytes.error());
    }
    return SpecVersion{.version = (*bytes)[0], .revision = (*bytes)[1]};
}

} // namespace detail

} // namespace edidkit
