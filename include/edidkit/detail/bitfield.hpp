// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <concepts>
#include <type_traits>

#include <cstddef>
#include <cstdint>

namespace edidkit::detail {

template <typename T>
concept FieldStorage = std::same_as<T, uint8_t> || std::same_as<T, uint16_t> ||
                       std::same_as<T, uint32_t>;

template <typename T>
concept IsBitField = requires {
    typename T::storage_type;
    { T::byte_index } -> std::convertible_to<std::size_t>;
    { T::offset } -> std::convertible_to<std::size_t>;
    { T::width } -> std::convertible_to<std::size_t>;
};

/// Smallest unsigned type holding Width bits (bool for single bits)
template <std::size_t Width>
using field_value_t =
    std::conditional_t<Width == 1, bool,
                       std::conditional_t<Width <= 8, uint8_t,
                                          std::conditional_t<Width <= 16, uint16_t, uint32_t>>>;

/**
 * Read-only bit field descriptor.
 *
 * The field occupies bits [Offset, Offset + Width) of a little-endian storage
 * word that starts ByteIndex bytes into a fixed byte group (an 18-byte slot,
 * a 5-byte white point entry). ByteIndex is 0 for stand-alone bytes.
 *
 * @tparam StorageType uint8_t, uint16_t or uint32_t
 * @tparam Offset Bit position of the least significant bit
 * @tparam Width Number of bits
 * @tparam ByteIndex Position of the storage word within its group
 */
template <FieldStorage StorageType, std::size_t Offset, std::size_t Width,
          std::size_t ByteIndex = 0>
struct BitField {
    static constexpr std::size_t storage_bits = sizeof(StorageType) * 8;

    static_assert(Width >= 1 && Offset + Width <= storage_bits,
                  "BitField must lie inside its storage word");

    using storage_type = StorageType;
    using value_type = field_value_t<Width>;

    static constexpr std::size_t byte_index = ByteIndex;
    static constexpr std::size_t offset = Offset;
    static constexpr std::size_t width = Width;

    // Built in 64 bits so a full-width mask never shifts by the storage width
    static constexpr StorageType mask =
        static_cast<StorageType>((uint64_t{1} << Width) - 1);

    /// First and one-past-last bit within the group, counting from byte 0 bit 0
    static constexpr std::size_t first_bit = ByteIndex * 8 + Offset;
    static constexpr std::size_t end_bit = first_bit + Width;

    static constexpr value_type extract(StorageType word) noexcept {
        const auto bits = static_cast<StorageType>((word >> Offset) & mask);
        if constexpr (Width == 1) {
            return bits != 0;
        } else {
            return static_cast<value_type>(bits);
        }
    }

    template <typename Other>
    static constexpr bool overlaps_with() noexcept {
        return first_bit < Other::end_bit && Other::first_bit < end_bit;
    }
};

template <std::size_t Bit, std::size_t ByteIndex = 0>
using BitFlag = BitField<uint8_t, Bit, 1, ByteIndex>;

/**
 * Bit field decoded straight into a closed enum.
 *
 * Every raw value of the field must name an enumerator (the 2-bit display
 * type and aspect ratio selectors), so decode() has no fallback.
 */
template <typename Enum, FieldStorage StorageType, std::size_t Offset, std::size_t Width,
          std::size_t ByteIndex = 0>
struct EnumBitField : BitField<StorageType, Offset, Width, ByteIndex> {
    using base = BitField<StorageType, Offset, Width, ByteIndex>;
    using enum_type = Enum;

    static_assert(std::is_enum_v<Enum>, "EnumBitField requires an enum type");
    static_assert(Width > 1, "Use BitFlag for single-bit fields");
    static_assert(std::is_same_v<std::underlying_type_t<Enum>, typename base::value_type>,
                  "Enum underlying type must match the field value type");

    static constexpr Enum decode(StorageType word) noexcept {
        return static_cast<Enum>(base::extract(word));
    }
};

template <typename First, typename... Rest>
constexpr bool overlaps_any() noexcept {
    return (First::template overlaps_with<Rest>() || ...);
}

/// True when no two fields share a bit
template <typename... Fields>
constexpr bool validate_no_overlaps() noexcept {
    if constexpr (sizeof...(Fields) < 2) {
        return true;
    } else {
        return []<typename First, typename... Rest>(const First*, const Rest*...) {
            return !overlaps_any<First, Rest...>() && validate_no_overlaps<Rest...>();
        }(static_cast<const Fields*>(nullptr)...);
    }
}

/// Fields covering one fixed byte group, checked for overlap at compile time
template <typename... Fields>
struct BitFieldLayout {
    static_assert((IsBitField<Fields> && ...), "BitFieldLayout takes BitField types only");
    static_assert(validate_no_overlaps<Fields...>(), "BitField layout contains overlapping fields");

    static constexpr std::size_t required_bytes = [] {
        std::size_t extent = 0;
        ((extent = (Fields::byte_index + sizeof(typename Fields::storage_type) > extent
                        ? Fields::byte_index + sizeof(typename Fields::storage_type)
                        : extent)),
         ...);
        return extent;
    }();

    template <typename Field>
    static constexpr bool has_field = (std::same_as<Field, Fields> || ...);
};

/**
 * Join a high-bit fragment onto its low part.
 *
 * EDID stores most 10- and 12-bit quantities as an 8-bit (or 4-bit) low part
 * plus a 2- or 4-bit high fragment packed into a shared byte.
 */
template <std::size_t LowBits>
[[nodiscard]] constexpr uint16_t join_bits(uint16_t high, uint16_t low) noexcept {
    static_assert(LowBits > 0 && LowBits < 16, "LowBits must be in range [1, 15]");
    return static_cast<uint16_t>((high << LowBits) | low);
}

} // namespace edidkit::detail
