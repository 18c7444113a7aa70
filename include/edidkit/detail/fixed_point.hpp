// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <concepts>

#include <cmath>
#include <cstdint>

namespace edidkit::detail {

/**
 * Unsigned fixed-point format UQ<IntBits>.<FracBits> held in StorageType.
 *
 * Raw words are masked to IntBits + FracBits before conversion, so bits above
 * the format never contribute. Range is [0, 2^IntBits - 2^-FracBits].
 */
template <int IntBits, int FracBits, std::unsigned_integral StorageType = uint16_t>
struct FixedPoint {
    static constexpr int int_bits = IntBits;
    static constexpr int frac_bits = FracBits;
    static constexpr int total_bits = IntBits + FracBits;

    static_assert(IntBits >= 0 && FracBits >= 0 && total_bits >= 1);
    static_assert(total_bits <= static_cast<int>(sizeof(StorageType) * 8),
                  "Format does not fit the storage type");

    using storage_type = StorageType;

    [[nodiscard]] static constexpr storage_type mask() noexcept {
        return static_cast<storage_type>((uint64_t{1} << total_bits) - 1);
    }

    [[nodiscard]] static constexpr storage_type sanitize_raw(storage_type raw) noexcept {
        return static_cast<storage_type>(raw & mask());
    }

    [[nodiscard]] static double to_double(storage_type raw) noexcept {
        return std::ldexp(static_cast<double>(sanitize_raw(raw)), -FracBits);
    }

    [[nodiscard]] static double min_value() noexcept { return 0.0; }

    [[nodiscard]] static double max_value() noexcept { return to_double(mask()); }
};

/// CIE 1931 chromaticity coordinate: ten fraction bits, always in [0, 1)
using ChromaticityFixed = FixedPoint<0, 10>;

} // namespace edidkit::detail
