// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <istream>
#include <optional>
#include <span>

#include <cstddef>
#include <cstdint>

namespace edidkit::utils {

/**
 * @brief Byte source over a standard input stream
 *
 * Reads with istream::read and reports the gcount. End of stream yields 0.
 * A stream in bad() state is a source failure, and so is one in fail() state
 * short of end of stream (an ifstream that failed to open). The stream must
 * outlive the source and should be opened in binary mode.
 */
class StreamSource {
public:
    explicit StreamSource(std::istream& stream) noexcept : stream_(stream) {}

    std::optional<std::size_t> fill(std::span<uint8_t> buffer) {
        if (stream_.bad()) {
            return std::nullopt;
        }
        if (stream_.eof()) {
            return std::size_t{0};
        }
        // failbit without eof: the stream never opened or a prior operation failed
        if (stream_.fail()) {
            return std::nullopt;
        }
        stream_.read(reinterpret_cast<char*>(buffer.data()),
                     static_cast<std::streamsize>(buffer.size()));
        if (stream_.bad()) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(stream_.gcount());
    }

private:
    std::istream& stream_;
};

} // namespace edidkit::utils
