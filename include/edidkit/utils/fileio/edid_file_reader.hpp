// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdio>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>

#include <cstddef>
#include <cstdint>

#include "../../detail/record_decoder.hpp"

namespace edidkit::utils::fileio {

/**
 * @brief Byte source reading an EDID blob from a file
 *
 * Works on sysfs connector files (/sys/class/drm/card0-eDP-1/edid) and raw
 * binary dumps alike. Only the base block is consumed by decode(); trailing
 * extension blocks are left unread.
 *
 * @warning This class is MOVE-ONLY due to FILE* ownership.
 *
 * Example usage:
 * @code
 * EDIDFileReader reader("/sys/class/drm/card0-eDP-1/edid");
 * auto record = reader.decode();
 * if (record) {
 *     std::cout << edidkit::monitor_name(*record).value_or("?") << "\n";
 * }
 * @endcode
 */
class EDIDFileReader {
public:
    /**
     * @brief Open an EDID file for reading
     *
     * @param filepath Path to the binary EDID file
     * @throws std::runtime_error if file cannot be opened
     */
    explicit EDIDFileReader(const char* filepath) {
        file_ = std::fopen(filepath, "rb");
        if (file_ == nullptr) {
            throw std::runtime_error(std::string("Failed to open EDID file: ") + filepath);
        }
    }

    /**
     * @brief Open an EDID file for reading
     *
     * @param filepath Path to the binary EDID file
     * @throws std::runtime_error if file cannot be opened
     */
    explicit EDIDFileReader(const std::string& filepath) : EDIDFileReader(filepath.c_str()) {}

    ~EDIDFileReader() noexcept {
        if (file_ != nullptr) {
            std::fclose(file_);
        }
    }

    // Non-copyable due to FILE* ownership
    EDIDFileReader(const EDIDFileReader&) = delete;
    EDIDFileReader& operator=(const EDIDFileReader&) = delete;

    EDIDFileReader(EDIDFileReader&& other) noexcept
        : file_(other.file_),
          bytes_read_(other.bytes_read_) {
        other.file_ = nullptr;
    }

    EDIDFileReader& operator=(EDIDFileReader&& other) noexcept {
        if (this != &other) {
            if (file_ != nullptr) {
                std::fclose(file_);
            }
            file_ = other.file_;
            bytes_read_ = other.bytes_read_;
            other.file_ = nullptr;
        }
        return *this;
    }

    /**
     * @brief ByteSource fill
     *
     * @return Bytes read (0 at end of file), or std::nullopt on a read error
     *         or a moved-from reader
     */
    std::optional<std::size_t> fill(std::span<uint8_t> buffer) noexcept {
        if (file_ == nullptr) {
            return std::nullopt;
        }
        const std::size_t count = std::fread(buffer.data(), 1, buffer.size(), file_);
        if (count < buffer.size() && std::ferror(file_) != 0) {
            return std::nullopt;
        }
        bytes_read_ += count;
        return count;
    }

    /// Decode the base block starting at the current file position
    DecodeResult<DisplayRecord> decode() { return edidkit::decode(*this); }

    /// Total bytes pulled from the file so far
    [[nodiscard]] std::size_t bytes_read() const noexcept { return bytes_read_; }

private:
    std::FILE* file_{nullptr};
    std::size_t bytes_read_{0};
};

} // namespace edidkit::utils::fileio
