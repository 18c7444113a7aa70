// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

/**
 * @file edidkit_io.hpp
 * @brief Convenience header for EDID byte sources
 *
 * Primary types:
 * - EDIDFileReader: Reads a blob from a file (sysfs edid node or raw dump)
 * - MemorySource: Serves bytes from a caller-owned buffer
 * - StreamSource: Serves bytes from a std::istream
 */

#include "detail/record_decoder.hpp"
#include "utils/fileio/edid_file_reader.hpp"
#include "utils/memory_source.hpp"
#include "utils/stream_source.hpp"

namespace edidkit {

using EDIDFileReader = utils::fileio::EDIDFileReader;
using MemorySource = utils::MemorySource;
using StreamSource = utils::StreamSource;

} // namespace edidkit
