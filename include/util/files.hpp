// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace spvproof {
namespace util {

/**
 * Write string to file atomically
 *
 * Pattern:
 * 1. Write to temporary file (.tmp suffix)
 * 2. fsync() the file
 * 3. fsync() the directory
 * 4. Atomic rename over original file
 *
 * Readers see either the previous file or the complete new one.
 * Returns true on success, false on failure.
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode = 0644);

/**
 * Read entire file into string
 * Returns std::nullopt if the file cannot be opened, read, or is larger than
 * max_size bytes.
 */
std::optional<std::string>
read_file_string(const std::filesystem::path &path,
                 size_t max_size = 64 * 1024 * 1024);

} // namespace util
} // namespace spvproof
