#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace nodeguard {
namespace util {

/**
 * Atomic file operations for crash-safe persistence
 *
 * Pattern:
 * 1. Write to temporary file (.tmp suffix)
 * 2. fsync() the file to ensure data is on disk
 * 3. fsync() the directory to ensure rename will be durable
 * 4. Atomic rename over original file
 *
 * Either the old file or the new file is always valid, never a
 * half-written one.
 */

/**
 * Write string to file atomically with custom permissions
 * @param path Target file path
 * @param data Data to write
 * @param mode File permissions (e.g., 0600 for owner-only, 0644 for default)
 * Returns true on success, false on failure
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data,
                       int mode = 0644);

/**
 * Read entire file into string
 * Returns std::nullopt if the file cannot be opened or exceeds 16MB
 */
std::optional<std::string> read_file_string(const std::filesystem::path &path);

/**
 * Create directory if it doesn't exist (recursive)
 * Returns true on success or if already exists
 */
bool ensure_directory(const std::filesystem::path &dir);

} // namespace util
} // namespace nodeguard
