#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of command-line and config values with validation
 - Returns std::nullopt on any parsing error (no exceptions thrown)

 Key functions:
 - SafeParseInt: Parse integer with bounds checking
 - SplitList: Split a comma-separated option value
 - HasPrefix: Prefix test used for link-name and username matching
*/

#include <optional>
#include <string>
#include <vector>

namespace nodeguard {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * - Validates entire string is consumed (no trailing characters)
 * - Checks value is within [min, max] range
 * - Returns std::nullopt on any error (never throws)
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 *   SafeParseInt("", 0, 100) -> std::nullopt (empty string)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Split "a,b,,c" into {"a", "b", "c"}; empty items are dropped
 */
std::vector<std::string> SplitList(const std::string& str, char sep = ',');

inline bool HasPrefix(const std::string& str, const std::string& prefix) {
  return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

} // namespace util
} // namespace nodeguard
