#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of command-line values to numeric types with validation
 - Consistent error handling for the harness CLI

 Key functions:
 - SafeParseInt: Parse integer with bounds checking
 - SafeParseInt64: Parse 64-bit integer with bounds checking
 - SafeParseUInt64: Parse unsigned 64-bit integer (seeds, heights)
 - SafeParseDouble: Parse floating point value with bounds checking
 - SplitOnce: Split "key=value" style arguments

 All parsers validate that the entire input is consumed and return
 std::nullopt on any error (no exceptions thrown).
*/

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace dropnet {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse int64_t string with bounds checking
 *
 * Examples:
 *   SafeParseInt64("86400", 0, 1000000) -> 86400
 *   SafeParseInt64("-1", 0, 1000000) -> std::nullopt (out of range)
 */
std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max);

/**
 * Parse uint64_t string (no sign accepted)
 *
 * Examples:
 *   SafeParseUInt64("18446744073709551615") -> UINT64_MAX
 *   SafeParseUInt64("-1") -> std::nullopt
 */
std::optional<uint64_t> SafeParseUInt64(const std::string& str);

/**
 * Parse a finite double within [min, max]
 *
 * Examples:
 *   SafeParseDouble("0.05", 0.0, 1.0) -> 0.05
 *   SafeParseDouble("1.5", 0.0, 1.0) -> std::nullopt
 *   SafeParseDouble("nan", 0.0, 1.0) -> std::nullopt
 */
std::optional<double> SafeParseDouble(const std::string& str, double min, double max);

/**
 * Split at the first occurrence of `sep`
 *
 * Examples:
 *   SplitOnce("/num_shards=2", '=') -> {"/num_shards", "2"}
 *   SplitOnce("novalue", '=') -> std::nullopt
 */
std::optional<std::pair<std::string, std::string>> SplitOnce(const std::string& str, char sep);

} // namespace util
} // namespace dropnet
