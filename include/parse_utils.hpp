#ifndef PARSE_UTILS_HPP
#define PARSE_UTILS_HPP

#include <cstddef>
#include <string>

// Parse a size_t from a string.
// Format: decimal digits only.
// Bounds: inclusive [min, max].
// Invalid input: empty, non-numeric, overflow or out-of-range sets ok=false and returns 0.
size_t parse_size_t(const std::string& value, size_t min, size_t max, bool& ok);

// Parse a byte size from a string with optional unit suffix.
// Format: unsigned integer followed by optional B, K/KB, M/MB or G/GB (case-insensitive,
// binary multiples).
// Bounds: inclusive [min, max] bytes.
// Invalid input: bad unit, parse failure, overflow or out-of-range sets ok=false and returns 0.
size_t parse_bytes(const std::string& value, size_t min, size_t max, bool& ok);

// Interpret a configuration or flag value as a boolean.
// Accepted: "", "1", "true", "yes", "on" and "0", "false", "no", "off" (case-insensitive).
// Invalid input sets ok=false and returns false.
bool parse_bool(const std::string& value, bool& ok);

#endif // PARSE_UTILS_HPP
