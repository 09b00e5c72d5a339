#ifndef TEXT_UTILS_HPP
#define TEXT_UTILS_HPP

#include <string>

/**
 * @brief Check whether @p bytes form well-formed UTF-8.
 *
 * Overlong encodings, surrogates and code points above U+10FFFF are rejected.
 */
bool is_valid_utf8(const std::string& bytes);

/**
 * @brief Decode @p bytes as UTF-8, replacing each malformed sequence with
 *        U+FFFD.
 */
std::string utf8_lossy(const std::string& bytes);

/// @return `true` if @p text begins with @p prefix (case-sensitive).
bool starts_with(const std::string& text, const std::string& prefix);

#endif // TEXT_UTILS_HPP
