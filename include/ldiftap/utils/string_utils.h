/**
 * @file string_utils.h
 * @brief String manipulation utilities
 *
 * String, base64 and character-encoding helpers shared by the parser,
 * the filter and the configuration layer.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace ldiftap {
namespace utils {

/**
 * @brief Convert string to lowercase (ASCII only)
 *
 * @param str Input string
 * @return Lowercase string
 */
std::string toLower(const std::string& str);

/**
 * @brief Trim whitespace from both ends
 *
 * @param str Input string
 * @return Trimmed string
 */
std::string trim(const std::string& str);

/**
 * @brief Trim whitespace from right end
 *
 * @param str Input string
 * @return Right-trimmed string
 */
std::string trimRight(const std::string& str);

/**
 * @brief Split string by delimiter
 *
 * @param str Input string
 * @param delimiter Delimiter character
 * @return Vector of string parts ("" yields [""])
 */
std::vector<std::string> split(const std::string& str, char delimiter);

/**
 * @brief Check if string starts with prefix
 */
bool startsWith(const std::string& str, const std::string& prefix);

/**
 * @brief Check if string ends with suffix, ignoring ASCII case
 */
bool endsWithIgnoreCase(const std::string& str, const std::string& suffix);

/**
 * @brief Encode bytes to Base64 (no line breaks)
 *
 * @param data Binary data
 * @return Base64-encoded string
 */
std::string toBase64(const std::string& data);

/**
 * @brief Decode Base64 string
 *
 * Whitespace is ignored. The remaining text must use the standard
 * alphabet, be a multiple of four characters long and carry at most two
 * '=' padding characters, all at the end.
 *
 * @param base64 Base64-encoded string
 * @return Decoded bytes, or std::nullopt on malformed input
 */
std::optional<std::string> fromBase64(const std::string& base64);

/**
 * @brief Check if string is valid UTF-8
 *
 * Rejects overlong forms, surrogates and code points above U+10FFFF.
 *
 * @param str Input string
 * @return true if valid UTF-8 encoding
 */
bool isValidUtf8(const std::string& str);

/**
 * @brief Check if string contains only ASCII characters
 */
bool isAscii(const std::string& str);

/**
 * @brief Transcode ISO-8859-1 text to UTF-8
 */
std::string latin1ToUtf8(const std::string& str);

} // namespace utils
} // namespace ldiftap
