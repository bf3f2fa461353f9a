/**
 * @file string_utils.h
 * @brief String manipulation utilities
 */

#pragma once

#include <string>
#include <vector>

namespace certmon {
namespace utils {

/**
 * @brief Trim whitespace from both ends
 */
std::string trim(const std::string& str);

/**
 * @brief Split string by delimiter
 *
 * Empty fields are kept: "a..b" yields ["a", "", "b"] and "a." yields ["a", ""].
 */
std::vector<std::string> split(const std::string& str, char delimiter);

/**
 * @brief Split text into lines
 *
 * Accepts "\n", "\r\n" and a lone "\r" as line terminators, so files
 * edited on any platform split identically. A trailing terminator does
 * not produce an extra empty line.
 *
 * @param text Input text
 * @return Lines without their terminators
 */
std::vector<std::string> splitLines(const std::string& text);

/**
 * @brief Split on runs of whitespace, dropping empty tokens
 */
std::vector<std::string> splitWhitespace(const std::string& str);

/**
 * @brief Check if string is non-empty and consists only of ASCII digits
 */
bool isDigits(const std::string& str);

} // namespace utils
} // namespace certmon
