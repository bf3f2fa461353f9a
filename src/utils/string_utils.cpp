/**
 * @file string_utils.cpp
 * @brief Tokenizing helpers for line-oriented input
 */

#include "certmon/utils/string_utils.h"

#include <algorithm>
#include <cctype>

namespace certmon {
namespace utils {

namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::string trim(const std::string& str) {
    auto first = std::find_if_not(str.begin(), str.end(), isSpace);
    auto last = std::find_if_not(str.rbegin(), str.rend(), isSpace).base();
    return first < last ? std::string(first, last) : std::string();
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t pos = str.find(delimiter, start);
        if (pos == std::string::npos) {
            fields.push_back(str.substr(start));
            return fields;
        }
        fields.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    size_t i = 0;

    while (i < text.size()) {
        if (text[i] != '\r' && text[i] != '\n') {
            ++i;
            continue;
        }
        lines.push_back(text.substr(start, i - start));
        // "\r\n" is a single terminator
        i += (text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') ? 2 : 1;
        start = i;
    }

    if (start < text.size()) {
        lines.push_back(text.substr(start));
    }
    return lines;
}

std::vector<std::string> splitWhitespace(const std::string& str) {
    std::vector<std::string> tokens;
    auto it = str.begin();
    while (true) {
        it = std::find_if_not(it, str.end(), isSpace);
        if (it == str.end()) break;
        auto end = std::find_if(it, str.end(), isSpace);
        tokens.emplace_back(it, end);
        it = end;
    }
    return tokens;
}

bool isDigits(const std::string& str) {
    return !str.empty() &&
           std::all_of(str.begin(), str.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace utils
} // namespace certmon
