/**
 * @file target_parser.cpp
 * @brief Target list parsing implementation
 */

#include "certmon/check/target_parser.h"
#include "certmon/common/exceptions.h"
#include "certmon/utils/string_utils.h"

#include <cctype>
#include <limits>

namespace certmon::check {

namespace {

// Longest accepted numeric token; keeps stoul/stol far from overflow
constexpr size_t MAX_NUMBER_DIGITS = 6;
constexpr long MAX_THRESHOLD_DAYS = 3650;

std::string lineError(int lineNumber, const std::string& what, const std::string& line) {
    return "line " + std::to_string(lineNumber) + ": " + what + " in '" + utils::trim(line) + "'";
}

bool isIpv4Literal(const std::string& host) {
    auto parts = utils::split(host, '.');
    if (parts.size() != 4) return false;
    for (const auto& part : parts) {
        if (!utils::isDigits(part) || part.size() > 3) return false;
        if (std::stoi(part) > 255) return false;
    }
    return true;
}

bool isValidLabel(const std::string& label) {
    if (label.empty() || label.size() > 63) return false;
    if (label.front() == '-' || label.back() == '-') return false;
    for (char c : label) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '-') return false;
    }
    return true;
}

} // namespace

bool isValidHost(const std::string& host) {
    if (host.empty() || host.size() > 253) return false;

    bool allNumericLabels = true;
    for (const auto& label : utils::split(host, '.')) {
        if (!isValidLabel(label)) return false;
        if (!utils::isDigits(label)) allNumericLabels = false;
    }

    // "999.1.1.1" passes the label rules but is neither a name nor an address
    if (allNumericLabels) {
        return isIpv4Literal(host);
    }
    return true;
}

std::optional<std::chrono::seconds> parseThreshold(const std::string& token) {
    if (token.empty()) return std::nullopt;

    std::string digits = token;
    long unitSeconds = 24 * 3600;
    char suffix = token.back();
    if (suffix == 'd' || suffix == 'D') {
        digits = token.substr(0, token.size() - 1);
    } else if (suffix == 'h' || suffix == 'H') {
        digits = token.substr(0, token.size() - 1);
        unitSeconds = 3600;
    }

    if (!utils::isDigits(digits) || digits.size() > MAX_NUMBER_DIGITS) return std::nullopt;

    long value = std::stol(digits);
    if (value * unitSeconds > MAX_THRESHOLD_DAYS * 24 * 3600) return std::nullopt;

    return std::chrono::seconds(value * unitSeconds);
}

std::optional<CheckTarget> parseTargetLine(
    const std::string& line, int lineNumber, const TargetDefaults& defaults) {

    std::string content = line;
    size_t hash = content.find('#');
    if (hash != std::string::npos) {
        content = content.substr(0, hash);
    }

    auto tokens = utils::splitWhitespace(content);
    if (tokens.empty()) {
        return std::nullopt;
    }
    if (tokens.size() > 2) {
        throw common::ConfigException(lineError(lineNumber, "unexpected token '" + tokens[2] + "'", line));
    }

    CheckTarget target;
    target.port = defaults.port;
    target.expiryThreshold = defaults.expiryThreshold;
    target.lineNumber = lineNumber;

    std::string host = tokens[0];
    size_t colon = host.find(':');
    if (colon != std::string::npos) {
        std::string portText = host.substr(colon + 1);
        host = host.substr(0, colon);

        if (!utils::isDigits(portText) || portText.size() > MAX_NUMBER_DIGITS) {
            throw common::ConfigException(lineError(lineNumber, "invalid port '" + portText + "'", line));
        }
        unsigned long port = std::stoul(portText);
        if (port == 0 || port > std::numeric_limits<uint16_t>::max()) {
            throw common::ConfigException(lineError(lineNumber, "port out of range '" + portText + "'", line));
        }
        target.port = static_cast<uint16_t>(port);
    }

    // Fully-qualified form "example.com." names the same host
    if (host.size() > 1 && host.back() == '.') {
        host.pop_back();
    }

    if (!isValidHost(host)) {
        throw common::ConfigException(lineError(lineNumber, "invalid domain '" + host + "'", line));
    }
    target.domain = host;

    if (tokens.size() == 2) {
        auto threshold = parseThreshold(tokens[1]);
        if (!threshold) {
            throw common::ConfigException(lineError(lineNumber, "invalid threshold '" + tokens[1] + "'", line));
        }
        target.expiryThreshold = *threshold;
    }

    return target;
}

std::vector<CheckTarget> parseTargets(const std::string& text, const TargetDefaults& defaults) {
    std::vector<CheckTarget> targets;

    auto lines = utils::splitLines(text);
    for (size_t i = 0; i < lines.size(); ++i) {
        auto target = parseTargetLine(lines[i], static_cast<int>(i + 1), defaults);
        if (target) {
            targets.push_back(std::move(*target));
        }
    }

    return targets;
}

} // namespace certmon::check
