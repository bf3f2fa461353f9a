/**
 * @file target_parser.h
 * @brief Target list parsing (pure, no I/O)
 *
 * Line format:
 * @code
 *   # comment
 *   example.com
 *   example.org:8443
 *   example.net 30d       # threshold override (days)
 *   10.0.0.5:993 72h      # threshold override (hours)
 * @endcode
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "types.h"

namespace certmon::check {

/// @brief Values applied when a line does not override them
struct TargetDefaults {
    uint16_t port = DEFAULT_PORT;
    std::chrono::seconds expiryThreshold = DEFAULT_EXPIRY_THRESHOLD;
};

/**
 * @brief Parse a target list
 *
 * Blank lines and '#' comments are skipped. Accepts "\n", "\r\n" and
 * "\r" line endings and trailing whitespace. Targets are returned in
 * source order; duplicates are kept.
 *
 * @param text Raw target list text
 * @param defaults Port and threshold for lines without overrides
 * @return Parsed targets
 * @throws common::ConfigException on the first malformed line
 */
std::vector<CheckTarget> parseTargets(const std::string& text, const TargetDefaults& defaults = {});

/**
 * @brief Parse one target line
 *
 * @param line Line text (without terminator)
 * @param lineNumber 1-based line number, used in error messages
 * @param defaults Port and threshold for missing overrides
 * @return Target, or std::nullopt for blank/comment lines
 * @throws common::ConfigException if the line is malformed
 */
std::optional<CheckTarget> parseTargetLine(
    const std::string& line, int lineNumber, const TargetDefaults& defaults = {});

/**
 * @brief Parse a threshold token: "30", "30d" (days) or "72h" (hours)
 * @return Duration, or std::nullopt if malformed
 */
std::optional<std::chrono::seconds> parseThreshold(const std::string& token);

/**
 * @brief Check a host name (RFC 1123 labels) or dotted IPv4 literal
 */
bool isValidHost(const std::string& host);

} // namespace certmon::check
