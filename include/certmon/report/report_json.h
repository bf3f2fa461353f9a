/**
 * @file report_json.h
 * @brief JSON rendering and parsing of Reports and status documents
 *
 * Report wire form (compact, no whitespace):
 *   {"Valid":null}
 *   {"Invalid":"Found 1 issues.\nexample.com: expired (not_after=...)"}
 *
 * Status document (one per check run, pretty-printed):
 *   {
 *     "req_id": "<uuid>",
 *     "checked_at": "2026-10-18T00:00:00Z",
 *     "statuses": [
 *       {"domain": "a.example", "port": 443, "valid": true, "error": null},
 *       {"domain": "b.example", "port": 443, "valid": false,
 *        "error": "expired (not_after=...)", "kind": "EXPIRED", "not_after": "..."}
 *     ]
 *   }
 */

#pragma once

#include <string>
#include <vector>

#include <json/json.h>

#include "certmon/check/types.h"

namespace certmon::report {

/// @brief Compact JSON for a Report
std::string reportToJson(const check::Report& report);

/**
 * @brief Parse a Report produced by reportToJson
 * @throws common::ReportFormatException on any other shape
 */
check::Report reportFromJson(const std::string& json);

/// @brief JSON value for one outcome in a status document
Json::Value outcomeToJson(const check::DomainOutcome& outcome);

/**
 * @brief Rebuild an outcome from its status document entry
 * @throws common::ReportFormatException if required fields are missing or invalid
 */
check::DomainOutcome outcomeFromJson(const Json::Value& value);

/// @brief Pretty-printed status document for a check run
std::string checkRunToJson(const check::CheckRun& run);

/**
 * @brief Parse a status document produced by checkRunToJson
 * @throws common::ReportFormatException on malformed input
 */
check::CheckRun checkRunFromJson(const std::string& json);

/**
 * @brief Outcomes of a status document, in document order
 * @throws common::ReportFormatException on malformed input
 */
std::vector<check::DomainOutcome> statusesFromJson(const std::string& json);

} // namespace certmon::report
