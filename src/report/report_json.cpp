/**
 * @file report_json.cpp
 * @brief Report and status document JSON implementation
 */

#include "certmon/report/report_json.h"
#include "certmon/check/report_aggregator.h"
#include "certmon/common/exceptions.h"
#include "certmon/utils/time_utils.h"

#include <limits>
#include <memory>
#include <sstream>

namespace certmon::report {

namespace {

const char* const KEY_VALID = "Valid";
const char* const KEY_INVALID = "Invalid";

Json::Value parseDocument(const std::string& json) {
    Json::CharReaderBuilder reader;
    reader["collectComments"] = false;

    Json::Value root;
    std::string errs;
    std::istringstream iss(json);
    if (!Json::parseFromStream(reader, iss, &root, &errs)) {
        throw common::ReportFormatException("invalid JSON: " + errs);
    }
    return root;
}

std::string requireString(const Json::Value& obj, const char* key) {
    if (!obj.isMember(key) || !obj[key].isString()) {
        throw common::ReportFormatException(std::string("missing or non-string field '") + key + "'");
    }
    return obj[key].asString();
}

check::TimePoint requireTime(const Json::Value& obj, const char* key) {
    auto tp = utils::parseIso8601(requireString(obj, key));
    if (!tp) {
        throw common::ReportFormatException(std::string("field '") + key + "' is not an ISO 8601 UTC time");
    }
    return *tp;
}

} // namespace

// --- Report ---

std::string reportToJson(const check::Report& report) {
    Json::Value root(Json::objectValue);
    if (report.isValid()) {
        root[KEY_VALID] = Json::Value(Json::nullValue);
    } else {
        root[KEY_INVALID] = report.message();
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, root);
}

check::Report reportFromJson(const std::string& json) {
    Json::Value root = parseDocument(json);
    if (!root.isObject() || root.size() != 1) {
        throw common::ReportFormatException("report must be an object with exactly one key");
    }

    if (root.isMember(KEY_VALID)) {
        if (!root[KEY_VALID].isNull()) {
            throw common::ReportFormatException("'Valid' must be null");
        }
        return check::Report::valid();
    }

    if (root.isMember(KEY_INVALID)) {
        const Json::Value& msg = root[KEY_INVALID];
        if (!msg.isString() || msg.asString().empty()) {
            throw common::ReportFormatException("'Invalid' must be a non-empty string");
        }
        return check::Report::invalid(msg.asString());
    }

    throw common::ReportFormatException("unknown report variant '" + root.getMemberNames().front() + "'");
}

// --- Status document ---

Json::Value outcomeToJson(const check::DomainOutcome& outcome) {
    Json::Value entry(Json::objectValue);
    entry["domain"] = outcome.domain();
    entry["port"] = outcome.port();
    entry["valid"] = outcome.isHealthy();

    if (outcome.isHealthy()) {
        entry["error"] = Json::Value(Json::nullValue);
        return entry;
    }

    const check::IssueReason& reason = outcome.reason();
    entry["error"] = check::renderReason(reason);
    entry["kind"] = check::issueKindToString(reason.kind);

    switch (reason.kind) {
        case check::IssueKind::NETWORK_ERROR:
        case check::IssueKind::HANDSHAKE_ERROR:
            entry["detail"] = reason.detail;
            break;
        case check::IssueKind::EXPIRED:
            entry["not_after"] = utils::formatIso8601(reason.notAfter);
            break;
        case check::IssueKind::NEAR_EXPIRY:
            entry["not_after"] = utils::formatIso8601(reason.notAfter);
            entry["days_left"] = reason.daysLeft;
            break;
    }
    return entry;
}

check::DomainOutcome outcomeFromJson(const Json::Value& value) {
    if (!value.isObject()) {
        throw common::ReportFormatException("status entry must be an object");
    }

    std::string domain = requireString(value, "domain");

    uint16_t port = check::DEFAULT_PORT;
    if (value.isMember("port")) {
        const Json::Value& p = value["port"];
        if (!p.isIntegral() || p.asInt64() < 1 || p.asInt64() > std::numeric_limits<uint16_t>::max()) {
            throw common::ReportFormatException("invalid port for '" + domain + "'");
        }
        port = static_cast<uint16_t>(p.asInt64());
    }

    if (!value.isMember("valid") || !value["valid"].isBool()) {
        throw common::ReportFormatException("missing or non-boolean 'valid' for '" + domain + "'");
    }
    if (value["valid"].asBool()) {
        return check::DomainOutcome::healthy(domain, port);
    }

    auto kind = check::issueKindFromString(requireString(value, "kind"));
    if (!kind) {
        throw common::ReportFormatException("unknown issue kind for '" + domain + "'");
    }

    check::IssueReason reason;
    switch (*kind) {
        case check::IssueKind::NETWORK_ERROR:
            reason = check::IssueReason::networkError(requireString(value, "detail"));
            break;
        case check::IssueKind::HANDSHAKE_ERROR:
            reason = check::IssueReason::handshakeError(requireString(value, "detail"));
            break;
        case check::IssueKind::EXPIRED:
            reason = check::IssueReason::expired(requireTime(value, "not_after"));
            break;
        case check::IssueKind::NEAR_EXPIRY: {
            if (!value.isMember("days_left") || !value["days_left"].isInt()) {
                throw common::ReportFormatException("missing or non-integer 'days_left' for '" + domain + "'");
            }
            reason = check::IssueReason::nearExpiry(requireTime(value, "not_after"), value["days_left"].asInt());
            break;
        }
    }
    return check::DomainOutcome::issue(domain, port, reason);
}

std::string checkRunToJson(const check::CheckRun& run) {
    Json::Value root(Json::objectValue);
    root["req_id"] = run.runId;
    root["checked_at"] = utils::formatIso8601(run.checkedAt);

    Json::Value statuses(Json::arrayValue);
    for (const auto& outcome : run.outcomes) {
        statuses.append(outcomeToJson(outcome));
    }
    root["statuses"] = statuses;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, root);
}

check::CheckRun checkRunFromJson(const std::string& json) {
    Json::Value root = parseDocument(json);
    if (!root.isObject()) {
        throw common::ReportFormatException("status document must be an object");
    }

    check::CheckRun run;
    run.runId = root.isMember("req_id") && root["req_id"].isString() ? root["req_id"].asString() : "";
    if (root.isMember("checked_at")) {
        run.checkedAt = requireTime(root, "checked_at");
    }

    const Json::Value& statuses = root["statuses"];
    if (!statuses.isArray()) {
        throw common::ReportFormatException("'statuses' must be an array");
    }
    for (Json::ArrayIndex i = 0; i < statuses.size(); ++i) {
        run.outcomes.push_back(outcomeFromJson(statuses[i]));
    }
    return run;
}

std::vector<check::DomainOutcome> statusesFromJson(const std::string& json) {
    return checkRunFromJson(json).outcomes;
}

} // namespace certmon::report
