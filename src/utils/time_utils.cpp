/**
 * @file time_utils.cpp
 * @brief Time and ASN.1 conversion utilities implementation
 */

#include "certmon/utils/time_utils.h"

#include <cstdio>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace certmon {
namespace utils {

std::optional<std::chrono::system_clock::time_point> asn1TimeToTimePoint(const ASN1_TIME* asn1Time) {
    if (!asn1Time) {
        return std::nullopt;
    }

    struct tm tmTime;
    std::memset(&tmTime, 0, sizeof(tmTime));

    // ASN1_TIME_to_tm normalizes UTCTime (two-digit year) and GeneralizedTime
    if (ASN1_TIME_to_tm(asn1Time, &tmTime) != 1) {
        return std::nullopt;
    }

    std::time_t t = timegm(&tmTime);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }

    return std::chrono::system_clock::from_time_t(t);
}

std::string formatIso8601(const std::chrono::system_clock::time_point& tp) {
    // Floor to whole seconds so pre-epoch values format consistently
    auto secs = std::chrono::floor<std::chrono::seconds>(tp.time_since_epoch());
    std::time_t timeValue = static_cast<std::time_t>(secs.count());

    struct tm tmTime;
    if (!gmtime_r(&timeValue, &tmTime)) {
        return "";
    }

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << (tmTime.tm_year + 1900) << '-'
        << std::setw(2) << (tmTime.tm_mon + 1) << '-'
        << std::setw(2) << tmTime.tm_mday << 'T'
        << std::setw(2) << tmTime.tm_hour << ':'
        << std::setw(2) << tmTime.tm_min << ':'
        << std::setw(2) << tmTime.tm_sec << 'Z';

    return oss.str();
}

std::optional<std::chrono::system_clock::time_point> parseIso8601(const std::string& iso8601) {
    if (iso8601.size() != 20 || iso8601[19] != 'Z') {
        return std::nullopt;
    }

    struct tm tmTime;
    std::memset(&tmTime, 0, sizeof(tmTime));

    char sep1 = 0, sep2 = 0, sepT = 0, sep3 = 0, sep4 = 0;
    int scanned = std::sscanf(iso8601.c_str(), "%4d%c%2d%c%2d%c%2d%c%2d%c%2d",
                              &tmTime.tm_year, &sep1, &tmTime.tm_mon, &sep2, &tmTime.tm_mday,
                              &sepT, &tmTime.tm_hour, &sep3, &tmTime.tm_min, &sep4, &tmTime.tm_sec);
    if (scanned != 11 || sep1 != '-' || sep2 != '-' || sepT != 'T' || sep3 != ':' || sep4 != ':') {
        return std::nullopt;
    }

    if (tmTime.tm_mon < 1 || tmTime.tm_mon > 12 || tmTime.tm_mday < 1 || tmTime.tm_mday > 31 ||
        tmTime.tm_hour > 23 || tmTime.tm_min > 59 || tmTime.tm_sec > 60) {
        return std::nullopt;
    }

    tmTime.tm_year -= 1900;
    tmTime.tm_mon -= 1;
    tmTime.tm_isdst = 0;

    std::time_t t = timegm(&tmTime);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }

    return std::chrono::system_clock::from_time_t(t);
}

int floorDays(std::chrono::system_clock::duration d) {
    using Days = std::chrono::duration<int64_t, std::ratio<86400>>;
    return static_cast<int>(std::chrono::floor<Days>(d).count());
}

} // namespace utils
} // namespace certmon
