/**
 * @file report_sinks.h
 * @brief IReportSink implementations
 *
 * Every sink writes the compact Report JSON followed by a newline.
 */

#pragma once

#include <mutex>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "certmon/check/providers.h"

namespace certmon::io {

/**
 * @brief Writes the report to an output stream (stdout in the CLI)
 */
class StreamReportSink : public check::IReportSink {
public:
    explicit StreamReportSink(std::ostream& out) : out_(out) {}

    /// @throws common::SinkException if the stream fails
    void publish(const check::Report& report) override;

private:
    std::ostream& out_;
};

/**
 * @brief Writes the report to a file, replacing its contents
 */
class FileReportSink : public check::IReportSink {
public:
    explicit FileReportSink(std::string path) : path_(std::move(path)) {}

    /// @throws common::SinkException if the file cannot be written
    void publish(const check::Report& report) override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * @brief Keeps published reports in memory
 */
class MemoryReportSink : public check::IReportSink {
public:
    void publish(const check::Report& report) override;

    std::vector<check::Report> reports() const;
    size_t count() const;

private:
    mutable std::mutex mutex_;
    std::vector<check::Report> reports_;
};

} // namespace certmon::io
