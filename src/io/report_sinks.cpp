/**
 * @file report_sinks.cpp
 * @brief IReportSink implementations
 */

#include "certmon/io/report_sinks.h"
#include "certmon/common/exceptions.h"
#include "certmon/report/report_json.h"

#include <fstream>

#include <spdlog/spdlog.h>

namespace certmon::io {

void StreamReportSink::publish(const check::Report& report) {
    out_ << report::reportToJson(report) << '\n';
    out_.flush();
    if (!out_) {
        throw common::SinkException("failed to write report to output stream");
    }
}

void FileReportSink::publish(const check::Report& report) {
    std::ofstream file(path_, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw common::SinkException("cannot open '" + path_ + "' for writing");
    }

    file << report::reportToJson(report) << '\n';
    file.close();
    if (file.fail()) {
        throw common::SinkException("failed to write report to '" + path_ + "'");
    }
    spdlog::info("[FileReportSink] Report written to {}", path_);
}

void MemoryReportSink::publish(const check::Report& report) {
    std::lock_guard<std::mutex> lock(mutex_);
    reports_.push_back(report);
}

std::vector<check::Report> MemoryReportSink::reports() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reports_;
}

size_t MemoryReportSink::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reports_.size();
}

} // namespace certmon::io
