/**
 * @file main.cpp
 * @brief cert-monitor command line entry point
 *
 * Usage:
 *   cert-monitor check [--targets FILE] [--threshold-days N] [--parallel N]
 *                      [--timeout SEC] [--deadline SEC] [--retries N]
 *                      [--ca-file FILE] [--report FILE] [--statuses FILE]
 *                      [--log-level LEVEL]
 *   cert-monitor aggregate --statuses FILE [--report FILE] [--log-level LEVEL]
 *
 * Exit codes: 0 report Valid, 1 report Invalid, 2 invocation failure.
 */

#include "certmon/check/check_coordinator.h"
#include "certmon/check/report_aggregator.h"
#include "certmon/common/config_manager.h"
#include "certmon/common/exceptions.h"
#include "certmon/common/logger.h"
#include "certmon/io/config_sources.h"
#include "certmon/io/report_sinks.h"
#include "certmon/report/report_json.h"
#include "certmon/service/app_config.h"
#include "certmon/service/check_service.h"
#include "certmon/tls/tls_certificate_probe.h"

#include <csignal>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

using namespace certmon;

namespace {

constexpr int EXIT_VALID = 0;
constexpr int EXIT_INVALID = 1;
constexpr int EXIT_FAILURE_INVOCATION = 2;

const std::map<std::string, const char*> CHECK_FLAGS = {
    {"--targets", common::ConfigManager::TARGETS_FILE},
    {"--threshold-days", common::ConfigManager::EXPIRY_THRESHOLD_DAYS},
    {"--parallel", common::ConfigManager::MAX_PARALLEL},
    {"--timeout", common::ConfigManager::PROBE_TIMEOUT_SEC},
    {"--deadline", common::ConfigManager::DEADLINE_SEC},
    {"--retries", common::ConfigManager::NETWORK_RETRIES},
    {"--ca-file", common::ConfigManager::CA_FILE},
    {"--report", common::ConfigManager::REPORT_FILE},
    {"--statuses", common::ConfigManager::STATUSES_FILE},
    {"--log-level", common::ConfigManager::LOG_LEVEL},
};

const std::map<std::string, const char*> AGGREGATE_FLAGS = {
    {"--statuses", common::ConfigManager::STATUSES_FILE},
    {"--report", common::ConfigManager::REPORT_FILE},
    {"--log-level", common::ConfigManager::LOG_LEVEL},
};

void printUsage(const char* program) {
    std::cerr << "Usage:\n"
              << "  " << program << " check [--targets FILE] [--threshold-days N] [--parallel N]\n"
              << "        [--timeout SEC] [--deadline SEC] [--retries N] [--ca-file FILE]\n"
              << "        [--report FILE] [--statuses FILE] [--log-level LEVEL]\n"
              << "  " << program << " aggregate --statuses FILE [--report FILE] [--log-level LEVEL]\n";
}

/**
 * Store "--flag value" pairs as explicit ConfigManager values so they take
 * precedence over the environment.
 */
void applyFlags(int argc, char** argv, const std::map<std::string, const char*>& flags) {
    auto& config = common::ConfigManager::getInstance();
    for (int i = 2; i < argc; ++i) {
        std::string flag = argv[i];
        auto it = flags.find(flag);
        if (it == flags.end()) {
            throw common::ConfigException("unknown option '" + flag + "'");
        }
        if (i + 1 >= argc) {
            throw common::ConfigException("option '" + flag + "' requires a value");
        }
        config.set(it->second, argv[++i]);
    }
}

std::unique_ptr<check::IReportSink> makeReportSink(const service::AppConfig& config) {
    if (config.reportFile.empty()) {
        return std::make_unique<io::StreamReportSink>(std::cout);
    }
    return std::make_unique<io::FileReportSink>(config.reportFile);
}

void writeStatuses(const std::string& path, const check::CheckRun& run) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw common::SinkException("cannot open '" + path + "' for writing");
    }
    file << report::checkRunToJson(run) << '\n';
    file.close();
    if (file.fail()) {
        throw common::SinkException("failed to write status document to '" + path + "'");
    }
    spdlog::info("Status document written to {}", path);
}

int exitCodeFor(const check::Report& report) {
    return report.isValid() ? EXIT_VALID : EXIT_INVALID;
}

service::AppConfig loadConfig() {
    service::AppConfig config;
    config.loadFromEnv();
    config.validate();
    common::Logger::initialize("cert-monitor", config.logLevel, !config.logFile.empty(), config.logFile);
    return config;
}

int runCheck() {
    service::AppConfig config = loadConfig();

    auto probe = std::make_shared<tls::TlsCertificateProbe>(config.probeOptions());
    check::CheckCoordinator coordinator(probe, config.coordinatorOptions());
    io::FileConfigSource source(config.targetsFile);
    auto sink = makeReportSink(config);

    service::CheckService checkService(&source, sink.get(), &coordinator, config.targetDefaults());
    service::CheckResult result = checkService.execute(check::Clock::now());

    if (!config.statusesFile.empty()) {
        writeStatuses(config.statusesFile, result.run);
    }
    return exitCodeFor(result.report);
}

int runAggregate() {
    service::AppConfig config = loadConfig();
    if (config.statusesFile.empty()) {
        throw common::ConfigException("aggregate requires --statuses FILE");
    }

    io::FileConfigSource source(config.statusesFile);
    std::vector<check::DomainOutcome> outcomes = report::statusesFromJson(source.load());
    spdlog::info("Aggregating {} status entr{} from {}", outcomes.size(),
                 outcomes.size() == 1 ? "y" : "ies", config.statusesFile);

    check::Report result = check::aggregateReport(outcomes);
    makeReportSink(config)->publish(result);
    return exitCodeFor(result);
}

} // namespace

int main(int argc, char** argv) {
    // A peer closing mid-handshake must not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    if (argc < 2) {
        printUsage(argv[0]);
        return EXIT_FAILURE_INVOCATION;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help") {
        printUsage(argv[0]);
        return EXIT_VALID;
    }

    try {
        int exitCode = EXIT_FAILURE_INVOCATION;
        if (command == "check") {
            applyFlags(argc, argv, CHECK_FLAGS);
            exitCode = runCheck();
        } else if (command == "aggregate") {
            applyFlags(argc, argv, AGGREGATE_FLAGS);
            exitCode = runAggregate();
        } else {
            std::cerr << "Unknown command: " << command << "\n";
            printUsage(argv[0]);
            return EXIT_FAILURE_INVOCATION;
        }
        common::Logger::flush();
        return exitCode;
    } catch (const common::CertMonException& e) {
        std::cerr << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
    }
    common::Logger::flush();
    return EXIT_FAILURE_INVOCATION;
}
