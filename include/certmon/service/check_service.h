/**
 * @file check_service.h
 * @brief One end-to-end check invocation
 *
 * load target text -> parse -> coordinate probes -> aggregate -> publish
 */

#pragma once

#include "certmon/check/check_coordinator.h"
#include "certmon/check/providers.h"
#include "certmon/check/target_parser.h"
#include "certmon/check/types.h"

namespace certmon::service {

/// @brief Everything one invocation produced
struct CheckResult {
    check::CheckRun run;
    check::Report report;
};

class CheckService {
public:
    /**
     * @brief Constructor
     * @param source Target list source (non-owning)
     * @param sink Report destination (non-owning)
     * @param coordinator Coordinator with its probe (non-owning)
     * @param defaults Port and threshold for lines without overrides
     * @throws std::invalid_argument if any pointer is nullptr
     */
    CheckService(check::IConfigSource* source,
                 check::IReportSink* sink,
                 check::CheckCoordinator* coordinator,
                 check::TargetDefaults defaults = {});

    /**
     * @brief Run one invocation
     *
     * A malformed target list aborts before any probe runs and nothing is
     * published. Per-domain failures never abort.
     *
     * @param now Reference time for expiry evaluation
     * @throws common::SourceException if the target text cannot be loaded
     * @throws common::ConfigException if the target text is malformed
     * @throws common::SinkException if the report cannot be delivered
     */
    CheckResult execute(check::TimePoint now);

private:
    check::IConfigSource* source_;
    check::IReportSink* sink_;
    check::CheckCoordinator* coordinator_;
    check::TargetDefaults defaults_;
};

} // namespace certmon::service
