/**
 * @file check_service.cpp
 * @brief One end-to-end check invocation
 */

#include "certmon/service/check_service.h"
#include "certmon/check/report_aggregator.h"
#include "certmon/utils/uuid_util.h"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace certmon::service {

CheckService::CheckService(check::IConfigSource* source,
                           check::IReportSink* sink,
                           check::CheckCoordinator* coordinator,
                           check::TargetDefaults defaults)
    : source_(source)
    , sink_(sink)
    , coordinator_(coordinator)
    , defaults_(defaults)
{
    if (!source_ || !sink_ || !coordinator_) {
        throw std::invalid_argument("CheckService: source, sink and coordinator are required");
    }
}

CheckResult CheckService::execute(check::TimePoint now) {
    std::string runId = utils::UuidUtil::generate();
    spdlog::info("[CheckService] Run {} loading targets from {}", runId, source_->describe());

    std::string text = source_->load();
    std::vector<check::CheckTarget> targets = check::parseTargets(text, defaults_);
    spdlog::info("[CheckService] Run {}: {} target(s)", runId, targets.size());

    check::CheckRun run;
    run.runId = runId;
    run.checkedAt = now;
    run.outcomes = coordinator_->run(targets, now);

    check::Report report = check::aggregateReport(run.outcomes);
    sink_->publish(report);

    spdlog::info("[CheckService] Run {} finished: {}", runId, report.isValid() ? "valid" : "invalid");
    return CheckResult{std::move(run), std::move(report)};
}

} // namespace certmon::service
