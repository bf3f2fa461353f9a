/**
 * @file check_coordinator.cpp
 * @brief Concurrent check coordination implementation
 */

#include "certmon/check/check_coordinator.h"
#include "certmon/check/outcome_classifier.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <thread>

#include <spdlog/spdlog.h>

namespace certmon::check {

namespace {

using SteadyClock = std::chrono::steady_clock;

constexpr int MAX_NETWORK_RETRIES = 3;
constexpr size_t MAX_PARALLEL = 256;

/// Shared between the coordinator and its workers
struct RunState {
    std::vector<CheckTarget> targets;
    std::vector<std::optional<DomainOutcome>> slots;
    std::atomic<size_t> nextIndex{0};

    std::mutex mutex;
    std::condition_variable cv;
    size_t completed = 0;  // guarded by mutex
    bool closed = false;   // guarded by mutex; set once results are collected
};

DomainOutcome timeoutOutcome(const CheckTarget& target) {
    return DomainOutcome::issue(target.domain, target.port, IssueReason::networkError("timeout"));
}

DomainOutcome checkTarget(ICertificateProbe& probe,
                          const CheckTarget& target,
                          TimePoint now,
                          SteadyClock::time_point deadline,
                          const CoordinatorOptions& options) {
    std::optional<ProbeResult> last;
    int attempt = 0;

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - SteadyClock::now());
        if (remaining.count() <= 0) {
            // Keep the real network error if a retry ran out of time
            return last ? classifyOutcome(target, *last, now) : timeoutOutcome(target);
        }

        ProbeResult result;
        try {
            result = probe.probe(target, std::min(options.probeTimeout, remaining));
        } catch (const std::exception& e) {
            spdlog::error("[CheckCoordinator] Probe failed for {}: {}", target.endpoint(), e.what());
            result = ProbeResult::networkError(std::string("probe failure: ") + e.what());
        }

        if (result.status == ProbeStatus::NETWORK_ERROR && attempt < options.networkRetries) {
            ++attempt;
            spdlog::warn("[CheckCoordinator] {} network error ({}), retry {}/{}",
                         target.endpoint(), result.error, attempt, options.networkRetries);
            last = std::move(result);
            continue;
        }

        return classifyOutcome(target, result, now);
    }
}

void workerLoop(std::shared_ptr<RunState> state,
                std::shared_ptr<ICertificateProbe> probe,
                CoordinatorOptions options,
                TimePoint now,
                SteadyClock::time_point deadline) {
    const size_t total = state->targets.size();

    while (true) {
        size_t index = state->nextIndex.fetch_add(1);
        if (index >= total) {
            break;
        }

        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->closed) break;
        }

        const CheckTarget& target = state->targets[index];
        spdlog::debug("[CheckCoordinator] Checking {} (line {})", target.endpoint(), target.lineNumber);

        DomainOutcome outcome = checkTarget(*probe, target, now, deadline, options);

        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->closed) {
                spdlog::debug("[CheckCoordinator] Discarding late result for {}", target.endpoint());
                break;
            }
            state->slots[index] = std::move(outcome);
            ++state->completed;
        }
        state->cv.notify_all();
    }
}

} // namespace

CheckCoordinator::CheckCoordinator(std::shared_ptr<ICertificateProbe> probe, CoordinatorOptions options)
    : probe_(std::move(probe))
    , options_(options)
{
    if (!probe_) {
        throw std::invalid_argument("CheckCoordinator: probe cannot be nullptr");
    }
    if (options_.maxParallel == 0 || options_.maxParallel > MAX_PARALLEL) {
        throw std::invalid_argument("CheckCoordinator: maxParallel must be in 1.." + std::to_string(MAX_PARALLEL));
    }
    if (options_.probeTimeout.count() <= 0 || options_.overallDeadline.count() <= 0) {
        throw std::invalid_argument("CheckCoordinator: timeouts must be positive");
    }
    if (options_.networkRetries < 0 || options_.networkRetries > MAX_NETWORK_RETRIES) {
        throw std::invalid_argument("CheckCoordinator: networkRetries must be in 0.." + std::to_string(MAX_NETWORK_RETRIES));
    }
}

std::vector<DomainOutcome> CheckCoordinator::run(const std::vector<CheckTarget>& targets, TimePoint now) {
    const size_t total = targets.size();
    if (total == 0) {
        spdlog::info("[CheckCoordinator] No targets configured");
        return {};
    }

    auto deadline = SteadyClock::now() + options_.overallDeadline;

    auto state = std::make_shared<RunState>();
    state->targets = targets;
    state->slots.resize(total);

    size_t workerCount = std::min(options_.maxParallel, total);
    spdlog::info("[CheckCoordinator] Checking {} target(s) with {} worker(s), deadline {}ms",
                 total, workerCount, options_.overallDeadline.count());

    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (size_t i = 0; i < workerCount; ++i) {
        try {
            workers.emplace_back(workerLoop, state, probe_, options_, now, deadline);
        } catch (const std::system_error& e) {
            spdlog::error("[CheckCoordinator] Failed to start worker {}/{}: {}", i + 1, workerCount, e.what());
            break;
        }
    }

    if (workers.empty()) {
        spdlog::warn("[CheckCoordinator] No worker threads available, checking sequentially");
        workerLoop(state, probe_, options_, now, deadline);
    }

    std::vector<DomainOutcome> outcomes;
    outcomes.reserve(total);
    bool finished = false;
    size_t pending = 0;
    {
        std::unique_lock<std::mutex> lock(state->mutex);
        finished = state->cv.wait_until(lock, deadline, [&state, total] {
            return state->completed == total;
        });
        state->closed = true;

        for (size_t i = 0; i < total; ++i) {
            if (state->slots[i]) {
                outcomes.push_back(*state->slots[i]);
            } else {
                outcomes.push_back(timeoutOutcome(state->targets[i]));
                ++pending;
            }
        }
    }

    if (!finished) {
        spdlog::warn("[CheckCoordinator] Overall deadline reached with {} target(s) pending", pending);
    }

    // Each attempt ends by the deadline; pending workers finish right after it
    for (auto& worker : workers) {
        worker.join();
    }

    spdlog::info("[CheckCoordinator] Completed {} target(s)", total);
    return outcomes;
}

} // namespace certmon::check
