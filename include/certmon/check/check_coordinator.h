/**
 * @file check_coordinator.h
 * @brief Concurrent fan-out of probes with bounded parallelism
 *
 * Each target is checked by a worker thread drawn from a pool of at most
 * maxParallel threads. Every check writes its outcome exactly once into
 * the slot for its target index; the coordinator returns outcomes in
 * target order once all slots are filled or the overall deadline passes.
 *
 * @author SmartCore Inc.
 * @date 2026-09-21
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <vector>

#include "providers.h"
#include "types.h"

namespace certmon::check {

/// @brief Coordinator limits
struct CoordinatorOptions {
    size_t maxParallel = 8;                              ///< In-flight probe cap
    std::chrono::milliseconds probeTimeout{10000};       ///< Per-attempt probe timeout
    std::chrono::milliseconds overallDeadline{60000};    ///< Whole-run deadline
    int networkRetries = 0;                              ///< Extra attempts for NETWORK_ERROR
};

/**
 * @brief Runs probe + evaluation + classification for every target
 *
 * Usage:
 * @code
 *   auto probe = std::make_shared<tls::TlsCertificateProbe>();
 *   CheckCoordinator coordinator(probe, options);
 *   std::vector<DomainOutcome> outcomes = coordinator.run(targets, Clock::now());
 * @endcode
 */
class CheckCoordinator {
public:
    /**
     * @brief Constructor
     * @param probe Probe shared with worker threads
     * @param options Concurrency and timeout limits
     * @throws std::invalid_argument if probe is nullptr or options are out of range
     */
    explicit CheckCoordinator(std::shared_ptr<ICertificateProbe> probe,
                              CoordinatorOptions options = {});

    /**
     * @brief Check all targets
     *
     * Never throws for per-domain failures. Targets still pending when the
     * overall deadline passes are reported as NETWORK_ERROR("timeout") and
     * their late results discarded. All worker threads are joined before
     * returning; the probe is expected to honour its timeout.
     *
     * @param targets Targets in report order
     * @param now Reference time for expiry evaluation (shared by all targets)
     * @return Exactly one outcome per target, in target order
     */
    std::vector<DomainOutcome> run(const std::vector<CheckTarget>& targets, TimePoint now);

    const CoordinatorOptions& options() const { return options_; }

private:
    std::shared_ptr<ICertificateProbe> probe_;
    CoordinatorOptions options_;
};

} // namespace certmon::check
