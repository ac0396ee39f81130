// Copyright 2025 The QOMS Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <qoms/config/QomsConfig.h>
#include <qoms/scheduler/PriorityTier.h>
#include <qoms/scheduler/ResourceMonitor.h>

#include <utility>  // Boost 1.74 asio/awaitable.hpp uses std::exchange without including it

#include <boost/asio/awaitable.hpp>

#include <chrono>
#include <functional>
#include <string_view>

namespace qoms {

/**
 * @brief CPU/RAM threshold gate deciding whether a tier may start work now.
 *
 * - Critical is always admitted.
 * - Other tiers are refused while CPU or RAM is above its ceiling.
 * - Idle additionally requires a near-idle host (below the idle thresholds).
 */
class AdmissionPolicy {
public:
    AdmissionPolicy(const QomsConfig& config, ResourceMonitor& monitor);

    /// Pure decision against a given snapshot.
    [[nodiscard]] bool admits(PriorityTier tier, const ResourceSnapshot& snap) const noexcept;

    /// Samples the monitor (cached) and decides.
    [[nodiscard]] bool canExecute(PriorityTier tier, std::string_view opId = {});

    /**
     * @brief Polls canExecute() every check interval until admitted.
     *
     * Must be awaited on an executor that supports steady timers. Returns
     * false when maxWait elapses, or early once keepWaiting() returns false
     * (shutdown, or the caller no longer wants this tier admitted).
     */
    boost::asio::awaitable<bool> waitForResources(PriorityTier tier,
                                                  std::chrono::milliseconds maxWait,
                                                  std::function<bool()> keepWaiting,
                                                  std::string_view opId = {});

private:
    const QomsConfig& config_;
    ResourceMonitor& monitor_;
};

} // namespace qoms
