// Copyright 2025 The QOMS Authors
// SPDX-License-Identifier: Apache-2.0

#include <qoms/scheduler/AdmissionPolicy.h>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

namespace qoms {

AdmissionPolicy::AdmissionPolicy(const QomsConfig& config, ResourceMonitor& monitor)
    : config_(config), monitor_(monitor) {}

bool AdmissionPolicy::admits(PriorityTier tier, const ResourceSnapshot& snap) const noexcept {
    if (tier == PriorityTier::Critical) {
        return true;
    }
    if (snap.cpuPercent > config_.maxCpuPercent) {
        return false;
    }
    if (snap.ramPercent > config_.maxRamPercent) {
        return false;
    }
    if (tier == PriorityTier::Idle) {
        return snap.cpuPercent < config_.idleMaxCpuPercent &&
               snap.ramPercent < config_.idleMaxRamPercent;
    }
    return true;
}

bool AdmissionPolicy::canExecute(PriorityTier tier, std::string_view opId) {
    if (tier == PriorityTier::Critical) {
        return true;
    }
    const auto snap = monitor_.sample();
    const bool ok = admits(tier, snap);
    if (!ok) {
        spdlog::trace("[AdmissionPolicy] {} ({}) held back: cpu={}% ram={}%", opId,
                      tierName(tier), snap.cpuPercent, snap.ramPercent);
    }
    return ok;
}

boost::asio::awaitable<bool>
AdmissionPolicy::waitForResources(PriorityTier tier, std::chrono::milliseconds maxWait,
                                  std::function<bool()> keepWaiting, std::string_view opId) {
    const auto deadline = SteadyClock::now() + maxWait;
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);

    while (SteadyClock::now() < deadline) {
        if (keepWaiting && !keepWaiting()) {
            co_return false;
        }
        if (canExecute(tier, opId)) {
            co_return true;
        }
        timer.expires_after(config_.checkInterval);
        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
    co_return false;
}

} // namespace qoms
