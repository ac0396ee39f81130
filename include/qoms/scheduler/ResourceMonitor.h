// Copyright 2025 The QOMS Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// ResourceMonitor
// ---------------
// Samples host CPU and RAM utilization for admission control. CPU is the
// busy/total tick delta between two raw readings; RAM is used/total. Results
// are cached for a short TTL so that polling admission checks do not hit
// /proc on every call.

#include <qoms/core/types.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

namespace qoms {

/// Point-in-time view of host utilization.
struct ResourceSnapshot {
    double cpuPercent{0.0};
    double ramPercent{0.0};
    std::uint64_t freeRamMB{0};
    std::uint64_t totalRamMB{0};
    double loadAvg1m{0.0};
    bool available{true}; // false when the probe failed; usage fields are then zero
    SteadyTime sampledAt{};
};

/// Raw cumulative counters as read from the OS.
struct ResourceReading {
    std::uint64_t cpuBusyTicks{0};
    std::uint64_t cpuTotalTicks{0};
    std::uint64_t memTotalBytes{0};
    std::uint64_t memAvailableBytes{0};
    double loadAvg1m{0.0};
};

/**
 * @brief Source of raw resource counters.
 *
 * The scheduler only depends on this interface; tests substitute a probe
 * with scripted readings.
 */
class ResourceProbe {
public:
    virtual ~ResourceProbe() = default;
    virtual Result<ResourceReading> read() = 0;
};

/// Linux probe backed by /proc/stat, /proc/meminfo and getloadavg().
class SystemResourceProbe final : public ResourceProbe {
public:
    Result<ResourceReading> read() override;
};

class ResourceMonitor {
public:
    /// A CPU baseline older than this is discarded and the sample reports 0%.
    static constexpr std::chrono::milliseconds kCpuBaselineMaxAge{1000};

    ResourceMonitor(std::shared_ptr<ResourceProbe> probe, std::chrono::milliseconds cacheTtl);

    ResourceMonitor(const ResourceMonitor&) = delete;
    ResourceMonitor& operator=(const ResourceMonitor&) = delete;

    /**
     * @brief Returns the cached snapshot, re-reading the probe once the TTL
     * has elapsed.
     *
     * Never fails: a probe error produces a snapshot with available=false and
     * zero usage so that admission degrades to "always admit".
     */
    ResourceSnapshot sample();

    /// Last snapshot taken, without sampling. Zeroed before the first sample.
    [[nodiscard]] ResourceSnapshot latest() const;

    /// Drops the cached snapshot so the next sample() reads the probe.
    void invalidate();

private:
    ResourceSnapshot computeSnapshot(const ResourceReading& reading, SteadyTime now);

    std::shared_ptr<ResourceProbe> probe_;
    std::chrono::milliseconds cacheTtl_;

    mutable std::mutex mutex_;
    std::optional<ResourceSnapshot> cached_;
    std::optional<ResourceReading> cpuBaseline_;
    SteadyTime cpuBaselineAt_{};
    bool degraded_{false};
};

} // namespace qoms
