// Copyright 2025 The QOMS Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <qoms/scheduler/ResourceMonitor.h>

#include <atomic>
#include <cstdint>
#include <mutex>

namespace qoms::test {

// Scripted probe: every read advances the CPU counters by 1000 ticks, of
// which cpuPercent * 10 are busy, so consecutive samples report exactly the
// configured CPU load. RAM is reported as a straight percentage of 16 GiB.
class FakeResourceProbe final : public ResourceProbe {
public:
    static constexpr std::uint64_t kTotalBytes = 16ull * 1024 * 1024 * 1024;

    void setCpu(double percent) {
        std::lock_guard<std::mutex> lock(mutex_);
        cpu_ = percent;
    }

    void setRam(double percent) {
        std::lock_guard<std::mutex> lock(mutex_);
        ram_ = percent;
    }

    void setFailing(bool failing) { failing_.store(failing); }

    int reads() const { return reads_.load(); }

    Result<ResourceReading> read() override {
        ++reads_;
        if (failing_.load()) {
            return Error{ErrorCode::ResourceUnavailable, "probe offline"};
        }
        std::lock_guard<std::mutex> lock(mutex_);
        total_ += 1000;
        busy_ += static_cast<std::uint64_t>(cpu_ * 10.0);
        ResourceReading r;
        r.cpuBusyTicks = busy_;
        r.cpuTotalTicks = total_;
        r.memTotalBytes = kTotalBytes;
        r.memAvailableBytes =
            static_cast<std::uint64_t>(static_cast<double>(kTotalBytes) * (100.0 - ram_) / 100.0);
        r.loadAvg1m = 0.5;
        return r;
    }

private:
    std::mutex mutex_;
    double cpu_{0.0};
    double ram_{0.0};
    std::uint64_t busy_{0};
    std::uint64_t total_{0};
    std::atomic<bool> failing_{false};
    std::atomic<int> reads_{0};
};

} // namespace qoms::test
