// Copyright 2025 The QOMS Authors
// SPDX-License-Identifier: Apache-2.0

#include <qoms/scheduler/ResourceMonitor.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>

namespace qoms {

namespace {

constexpr std::uint64_t kBytesPerMB = 1024ull * 1024ull;

#if defined(__linux__)
// Aggregate "cpu" line of /proc/stat. iowait counts as idle time.
bool readCpuTicks(std::uint64_t& busy, std::uint64_t& total) {
    std::ifstream sstat("/proc/stat");
    if (!sstat.is_open()) {
        return false;
    }
    std::string cpu;
    std::getline(sstat, cpu);
    if (cpu.rfind("cpu ", 0) != 0) {
        return false;
    }
    std::istringstream iss(cpu.substr(4));
    std::uint64_t user = 0, nice = 0, system = 0, idle = 0, iowait = 0, irq = 0, softirq = 0,
                  steal = 0;
    iss >> user >> nice >> system >> idle >> iowait >> irq >> softirq >> steal;
    if (iss.fail() && !iss.eof()) {
        return false;
    }
    total = user + nice + system + idle + iowait + irq + softirq + steal;
    busy = total - idle - iowait;
    return total > 0;
}

bool readMemInfo(std::uint64_t& totalBytes, std::uint64_t& availableBytes) {
    std::FILE* f = std::fopen("/proc/meminfo", "r");
    if (!f) {
        return false;
    }
    unsigned long totalKb = 0;
    unsigned long availKb = 0;
    unsigned long freeKb = 0;
    bool haveAvail = false;
    char line[256];
    while (std::fgets(line, sizeof(line), f)) {
        if (std::strncmp(line, "MemTotal:", 9) == 0) {
            std::sscanf(line + 9, " %lu", &totalKb);
        } else if (std::strncmp(line, "MemAvailable:", 13) == 0) {
            haveAvail = std::sscanf(line + 13, " %lu", &availKb) == 1;
        } else if (std::strncmp(line, "MemFree:", 8) == 0) {
            std::sscanf(line + 8, " %lu", &freeKb);
        }
    }
    std::fclose(f);
    if (totalKb == 0) {
        return false;
    }
    totalBytes = static_cast<std::uint64_t>(totalKb) * 1024ull;
    availableBytes = static_cast<std::uint64_t>(haveAvail ? availKb : freeKb) * 1024ull;
    return true;
}
#endif

} // namespace

Result<ResourceReading> SystemResourceProbe::read() {
#if defined(__linux__)
    ResourceReading reading;
    if (!readCpuTicks(reading.cpuBusyTicks, reading.cpuTotalTicks)) {
        return Error{ErrorCode::ResourceUnavailable, "cannot read /proc/stat"};
    }
    if (!readMemInfo(reading.memTotalBytes, reading.memAvailableBytes)) {
        return Error{ErrorCode::ResourceUnavailable, "cannot read /proc/meminfo"};
    }
    double loads[3] = {0.0, 0.0, 0.0};
    if (getloadavg(loads, 3) >= 1) {
        reading.loadAvg1m = loads[0];
    }
    return reading;
#else
    return Error{ErrorCode::ResourceUnavailable, "resource probing is only implemented on Linux"};
#endif
}

ResourceMonitor::ResourceMonitor(std::shared_ptr<ResourceProbe> probe,
                                 std::chrono::milliseconds cacheTtl)
    : probe_(std::move(probe)), cacheTtl_(cacheTtl) {
    if (!probe_) {
        probe_ = std::make_shared<SystemResourceProbe>();
    }
}

ResourceSnapshot ResourceMonitor::sample() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = SteadyClock::now();
    if (cached_ && now - cached_->sampledAt < cacheTtl_) {
        return *cached_;
    }

    auto reading = probe_->read();
    if (!reading) {
        if (!degraded_) {
            spdlog::warn("[ResourceMonitor] Sampling unavailable ({}); admitting all work",
                         reading.error().message);
            degraded_ = true;
        }
        ResourceSnapshot snap;
        snap.available = false;
        snap.sampledAt = now;
        cpuBaseline_.reset();
        cached_ = snap;
        return snap;
    }
    if (degraded_) {
        spdlog::info("[ResourceMonitor] Sampling recovered");
        degraded_ = false;
    }

    cached_ = computeSnapshot(reading.value(), now);
    return *cached_;
}

ResourceSnapshot ResourceMonitor::latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cached_.value_or(ResourceSnapshot{});
}

void ResourceMonitor::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    cached_.reset();
}

ResourceSnapshot ResourceMonitor::computeSnapshot(const ResourceReading& reading, SteadyTime now) {
    ResourceSnapshot snap;
    snap.sampledAt = now;
    snap.loadAvg1m = reading.loadAvg1m;

    // First sample, or a baseline too old to be representative: report 0% and
    // re-seed the baseline.
    const bool haveBaseline = cpuBaseline_ && now - cpuBaselineAt_ <= kCpuBaselineMaxAge &&
                              reading.cpuTotalTicks >= cpuBaseline_->cpuTotalTicks &&
                              reading.cpuBusyTicks >= cpuBaseline_->cpuBusyTicks;
    if (haveBaseline) {
        const auto dTotal = reading.cpuTotalTicks - cpuBaseline_->cpuTotalTicks;
        const auto dBusy = reading.cpuBusyTicks - cpuBaseline_->cpuBusyTicks;
        if (dTotal > 0) {
            snap.cpuPercent = std::round(static_cast<double>(dBusy) /
                                         static_cast<double>(dTotal) * 100.0);
        }
    }
    cpuBaseline_ = reading;
    cpuBaselineAt_ = now;

    if (reading.memTotalBytes > 0) {
        const auto avail = std::min(reading.memAvailableBytes, reading.memTotalBytes);
        const auto used = reading.memTotalBytes - avail;
        snap.ramPercent = std::round(static_cast<double>(used) /
                                     static_cast<double>(reading.memTotalBytes) * 100.0);
        snap.freeRamMB = avail / kBytesPerMB;
        snap.totalRamMB = reading.memTotalBytes / kBytesPerMB;
    }
    return snap;
}

} // namespace qoms
