// Copyright 2025 The QOMS Authors
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <qoms/scheduler/AdmissionPolicy.h>

#include "fake_resource_probe.h"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_future.hpp>

#include <atomic>
#include <chrono>
#include <thread>

using namespace qoms;
using namespace std::chrono_literals;

namespace qoms::test {

namespace {

ResourceSnapshot snapshot(double cpu, double ram) {
    ResourceSnapshot s;
    s.cpuPercent = cpu;
    s.ramPercent = ram;
    return s;
}

} // namespace

class AdmissionPolicyTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.maxCpuPercent = 75;
        config_.maxRamPercent = 60;
        config_.idleMaxCpuPercent = 5;
        config_.idleMaxRamPercent = 15;
        config_.checkInterval = 10ms;
        config_.metricsCache = 0ms;
    }

    QomsConfig config_;
    std::shared_ptr<FakeResourceProbe> probe_ = std::make_shared<FakeResourceProbe>();
};

TEST_F(AdmissionPolicyTest, CriticalAlwaysAdmitted) {
    ResourceMonitor monitor(probe_, 0ms);
    AdmissionPolicy policy(config_, monitor);
    EXPECT_TRUE(policy.admits(PriorityTier::Critical, snapshot(100, 100)));

    probe_->setRam(99);
    EXPECT_TRUE(policy.canExecute(PriorityTier::Critical));
    EXPECT_EQ(probe_->reads(), 0) << "critical must not sample resources";
}

TEST_F(AdmissionPolicyTest, IdleAdmittedOnceAfterQuietPeriod) {
    // The first sample after a stale baseline reads 0% CPU, so a busy host
    // admits one Idle check; the next sample sees the real load.
    probe_->setCpu(90);
    probe_->setRam(10);
    ResourceMonitor monitor(probe_, 0ms);
    AdmissionPolicy policy(config_, monitor);

    EXPECT_TRUE(policy.canExecute(PriorityTier::Idle)) << "first sample has no baseline";
    EXPECT_FALSE(policy.canExecute(PriorityTier::Idle));

    std::this_thread::sleep_for(ResourceMonitor::kCpuBaselineMaxAge + 100ms);
    EXPECT_TRUE(policy.canExecute(PriorityTier::Idle));
    EXPECT_FALSE(policy.canExecute(PriorityTier::Idle));
    EXPECT_FALSE(policy.canExecute(PriorityTier::Low));
}

TEST_F(AdmissionPolicyTest, ThresholdsAreInclusive) {
    ResourceMonitor monitor(probe_, 0ms);
    AdmissionPolicy policy(config_, monitor);

    EXPECT_TRUE(policy.admits(PriorityTier::High, snapshot(75, 60)));
    EXPECT_FALSE(policy.admits(PriorityTier::High, snapshot(76, 10)));
    EXPECT_FALSE(policy.admits(PriorityTier::Medium, snapshot(10, 61)));
    EXPECT_TRUE(policy.admits(PriorityTier::Low, snapshot(0, 0)));
}

TEST_F(AdmissionPolicyTest, IdleRequiresNearIdleHost) {
    ResourceMonitor monitor(probe_, 0ms);
    AdmissionPolicy policy(config_, monitor);

    EXPECT_TRUE(policy.admits(PriorityTier::Idle, snapshot(4, 14)));
    EXPECT_FALSE(policy.admits(PriorityTier::Idle, snapshot(5, 10)));
    EXPECT_FALSE(policy.admits(PriorityTier::Idle, snapshot(2, 15)));
    EXPECT_FALSE(policy.admits(PriorityTier::Idle, snapshot(10, 40)));
    // Same snapshot is fine for Low
    EXPECT_TRUE(policy.admits(PriorityTier::Low, snapshot(10, 40)));
}

TEST_F(AdmissionPolicyTest, UnavailableSnapshotAdmitsEverything) {
    probe_->setFailing(true);
    ResourceMonitor monitor(probe_, 0ms);
    AdmissionPolicy policy(config_, monitor);
    EXPECT_TRUE(policy.canExecute(PriorityTier::Medium));
    EXPECT_TRUE(policy.canExecute(PriorityTier::Idle));
}

TEST_F(AdmissionPolicyTest, WaitForResourcesTimesOut) {
    probe_->setRam(90);
    ResourceMonitor monitor(probe_, 0ms);
    AdmissionPolicy policy(config_, monitor);

    boost::asio::io_context io;
    const auto start = std::chrono::steady_clock::now();
    auto fut = boost::asio::co_spawn(io, policy.waitForResources(PriorityTier::Medium, 100ms, {}),
                                     boost::asio::use_future);
    io.run();

    EXPECT_FALSE(fut.get());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 100ms);
    EXPECT_GT(probe_->reads(), 2);
}

TEST_F(AdmissionPolicyTest, WaitForResourcesAdmitsOnceLoadDrops) {
    probe_->setRam(90);
    ResourceMonitor monitor(probe_, 0ms);
    AdmissionPolicy policy(config_, monitor);

    boost::asio::io_context io;
    boost::asio::steady_timer relief(io, 50ms);
    relief.async_wait([this](const boost::system::error_code&) { probe_->setRam(20); });
    auto fut = boost::asio::co_spawn(io, policy.waitForResources(PriorityTier::Medium, 5s, {}),
                                     boost::asio::use_future);
    io.run();

    EXPECT_TRUE(fut.get());
}

TEST_F(AdmissionPolicyTest, WaitForResourcesStopsWhenCallerGivesUp) {
    probe_->setRam(90);
    ResourceMonitor monitor(probe_, 0ms);
    AdmissionPolicy policy(config_, monitor);
    std::atomic<bool> stop{false};

    boost::asio::io_context io;
    boost::asio::steady_timer stopper(io, 30ms);
    stopper.async_wait([&stop](const boost::system::error_code&) { stop = true; });
    const auto start = std::chrono::steady_clock::now();
    auto fut = boost::asio::co_spawn(
        io, policy.waitForResources(PriorityTier::Low, 10s, [&stop] { return !stop.load(); }),
        boost::asio::use_future);
    io.run();

    EXPECT_FALSE(fut.get());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

} // namespace qoms::test
