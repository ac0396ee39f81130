// Copyright 2025 The QOMS Authors
// SPDX-License-Identifier: Apache-2.0

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <qoms/config/QomsConfig.h>
#include <qoms/scheduler/OperationQueue.h>
#include <qoms/scheduler/WorkerPool.h>

using json = nlohmann::json;

namespace {

std::string formatWall(qoms::WallTime t) {
    return std::to_string(
        std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count());
}

json statsToJson(const qoms::QueueStats& s) {
    json lanes = json::object();
    for (auto tier : qoms::kAllTiers) {
        lanes[std::string(qoms::tierName(tier))] = s.laneLengths[qoms::tierIndex(tier)];
    }
    json j;
    j["lanes"] = lanes;
    j["total_queued"] = s.totalQueued;
    j["in_flight"] = s.inFlight;
    j["pending_retries"] = s.pendingRetries;
    j["total_retries"] = s.totalRetries;
    j["dlq_size"] = s.dlqSize;
    j["dlq_evicted"] = s.dlqEvicted;
    j["dispatcher_running"] = s.dispatcherRunning;
    j["avg_wait_ms"] = s.avgWaitMs;
    j["total_processed"] = s.totalProcessed;
    j["promotions"] = s.promotions;
    j["fast_path_executions"] = s.fastPathExecutions;
    j["lease_expirations"] = s.leaseExpirations;
    j["resource_timeouts"] = s.resourceTimeouts;
    j["resources"] = {{"available", s.resources.available},
                      {"cpu_percent", s.resources.cpuPercent},
                      {"ram_percent", s.resources.ramPercent},
                      {"free_ram_mb", s.resources.freeRamMB},
                      {"total_ram_mb", s.resources.totalRamMB},
                      {"load_avg_1m", s.resources.loadAvg1m}};
    j["config"] = {{"max_cpu_percent", s.config.maxCpuPercent},
                   {"max_ram_percent", s.config.maxRamPercent},
                   {"max_wait_ms", s.config.maxWait.count()},
                   {"max_retries", s.config.maxRetries},
                   {"base_retry_delay_ms", s.config.baseRetryDelay.count()},
                   {"max_retry_delay_ms", s.config.maxRetryDelay.count()},
                   {"lease_timeout_ms", s.config.leaseTimeout.count()},
                   {"age_promotion_ms", s.config.agePromotion.count()},
                   {"dlq_max_size", s.config.dlqMaxSize},
                   {"fast_path", s.config.enableFastPath}};
    return j;
}

json dlqToJson(const std::vector<qoms::DLQEntry>& entries) {
    json arr = json::array();
    for (const auto& e : entries) {
        arr.push_back({{"id", e.id},
                       {"priority", std::string(qoms::tierName(e.priority))},
                       {"enqueued_at_ms", formatWall(e.enqueuedAt)},
                       {"failed_at_ms", formatWall(e.failedAt)},
                       {"retry_count", e.retryCount},
                       {"last_error", e.lastError}});
    }
    return arr;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"qoms-cli - run a synthetic workload through the QOMS operation queue"};

    std::string configPath;
    std::size_t ops = 20;
    std::string tierName = "medium";
    std::uint32_t failEvery = 0;
    std::uint32_t workMs = 5;
    std::size_t threads = 2;
    std::string logLevel = "warn";

    app.add_option("-c,--config", configPath, "Config file (TOML, [qoms] section)");
    app.add_option("-n,--ops", ops, "Number of operations to submit")->default_val(20);
    app.add_option("-t,--tier", tierName, "Priority tier: critical|high|medium|low|idle")
        ->check(CLI::IsMember({"critical", "high", "medium", "low", "idle"}, CLI::ignore_case))
        ->default_val("medium");
    app.add_option("--fail-every", failEvery, "Fail every K-th attempt (0 = never)")
        ->default_val(0);
    app.add_option("--work-ms", workMs, "Simulated work per operation in ms")->default_val(5);
    app.add_option("--threads", threads, "Worker threads (at least 2)")->default_val(2)->check(
        CLI::PositiveNumber);
    app.add_option("-l,--log-level", logLevel, "Log level (trace, debug, info, warn, error)")
        ->default_val("warn");
    CLI11_PARSE(app, argc, argv);

    try {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto logger = std::make_shared<spdlog::logger>("qoms", console);
        spdlog::set_default_logger(logger);
        spdlog::set_level(spdlog::level::from_str(logLevel));
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
    } catch (const std::exception& e) {
        std::cerr << "Failed to setup logging: " << e.what() << std::endl;
        return 1;
    }

    auto config = qoms::ConfigLoader::load(configPath);
    if (!config) {
        spdlog::error("Configuration error: {}", config.error().message);
        return 2;
    }
    const auto tier = qoms::parseTier(tierName);
    if (!tier) {
        spdlog::error("Unknown tier '{}'", tierName);
        return 2;
    }

    std::unique_ptr<qoms::WorkerPool> pool;
    try {
        pool = std::make_unique<qoms::WorkerPool>(threads);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }

    std::size_t succeeded = 0;
    std::size_t failed = 0;
    json result;
    {
        qoms::OperationQueue queue(config.value(), pool->executor());
        queue.start();

        std::atomic<std::uint64_t> attempts{0};
        std::vector<std::future<qoms::Result<std::uint64_t>>> futures;
        futures.reserve(ops);
        for (std::size_t i = 0; i < ops; ++i) {
            futures.push_back(queue.enqueue(
                [i, failEvery, workMs, &attempts]() -> qoms::Result<std::uint64_t> {
                    const auto n = ++attempts;
                    std::this_thread::sleep_for(std::chrono::milliseconds(workMs));
                    if (failEvery > 0 && n % failEvery == 0) {
                        return qoms::Error{qoms::ErrorCode::OperationFailed,
                                           "synthetic failure on attempt " + std::to_string(n)};
                    }
                    return static_cast<std::uint64_t>(i);
                },
                *tier));
        }

        for (auto& f : futures) {
            auto r = f.get();
            if (r) {
                ++succeeded;
            } else {
                ++failed;
                spdlog::info("Operation failed: {}", r.error().message);
            }
        }

        result["stats"] = statsToJson(queue.getStats());
        result["dlq"] = dlqToJson(queue.getDLQ());
        queue.stop();
    }
    pool->shutdown();

    result["submitted"] = ops;
    result["succeeded"] = succeeded;
    result["failed"] = failed;
    std::cout << result.dump(2) << std::endl;
    return failed == 0 ? 0 : 3;
}
