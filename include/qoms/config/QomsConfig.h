// Copyright 2025 The QOMS Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <qoms/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>

namespace qoms {

/**
 * @brief Process-wide queue configuration, fixed at startup.
 *
 * Constructed once (defaults, then config file, then environment) and passed
 * by value into OperationQueue. Nothing reads the environment after that.
 */
struct QomsConfig {
    // Admission ceilings
    double maxCpuPercent = 75.0;
    double maxRamPercent = 60.0;
    double idleMaxCpuPercent = 5.0;  ///< Idle tier runs only below this CPU%
    double idleMaxRamPercent = 15.0; ///< Idle tier runs only below this RAM%

    // Resource waiting
    std::chrono::milliseconds checkInterval{100};
    std::chrono::milliseconds maxWait{300000};
    std::size_t queueHighWaterMark = 100;

    // Retry / lease
    std::uint32_t maxRetries = 3;
    std::chrono::milliseconds baseRetryDelay{1000};
    double backoffMultiplier = 2.0;
    std::chrono::milliseconds maxRetryDelay{30000};
    std::chrono::milliseconds leaseTimeout{60000};
    std::chrono::milliseconds agePromotion{30000};

    // Dead-letter queue
    std::size_t dlqMaxSize = 1000;
    std::chrono::milliseconds dlqRetention{3600000};

    // Sampling / dispatch pacing
    std::chrono::milliseconds metricsCache{500};
    std::chrono::milliseconds interItemDelay{10};
    bool enableFastPath = true;

    /**
     * @brief Rejects values the scheduler cannot operate with.
     *
     * @return InvalidArgument naming the first offending field
     */
    Result<void> validate() const;
};

/**
 * @brief Static helpers that build a QomsConfig from file and environment.
 */
class ConfigLoader {
public:
    ConfigLoader() = delete;

    /**
     * @brief Resolve the default config file path.
     *
     * Search order:
     * 1. QOMS_CONFIG_PATH environment variable
     * 2. $XDG_CONFIG_HOME/qoms/config.toml
     * 3. $HOME/.config/qoms/config.toml
     *
     * @return Path to config file if found, empty path otherwise
     */
    static std::filesystem::path resolveDefaultConfigPath();

    /**
     * @brief Parse a simple TOML file into a flat "section.key" -> value map.
     *
     * Handles [section] headers, key = value lines, quoted strings and #
     * comments. Arrays, inline tables and multi-line strings are not supported.
     */
    static std::map<std::string, std::string>
    parseSimpleTomlFlat(const std::filesystem::path& path);

    /**
     * @brief Overlay keys from the [qoms] section onto a config.
     *
     * Unknown keys are ignored with a debug log; malformed values fail.
     */
    static Result<void> applyFlatMap(const std::map<std::string, std::string>& kv,
                                     QomsConfig& config);

    /// Overlay QOMS_* environment variables onto a config.
    static Result<void> applyEnvironment(QomsConfig& config);

    /**
     * @brief Full resolution: defaults, file, environment, validation.
     *
     * @param path Explicit config file; when empty the default search applies.
     *             An explicit path that does not exist is an error.
     */
    static Result<QomsConfig> load(const std::filesystem::path& path = {});
};

} // namespace qoms
