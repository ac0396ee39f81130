// Copyright 2025 The QOMS Authors
// SPDX-License-Identifier: Apache-2.0

#include <qoms/config/QomsConfig.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace qoms {

namespace {

std::string trim(std::string s) {
    auto issp = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!s.empty() && issp(static_cast<unsigned char>(s.front())))
        s.erase(s.begin());
    while (!s.empty() && issp(static_cast<unsigned char>(s.back())))
        s.pop_back();
    return s;
}

Result<double> parseDouble(const std::string& key, const std::string& raw) {
    try {
        std::size_t pos = 0;
        double v = std::stod(raw, &pos);
        if (pos == raw.size())
            return v;
    } catch (const std::invalid_argument&) {
    } catch (const std::out_of_range&) {
    }
    return Error{ErrorCode::InvalidArgument, key + ": expected a number, got '" + raw + "'"};
}

Result<std::uint64_t> parseUnsigned(const std::string& key, const std::string& raw) {
    if (raw.empty() || raw.front() == '-') {
        return Error{ErrorCode::InvalidArgument,
                     key + ": expected a non-negative integer, got '" + raw + "'"};
    }
    try {
        std::size_t pos = 0;
        auto v = static_cast<std::uint64_t>(std::stoull(raw, &pos));
        if (pos == raw.size())
            return v;
    } catch (const std::invalid_argument&) {
    } catch (const std::out_of_range&) {
    }
    return Error{ErrorCode::InvalidArgument,
                 key + ": expected a non-negative integer, got '" + raw + "'"};
}

Result<bool> parseBool(const std::string& key, const std::string& raw) {
    std::string v = raw;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    return Error{ErrorCode::InvalidArgument, key + ": expected a boolean, got '" + raw + "'"};
}

using Setter = std::function<Result<void>(const std::string& key, const std::string& raw,
                                          QomsConfig& cfg)>;

Setter number(double QomsConfig::*field) {
    return [field](const std::string& key, const std::string& raw, QomsConfig& cfg) -> Result<void> {
        auto v = parseDouble(key, raw);
        if (!v)
            return v.error();
        cfg.*field = v.value();
        return {};
    };
}

Setter millis(std::chrono::milliseconds QomsConfig::*field) {
    return [field](const std::string& key, const std::string& raw, QomsConfig& cfg) -> Result<void> {
        auto v = parseUnsigned(key, raw);
        if (!v)
            return v.error();
        if (v.value() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return Error{ErrorCode::InvalidArgument, key + ": value out of range '" + raw + "'"};
        }
        cfg.*field = std::chrono::milliseconds(static_cast<std::int64_t>(v.value()));
        return {};
    };
}

template <typename Int> Setter integer(Int QomsConfig::*field) {
    return [field](const std::string& key, const std::string& raw, QomsConfig& cfg) -> Result<void> {
        auto v = parseUnsigned(key, raw);
        if (!v)
            return v.error();
        if (v.value() > static_cast<std::uint64_t>(std::numeric_limits<Int>::max())) {
            return Error{ErrorCode::InvalidArgument,
                         key + ": value out of range (max " +
                             std::to_string(std::numeric_limits<Int>::max()) + ") '" + raw + "'"};
        }
        cfg.*field = static_cast<Int>(v.value());
        return {};
    };
}

Setter flag(bool QomsConfig::*field) {
    return [field](const std::string& key, const std::string& raw, QomsConfig& cfg) -> Result<void> {
        auto v = parseBool(key, raw);
        if (!v)
            return v.error();
        cfg.*field = v.value();
        return {};
    };
}

struct FieldSpec {
    const char* key; // key inside [qoms]
    const char* env;
    Setter apply;
};

const std::vector<FieldSpec>& fieldSpecs() {
    static const std::vector<FieldSpec> specs = {
        {"max_cpu_percent", "QOMS_MAX_CPU_PERCENT", number(&QomsConfig::maxCpuPercent)},
        {"max_ram_percent", "QOMS_MAX_RAM_PERCENT", number(&QomsConfig::maxRamPercent)},
        {"idle_max_cpu_percent", "QOMS_IDLE_MAX_CPU_PERCENT",
         number(&QomsConfig::idleMaxCpuPercent)},
        {"idle_max_ram_percent", "QOMS_IDLE_MAX_RAM_PERCENT",
         number(&QomsConfig::idleMaxRamPercent)},
        {"check_interval_ms", "QOMS_CHECK_INTERVAL_MS", millis(&QomsConfig::checkInterval)},
        {"max_wait_ms", "QOMS_MAX_WAIT_MS", millis(&QomsConfig::maxWait)},
        {"queue_high_water_mark", "QOMS_QUEUE_HIGH_WATER_MARK",
         integer(&QomsConfig::queueHighWaterMark)},
        {"max_retries", "QOMS_MAX_RETRIES", integer(&QomsConfig::maxRetries)},
        {"base_retry_delay_ms", "QOMS_BASE_RETRY_DELAY_MS", millis(&QomsConfig::baseRetryDelay)},
        {"backoff_multiplier", "QOMS_BACKOFF_MULTIPLIER", number(&QomsConfig::backoffMultiplier)},
        {"max_retry_delay_ms", "QOMS_MAX_RETRY_DELAY_MS", millis(&QomsConfig::maxRetryDelay)},
        {"lease_timeout_ms", "QOMS_LEASE_TIMEOUT_MS", millis(&QomsConfig::leaseTimeout)},
        {"age_promotion_ms", "QOMS_AGE_PROMOTION_MS", millis(&QomsConfig::agePromotion)},
        {"dlq_max_size", "QOMS_DLQ_MAX_SIZE", integer(&QomsConfig::dlqMaxSize)},
        {"dlq_retention_ms", "QOMS_DLQ_RETENTION_MS", millis(&QomsConfig::dlqRetention)},
        {"metrics_cache_ms", "QOMS_METRICS_CACHE_MS", millis(&QomsConfig::metricsCache)},
        {"inter_item_delay_ms", "QOMS_INTER_ITEM_DELAY_MS", millis(&QomsConfig::interItemDelay)},
        {"fast_path", "QOMS_FAST_PATH", flag(&QomsConfig::enableFastPath)},
    };
    return specs;
}

bool validPercent(double v) {
    return v > 0.0 && v <= 100.0;
}

} // namespace

Result<void> QomsConfig::validate() const {
    auto invalid = [](const std::string& what) {
        return Error{ErrorCode::InvalidArgument, "qoms config: " + what};
    };
    if (!validPercent(maxCpuPercent))
        return invalid("max_cpu_percent must be in (0, 100]");
    if (!validPercent(maxRamPercent))
        return invalid("max_ram_percent must be in (0, 100]");
    if (!validPercent(idleMaxCpuPercent))
        return invalid("idle_max_cpu_percent must be in (0, 100]");
    if (!validPercent(idleMaxRamPercent))
        return invalid("idle_max_ram_percent must be in (0, 100]");
    if (checkInterval.count() <= 0)
        return invalid("check_interval_ms must be positive");
    if (maxWait.count() <= 0)
        return invalid("max_wait_ms must be positive");
    if (maxRetries == 0)
        return invalid("max_retries must be at least 1");
    if (baseRetryDelay.count() < 0)
        return invalid("base_retry_delay_ms must not be negative");
    if (maxRetryDelay < baseRetryDelay)
        return invalid("max_retry_delay_ms must be >= base_retry_delay_ms");
    if (backoffMultiplier < 1.0)
        return invalid("backoff_multiplier must be >= 1");
    if (leaseTimeout.count() <= 0)
        return invalid("lease_timeout_ms must be positive");
    if (agePromotion.count() <= 0)
        return invalid("age_promotion_ms must be positive");
    if (dlqMaxSize == 0)
        return invalid("dlq_max_size must be at least 1");
    if (dlqRetention.count() <= 0)
        return invalid("dlq_retention_ms must be positive");
    return {};
}

std::filesystem::path ConfigLoader::resolveDefaultConfigPath() {
    if (const char* explicitPath = std::getenv("QOMS_CONFIG_PATH")) {
        std::filesystem::path p{explicitPath};
        if (std::filesystem::exists(p))
            return p;
    }
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
        std::filesystem::path p = std::filesystem::path(xdg) / "qoms" / "config.toml";
        if (std::filesystem::exists(p))
            return p;
    }
    if (const char* home = std::getenv("HOME")) {
        std::filesystem::path p = std::filesystem::path(home) / ".config" / "qoms" / "config.toml";
        if (std::filesystem::exists(p))
            return p;
    }
    return {};
}

std::map<std::string, std::string>
ConfigLoader::parseSimpleTomlFlat(const std::filesystem::path& path) {
    std::map<std::string, std::string> config;
    std::ifstream file(path);
    if (!file)
        return config;

    std::string line;
    std::string currentSection;
    while (std::getline(file, line)) {
        // '#' inside a quoted value is kept
        bool inQuotes = false;
        for (std::size_t i = 0; i < line.size(); ++i) {
            if (line[i] == '"') {
                inQuotes = !inQuotes;
            } else if (line[i] == '#' && !inQuotes) {
                line.erase(i);
                break;
            }
        }
        line = trim(line);
        if (line.empty())
            continue;

        if (line.front() == '[' && line.back() == ']') {
            currentSection = trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos)
            continue;
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        if (!currentSection.empty()) {
            config[currentSection + "." + key] = value;
        } else {
            config[key] = value;
        }
    }
    return config;
}

Result<void> ConfigLoader::applyFlatMap(const std::map<std::string, std::string>& kv,
                                        QomsConfig& config) {
    static constexpr std::string_view kPrefix = "qoms.";
    for (const auto& [fullKey, value] : kv) {
        if (fullKey.rfind(kPrefix, 0) != 0)
            continue;
        const std::string key = fullKey.substr(kPrefix.size());
        auto it = std::find_if(fieldSpecs().begin(), fieldSpecs().end(),
                               [&](const FieldSpec& f) { return key == f.key; });
        if (it == fieldSpecs().end()) {
            spdlog::debug("[ConfigLoader] Ignoring unknown key '{}'", fullKey);
            continue;
        }
        if (auto r = it->apply(fullKey, value, config); !r) {
            return r;
        }
    }
    return {};
}

Result<void> ConfigLoader::applyEnvironment(QomsConfig& config) {
    for (const auto& field : fieldSpecs()) {
        const char* raw = std::getenv(field.env);
        if (!raw || !*raw)
            continue;
        if (auto r = field.apply(field.env, trim(raw), config); !r) {
            return r;
        }
        spdlog::debug("[ConfigLoader] {} overridden from environment", field.key);
    }
    return {};
}

Result<QomsConfig> ConfigLoader::load(const std::filesystem::path& path) {
    QomsConfig config;

    std::filesystem::path cfgPath = path;
    if (!cfgPath.empty()) {
        std::error_code ec;
        if (!std::filesystem::exists(cfgPath, ec)) {
            return Error{ErrorCode::NotFound, "config file not found: " + cfgPath.string()};
        }
    } else {
        cfgPath = resolveDefaultConfigPath();
    }

    if (!cfgPath.empty()) {
        spdlog::debug("[ConfigLoader] Reading {}", cfgPath.string());
        if (auto r = applyFlatMap(parseSimpleTomlFlat(cfgPath), config); !r) {
            return r.error();
        }
    }

    if (auto r = applyEnvironment(config); !r) {
        return r.error();
    }
    if (auto r = config.validate(); !r) {
        return r.error();
    }
    return config;
}

} // namespace qoms
