// File: src/transaction/src/LockManagerConfig.cpp
#include "LockManagerConfig.hpp"
#include "../../utils/ConfigManager.hpp"
#include "../../utils/LoggingSystem/LogMacros.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace datasync {
namespace transaction {

namespace {

void require_positive(Duration value, const char* name) {
    if (value.count() <= 0) {
        throw std::invalid_argument(std::string(name) + " must be positive, got " +
                                    DurationToString(value));
    }
}

// 读取毫秒配置项；缺失返回 false，格式错误记录日志并返回 false
bool read_millis(const utils::ConfigManager& config, const std::string& key, Duration& out) {
    if (!config.has(key)) {
        return false;
    }
    auto value = config.get<int64_t>(key);
    if (!value) {
        LOG_ERROR("CONFIG", "Invalid value for " + key + ": '" + config.get_string(key) +
                            "' (expected milliseconds)");
        return false;
    }
    out = Duration(*value);
    return true;
}

bool read_flag(const utils::ConfigManager& config, const std::string& key, bool& out) {
    if (!config.has(key)) {
        return false;
    }
    auto value = config.get<bool>(key);
    if (!value) {
        LOG_ERROR("CONFIG", "Invalid value for " + key + ": '" + config.get_string(key) +
                            "' (expected true/false)");
        return false;
    }
    out = *value;
    return true;
}

} // namespace

const char* ToString(ResolutionStrategy strategy) {
    switch (strategy) {
        case ResolutionStrategy::TERMINATE_OLDEST: return "terminate_oldest";
        case ResolutionStrategy::TERMINATE_NEWEST: return "terminate_newest";
    }
    return "unknown";
}

std::optional<ResolutionStrategy> ParseResolutionStrategy(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(lower.begin(), lower.end(), '-', '_');

    if (lower == "terminate_oldest" || lower == "oldest") {
        return ResolutionStrategy::TERMINATE_OLDEST;
    }
    if (lower == "terminate_newest" || lower == "newest") {
        return ResolutionStrategy::TERMINATE_NEWEST;
    }
    return std::nullopt;
}

void LockManagerConfig::validate() const {
    require_positive(expiration_time, "expiration_time");
    require_positive(max_lock_duration, "max_lock_duration");
    require_positive(eviction_interval, "eviction_interval");
    require_positive(deadlock_detection_interval, "deadlock_detection_interval");
    if (acquisition_timeout.count() < 0) {
        throw std::invalid_argument("acquisition_timeout must not be negative, got " +
                                    DurationToString(acquisition_timeout));
    }
    if (lock_table_shards == 0) {
        throw std::invalid_argument("lock_table_shards must be at least 1");
    }
}

std::string LockManagerConfig::to_string() const {
    std::ostringstream oss;
    oss << "LockManagerConfig{expiration=" << DurationToString(expiration_time)
        << ", timeout=" << DurationToString(acquisition_timeout)
        << ", max_duration=" << DurationToString(max_lock_duration)
        << ", eviction_interval=" << DurationToString(eviction_interval)
        << ", deadlock_interval=" << DurationToString(deadlock_detection_interval)
        << ", strategy=" << ToString(resolution_strategy)
        << ", eviction=" << (enable_eviction ? "on" : "off")
        << ", deadlock_detection=" << (enable_deadlock_detection ? "on" : "off")
        << ", shards=" << lock_table_shards << "}";
    return oss.str();
}

LockManagerConfig LockManagerConfig::from_config(const utils::ConfigManager& config) {
    LockManagerConfig result;

    read_millis(config, "lock.expiration.ms", result.expiration_time);
    read_millis(config, "lock.timeout.ms", result.acquisition_timeout);
    read_millis(config, "lock.max.duration.ms", result.max_lock_duration);
    read_millis(config, "lock.eviction.interval.ms", result.eviction_interval);
    read_millis(config, "lock.deadlock.interval.ms", result.deadlock_detection_interval);
    read_flag(config, "lock.eviction.enabled", result.enable_eviction);
    read_flag(config, "lock.deadlock.enabled", result.enable_deadlock_detection);

    if (config.has("lock.resolution.strategy")) {
        const std::string text = config.get_string("lock.resolution.strategy");
        auto strategy = ParseResolutionStrategy(text);
        if (strategy) {
            result.resolution_strategy = *strategy;
        } else {
            LOG_ERROR("CONFIG", "Unknown lock.resolution.strategy '" + text +
                                "', keeping " + ToString(result.resolution_strategy));
        }
    }

    return result;
}

} // namespace transaction
} // namespace datasync
