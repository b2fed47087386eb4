// File: src/transaction/src/LockManagerConfig.hpp
// 锁管理器配置
#pragma once

#include "datasync/Types.h"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace datasync {
namespace utils {
class ConfigManager;
} // namespace utils

namespace transaction {

/**
 * ResolutionStrategy - 死锁牺牲者选择策略
 */
enum class ResolutionStrategy {
    TERMINATE_OLDEST,   // 终止 acquired_at 最早的事务
    TERMINATE_NEWEST    // 终止 acquired_at 最晚的事务
};

const char* ToString(ResolutionStrategy strategy);

// "terminate_oldest" / "terminate_newest"（大小写不敏感）
std::optional<ResolutionStrategy> ParseResolutionStrategy(const std::string& text);

/**
 * LockManagerConfig - 锁管理器配置
 *
 * 构造管理器时按值传入，此后不可修改
 */
struct LockManagerConfig {
    // 空闲多久的未持有锁项会被清理
    Duration expiration_time{std::chrono::minutes(5)};

    // try_start(key) 的默认等待时间，0 表示不等待
    Duration acquisition_timeout{std::chrono::seconds(30)};

    // 单个事务的最长持有时间
    Duration max_lock_duration{std::chrono::minutes(1)};

    Duration eviction_interval{std::chrono::minutes(1)};
    Duration deadlock_detection_interval{std::chrono::seconds(10)};

    ResolutionStrategy resolution_strategy = ResolutionStrategy::TERMINATE_OLDEST;

    bool enable_eviction = true;
    bool enable_deadlock_detection = true;

    // 锁表分片数
    size_t lock_table_shards = 16;

    /**
     * validate - 校验配置
     * @throws std::invalid_argument 时长非正（acquisition_timeout 可以为 0）或分片数为 0
     */
    void validate() const;

    std::string to_string() const;

    /**
     * from_config - 从 ConfigManager 读取 lock.* 配置项
     *
     * 缺失的项保留默认值；格式错误的项记录 ERROR 日志后忽略
     */
    static LockManagerConfig from_config(const utils::ConfigManager& config);
};

} // namespace transaction
} // namespace datasync
