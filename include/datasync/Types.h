#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace datasync {

/**
 * 时钟类型
 * 锁的时间戳只用于比较先后和计算空闲时长，使用单调时钟
 */
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

/**
 * Duration - 超时、间隔等时长统一使用毫秒
 */
using Duration = std::chrono::milliseconds;

// 以毫秒表示的时长（日志输出用）
inline std::string DurationToString(Duration d) {
    return std::to_string(d.count()) + "ms";
}

} // namespace datasync
