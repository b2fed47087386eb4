#ifndef DATASYNC_LOG_SINK_HPP // 防止重复包含
#define DATASYNC_LOG_SINK_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include "LogMessage.hpp"

namespace LoggingSystem {

/**
 * @brief 日志输出器
 * @details 将日志消息输出到指定位置；级别过滤和开关在基类完成
 */
class LogSink
{
public:
    LogSink() = default;
    virtual ~LogSink() = default;

    /// 写入日志消息
    virtual void write(const LogMessage& message) = 0;

    /// 刷新缓冲区
    virtual void flush() = 0;

    /// 获取输出器名称
    virtual std::string name() const = 0;

    void setEnabled(bool value) { enabled.store(value); }
    bool isEnabled() const { return enabled.load(); }

    void setMinimumLogLevel(LogLevel level) { minimumLevel.store(level); }
    LogLevel getMinimumLogLevel() const { return minimumLevel.load(); }

    /// 是否接受该消息
    bool accepts(const LogMessage& message) const {
        return isEnabled() && message.level >= getMinimumLogLevel();
    }

protected:
    std::atomic<bool> enabled{true};
    std::atomic<LogLevel> minimumLevel{LogLevel::DEBUG};
    // 子类写出时使用
    mutable std::mutex mutex;
};

using LogSinkPtr = std::shared_ptr<LogSink>;

}   // namespace LoggingSystem

#endif  // DATASYNC_LOG_SINK_HPP
