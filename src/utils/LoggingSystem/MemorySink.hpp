#ifndef DATASYNC_MEMORY_SINK_HPP // 防止重复包含
#define DATASYNC_MEMORY_SINK_HPP

#include <cstddef>
#include <deque>
#include <vector>
#include "LogSink.hpp"

namespace LoggingSystem {

/**
 * @brief 内存输出器
 * @details 把最近的日志消息保存在有界队列里，超出容量时丢弃最旧的一条。
 *          用于测试断言和故障现场诊断。
 */
class MemorySink : public LogSink
{
public:
    explicit MemorySink(size_t capacity = 1024);

    void write(const LogMessage& message) override;
    void flush() override {}
    std::string name() const override { return "MemorySink"; }

    /// 当前保存的全部消息（按时间顺序）
    std::vector<LogMessage> messages() const;

    /// 指定模块、级别不低于 level 的消息条数
    size_t count(const std::string& module, LogLevel level = LogLevel::DEBUG) const;

    /// 是否存在正文包含 text 的消息
    bool contains(const std::string& text) const;

    void clear();

private:
    size_t capacity;
    std::deque<LogMessage> buffer;
};

}   // namespace LoggingSystem

#endif  // DATASYNC_MEMORY_SINK_HPP
