#ifndef DATASYNC_LOGGER_HPP // 防止重复包含
#define DATASYNC_LOGGER_HPP

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "LogMessage.hpp"
#include "LogSink.hpp"

namespace LoggingSystem {

/**
 * @brief 日志类
 * @details 进程级单例，把消息分发给所有已注册的输出器。
 *          没有输出器时不产生任何输出；可切换为异步模式，由工作线程分发。
 */
class Logger {
public:
    /// 获取单例实例
    static Logger* GetInstance();

    /// 添加输出器（重复添加同一个实例无效）
    void addSink(const LogSinkPtr& sink);

    /// 移除输出器
    void removeSink(const LogSinkPtr& sink);

    /// 移除全部输出器
    void clearSinks();

    /// 记录日志消息
    void log(LogMessage message);

    /// 最小日志级别
    void setMinimumLogLevel(LogLevel level);
    LogLevel getMinimumLogLevel() const;

    /// 是否启用日志
    void setEnabled(bool value);
    bool isEnabled() const;

    /// 启用/关闭异步写入；关闭时会先排空队列
    void setAsyncEnabled(bool value);
    bool isAsyncEnabled() const;

    /// 刷新所有输出器（异步模式下先等待队列清空）
    void flush();

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void dispatchMessage(const LogMessage& message);
    void workerLoop();
    void startWorker();
    void stopWorker();

    // 保护 sinks
    mutable std::mutex m_mutex;
    std::vector<LogSinkPtr> sinks;

    std::atomic<LogLevel> m_minimumLevel{LogLevel::INFO};
    std::atomic<bool> enabled{true};

    // 异步相关
    std::atomic<bool> asyncEnabled{false};
    bool stopping = false;
    std::thread workerThread;
    std::mutex queueMutex;
    std::condition_variable queueCond;
    std::condition_variable drainedCond;
    std::deque<LogMessage> messageQueue;
    bool dispatching = false;
};

} // namespace LoggingSystem

#endif // DATASYNC_LOGGER_HPP
