#include "Logger.hpp"
#include <algorithm>

namespace LoggingSystem {

Logger* Logger::GetInstance()
{
    // 进程生命周期内不析构，避免退出阶段其他静态对象仍在写日志
    static Logger* instance = new Logger();
    return instance;
}

Logger::~Logger()
{
    stopWorker();
}

void Logger::log(LogMessage message)
{
    if (!enabled.load() || message.level < m_minimumLevel.load())
    {
        return;
    }

    if (asyncEnabled.load())
    {
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            messageQueue.push_back(std::move(message));
        }
        queueCond.notify_one();
        return;
    }

    dispatchMessage(message);
}

void Logger::addSink(const LogSinkPtr& sink)
{
    if (!sink) {
        return;
    }

    std::lock_guard<std::mutex> locker(m_mutex);
    if (std::find(sinks.begin(), sinks.end(), sink) == sinks.end()) {
        sinks.push_back(sink);
    }
}

void Logger::removeSink(const LogSinkPtr& sink)
{
    std::lock_guard<std::mutex> locker(m_mutex);
    sinks.erase(std::remove(sinks.begin(), sinks.end(), sink), sinks.end());
}

void Logger::clearSinks()
{
    std::lock_guard<std::mutex> locker(m_mutex);
    sinks.clear();
}

void Logger::setEnabled(bool value)
{
    enabled.store(value);
}

bool Logger::isEnabled() const
{
    return enabled.load();
}

void Logger::setMinimumLogLevel(LogLevel level)
{
    m_minimumLevel.store(level);
}

LogLevel Logger::getMinimumLogLevel() const
{
    return m_minimumLevel.load();
}

void Logger::dispatchMessage(const LogMessage& message)
{
    // 拷贝一份输出器列表，写出时不持有 m_mutex
    std::vector<LogSinkPtr> targets;
    {
        std::lock_guard<std::mutex> locker(m_mutex);
        targets = sinks;
    }
    for (const auto& sink : targets)
    {
        if (sink && sink->accepts(message)) {
            sink->write(message);
        }
    }
}

void Logger::workerLoop()
{
    for (;;)
    {
        LogMessage msg;
        {
            std::unique_lock<std::mutex> lock(queueMutex);
            queueCond.wait(lock, [&] { return stopping || !messageQueue.empty(); });

            if (messageQueue.empty()) {
                // stopping 且队列已空
                break;
            }
            msg = std::move(messageQueue.front());
            messageQueue.pop_front();
            dispatching = true;
        }

        dispatchMessage(msg);

        {
            std::lock_guard<std::mutex> lock(queueMutex);
            dispatching = false;
            if (messageQueue.empty()) {
                drainedCond.notify_all();
            }
        }
    }
}

void Logger::startWorker()
{
    std::lock_guard<std::mutex> lock(queueMutex);
    if (workerThread.joinable()) {
        return;
    }
    stopping = false;
    workerThread = std::thread(&Logger::workerLoop, this);
}

void Logger::stopWorker()
{
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        stopping = true;
    }
    queueCond.notify_all();
    if (workerThread.joinable()) {
        workerThread.join();
    }
    // 关闭异步后残留的消息由调用线程直接写出
    std::deque<LogMessage> rest;
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        rest.swap(messageQueue);
    }
    for (const auto& msg : rest) {
        dispatchMessage(msg);
    }
}

void Logger::setAsyncEnabled(bool value)
{
    if (asyncEnabled.exchange(value) == value) {
        return;
    }

    if (value) {
        startWorker();
    } else {
        stopWorker();
    }
}

bool Logger::isAsyncEnabled() const
{
    return asyncEnabled.load();
}

void Logger::flush()
{
    if (asyncEnabled.load())
    {
        std::unique_lock<std::mutex> lock(queueMutex);
        drainedCond.wait(lock, [&] { return (messageQueue.empty() && !dispatching) || stopping; });
    }

    std::vector<LogSinkPtr> targets;
    {
        std::lock_guard<std::mutex> locker(m_mutex);
        targets = sinks;
    }
    for (const auto& sink : targets) {
        if (sink) {
            sink->flush();
        }
    }
}

}   // namespace LoggingSystem
