#include "ConsoleSink.hpp"
#include <iostream>

namespace LoggingSystem {

ConsoleSink::ConsoleSink() = default;

ConsoleSink::~ConsoleSink()
{
    flush();
}

void ConsoleSink::setUseColor(bool value)
{
    std::lock_guard<std::mutex> locker(mutex);
    useColor = value;
}

bool ConsoleSink::isColorUsed() const
{
    std::lock_guard<std::mutex> locker(mutex);
    return useColor;
}

void ConsoleSink::setErrorToStdErr(bool enable)
{
    std::lock_guard<std::mutex> locker(mutex);
    m_errorToStdErr = enable;
}

bool ConsoleSink::errorToStdErr() const
{
    std::lock_guard<std::mutex> locker(mutex);
    return m_errorToStdErr;
}

void ConsoleSink::setVerbose(bool enable)
{
    std::lock_guard<std::mutex> locker(mutex);
    verbose = enable;
}

void ConsoleSink::write(const LogMessage& message)
{
    if (!accepts(message)) {
        return;
    }

    bool shouldUseColor;
    bool shouldUseStdErr;
    bool shouldBeVerbose;
    {
        std::lock_guard<std::mutex> locker(mutex);
        shouldUseColor = useColor;
        shouldBeVerbose = verbose;
        shouldUseStdErr = m_errorToStdErr &&
                          (message.level == LogLevel::ERROR || message.level == LogLevel::FATAL);
    }

    // 在锁外格式化
    const std::string output = shouldUseColor && !shouldBeVerbose
                               ? message.toColorString()
                               : message.toString(shouldBeVerbose);

    std::lock_guard<std::mutex> locker(mutex);
    if (shouldUseStdErr) {
        std::cerr << output << '\n';
    } else {
        std::cout << output << '\n';
    }
}

void ConsoleSink::flush()
{
    std::lock_guard<std::mutex> locker(mutex);
    std::cout.flush();
    std::cerr.flush();
}

}   // namespace LoggingSystem
