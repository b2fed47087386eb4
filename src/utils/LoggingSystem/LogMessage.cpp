#include "LogMessage.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>

namespace LoggingSystem {

const char* LogLevelToString(LogLevel level)
{
    switch (level)
    {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default:              return "UNKNOWN";
    }
}

LogLevel StringToLogLevel(const std::string& str)
{
    if (str == "DEBUG") return LogLevel::DEBUG;
    if (str == "INFO")  return LogLevel::INFO;
    if (str == "WARN")  return LogLevel::WARN;
    if (str == "ERROR") return LogLevel::ERROR;
    if (str == "FATAL") return LogLevel::FATAL;
    return LogLevel::UNKNOWN;
}

LogMessage::LogMessage(const std::string& message, LogLevel level, const std::string& module,
                       const std::string& file, int line, const std::string& function)
    : message(message)
    , level(level)
    , timestamp(std::chrono::system_clock::now())
    , module(module)
    , threadId(std::this_thread::get_id())
    , file(file)
    , line(line)
    , function(function)
{}

std::string LogMessage::formatTime() const
{
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm_buf{};
    localtime_r(&time_t, &tm_buf);

    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()).count() % 1000;

    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << millis;
    return ss.str();
}

std::string LogMessage::singleLineMessage() const
{
    // 单行输出时把换行替换成空格
    std::string safe = message;
    for (auto& ch : safe) {
        if (ch == '\n') {
            ch = ' ';
        }
    }
    return safe;
}

std::string LogMessage::toString(bool verbose) const
{
    std::stringstream result;
    if (verbose)
    {
        // [时间][级别][模块][线程]: 消息
        //      -> 文件:行号 函数名
        std::stringstream threadStream;
        threadStream << threadId;
        result << "[" << formatTime() << "][" << LogLevelToString(level) << "][" << module
               << "][" << threadStream.str() << "]: " << message;
        for (const auto& kv : context) {
            result << " " << kv.first << "=" << kv.second;
        }
        if (!file.empty()) {
            result << "\n      -> " << file << ":" << line << " " << function;
        }
    }
    else
    {
        result << "[" << formatTime() << "][" << LogLevelToString(level) << "][" << module
               << "]: " << singleLineMessage();
    }
    return result.str();
}

std::string LogMessage::toColorString() const
{
    const char* colorCode = "\033[0m";
    switch (level)
    {
        case LogLevel::DEBUG: colorCode = "\033[34m"; break; // 蓝
        case LogLevel::INFO:  colorCode = "\033[37m"; break; // 白
        case LogLevel::WARN:  colorCode = "\033[33m"; break; // 黄
        case LogLevel::ERROR: colorCode = "\033[31m"; break; // 红
        case LogLevel::FATAL: colorCode = "\033[35m"; break; // 紫
        default: break;
    }

    std::stringstream result;
    result << colorCode << "[" << formatTime() << "][" << LogLevelToString(level) << "][" << module
           << "]: " << singleLineMessage() << "\033[0m";
    return result.str();
}

std::unordered_map<std::string, std::string> LogMessage::toMap() const
{
    std::unordered_map<std::string, std::string> out = context;

    std::stringstream threadStream;
    threadStream << threadId;

    out["timestamp"] = formatTime();
    out["threadId"] = threadStream.str();
    out["level"] = LogLevelToString(level);
    out["module"] = module;
    out["file"] = file;
    out["line"] = std::to_string(line);
    out["function"] = function;
    out["message"] = message;
    return out;
}

}   // namespace LoggingSystem
