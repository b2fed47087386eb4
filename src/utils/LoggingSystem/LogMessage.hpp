#ifndef DATASYNC_LOG_MESSAGE_HPP // 防止重复包含
#define DATASYNC_LOG_MESSAGE_HPP

#include <string>
#include <chrono>
#include <thread>
#include <unordered_map>

/**
 * @brief 日志系统命名空间，用于封装日志系统相关的类和函数
 */
namespace LoggingSystem {

/**
 * @brief 日志级别
 */
enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL,
    UNKNOWN,
};

// 日志级别 <-> 字符串
const char* LogLevelToString(LogLevel level);
LogLevel StringToLogLevel(const std::string& str);

/**
 * @brief 日志消息
 * @details 一条日志记录：消息正文、级别、模块、产生位置、线程与时间
 */
class LogMessage {
public:
    LogMessage() = default;

    /**
     * @param message 日志消息
     * @param level 日志级别
     * @param module 日志模块（如 "LOCK"、"DEADLOCK"）
     * @param file 源文件
     * @param line 行号
     * @param function 函数名
     */
    LogMessage(const std::string& message, LogLevel level, const std::string& module,
               const std::string& file = "", int line = 0, const std::string& function = "");

    // [时间][级别][模块]: 消息；verbose 时附带线程与源位置
    std::string toString(bool verbose = false) const;
    // 带 ANSI 颜色的单行格式
    std::string toColorString() const;
    // 扁平的键值表示
    std::unordered_map<std::string, std::string> toMap() const;

    std::string message;
    LogLevel level = LogLevel::INFO;
    std::chrono::system_clock::time_point timestamp;
    std::string module;
    std::thread::id threadId;
    std::string file;
    int line = 0;
    std::string function;
    std::unordered_map<std::string, std::string> context; // 附加上下文（键值）

private:
    std::string formatTime() const;
    std::string singleLineMessage() const;
};

}   // namespace LoggingSystem

#endif  // DATASYNC_LOG_MESSAGE_HPP
