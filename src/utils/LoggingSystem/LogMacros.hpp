#ifndef DATASYNC_LOG_MACROS_HPP // 防止重复包含
#define DATASYNC_LOG_MACROS_HPP

#include <string>
#include "Logger.hpp"
#include "LogMessage.hpp"

namespace LoggingSystem {

namespace Internal {
// 创建日志消息
inline LogMessage createLogMessage(const std::string& message,
                                   LogLevel level,
                                   const std::string& module,
                                   const char* file,
                                   int line,
                                   const char* function) {
    return LogMessage(message, level, module, file, line, function);
}

// 低于最小级别时跳过消息构造
inline bool shouldLog(LogLevel level) {
    auto* logger = Logger::GetInstance();
    return logger->isEnabled() && level >= logger->getMinimumLogLevel();
}
} // namespace Internal

} // namespace LoggingSystem

#define LOGGER LoggingSystem::Logger::GetInstance()

#define LOG(level, module, message) \
    do { \
        if (LoggingSystem::Internal::shouldLog(level)) { \
            LOGGER->log(LoggingSystem::Internal::createLogMessage( \
                (message), (level), (module), __FILE__, __LINE__, __FUNCTION__)); \
        } \
    } while (0)

#define LOG_DEBUG(module, message) \
    LOG(LoggingSystem::LogLevel::DEBUG, module, message)

#define LOG_INFO(module, message) \
    LOG(LoggingSystem::LogLevel::INFO, module, message)

#define LOG_WARN(module, message) \
    LOG(LoggingSystem::LogLevel::WARN, module, message)

#define LOG_ERROR(module, message) \
    LOG(LoggingSystem::LogLevel::ERROR, module, message)

#define LOG_FATAL(module, message) \
    LOG(LoggingSystem::LogLevel::FATAL, module, message)

// 条件日志
#define LOG_DEBUG_IF(condition, module, message) \
    do { \
        if (condition) { \
            LOG_DEBUG(module, message); \
        } \
    } while (0)

// 带上下文的日志
#define LOG_WITH_CONTEXT(level, module, message, ctx) \
    do { \
        if (LoggingSystem::Internal::shouldLog(level)) { \
            LoggingSystem::LogMessage msg_ = LoggingSystem::Internal::createLogMessage( \
                (message), (level), (module), __FILE__, __LINE__, __FUNCTION__); \
            msg_.context = (ctx); \
            LOGGER->log(std::move(msg_)); \
        } \
    } while (0)

#endif // DATASYNC_LOG_MACROS_HPP
