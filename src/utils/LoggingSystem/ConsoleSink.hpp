#ifndef DATASYNC_CONSOLE_SINK_HPP // 防止重复包含
#define DATASYNC_CONSOLE_SINK_HPP

#include "LogSink.hpp"

namespace LoggingSystem {

/**
 * @brief 控制台输出器
 * @details 默认写 stdout；开启 errorToStdErr 后 ERROR/FATAL 写 stderr
 */
class ConsoleSink : public LogSink
{
public:
    ConsoleSink();
    ~ConsoleSink() override;

    /// 是否使用颜色
    void setUseColor(bool value);
    bool isColorUsed() const;

    /// 错误级别及以上输出到 stderr
    void setErrorToStdErr(bool enable);
    bool errorToStdErr() const;

    /// 是否附带线程与源位置
    void setVerbose(bool enable);

    void write(const LogMessage& message) override;
    void flush() override;
    std::string name() const override { return "ConsoleSink"; }

private:
    bool useColor = true;
    bool m_errorToStdErr = false;
    bool verbose = false;
};

}   // namespace LoggingSystem

#endif  // DATASYNC_CONSOLE_SINK_HPP
