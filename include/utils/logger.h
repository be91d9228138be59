#pragma once
#include "utils/log_stream.h"
#include "utils/timestamp.h"
#include <functional>
#include <string>

// 负责给每条日志加上时间戳、线程ID、级别和源码位置
class Logger{
public:
    enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL, NUM_LOG_LEVELS };

    Logger(const char* file, int line, LogLevel level);
    ~Logger();

    LogStream& stream() { return impl_.stream_; }

    static LogLevel logLevel();
    static void setLogLevel(LogLevel level);

    // 配置文件中的级别名，不区分大小写，无法识别时返回 INFO
    static LogLevel parseLevel(const std::string& name);
    static const char* levelName(LogLevel level);

    using OutputFunc = std::function<void(const char* msg, int len)>;
    using FlushFunc = std::function<void()>;
    static void setOutput(OutputFunc out);
    static void setFlush(FlushFunc flush);

private:
    class Impl {
    public:
        Impl(LogLevel level, const char* file, int line);
        void finish();

        Timestamp time_;
        LogStream stream_;
        LogLevel level_;
        int line_;
        const char* basename_;
    };
    Impl impl_;
};

extern Logger::LogLevel g_logLevel;
inline Logger::LogLevel Logger::logLevel() { return g_logLevel; }

#define LOG_TRACE if (Logger::logLevel() <= Logger::TRACE) \
    Logger(__FILE__, __LINE__, Logger::TRACE).stream()
#define LOG_DEBUG if (Logger::logLevel() <= Logger::DEBUG) \
    Logger(__FILE__, __LINE__, Logger::DEBUG).stream()
#define LOG_INFO if (Logger::logLevel() <= Logger::INFO) \
    Logger(__FILE__, __LINE__, Logger::INFO).stream()
#define LOG_WARN Logger(__FILE__, __LINE__, Logger::WARN).stream()
#define LOG_ERROR Logger(__FILE__, __LINE__, Logger::ERROR).stream()
#define LOG_FATAL Logger(__FILE__, __LINE__, Logger::FATAL).stream()
