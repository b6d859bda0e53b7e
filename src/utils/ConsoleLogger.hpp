#pragma once
#include "ILogger.hpp"
#include <atomic>
#include <mutex>
#include <string>

// 控制台日志器，可被引擎线程和界面线程同时调用
class ConsoleLogger : public ILogger {
private:
    std::atomic<LogLevel> level;
    std::mutex outputMutex;

public:
    explicit ConsoleLogger(LogLevel minLevel = LogLevel::INFO);

    void info(const std::string& message) override;

    void error(const std::string& message) override;

    void warn(const std::string& message) override;

    void debug(const std::string& message) override;

    void setLogLevel(LogLevel minLevel) override;

    LogLevel getLogLevel() const override;

    void log(LogLevel messageLevel, const std::string& message) override;
};
