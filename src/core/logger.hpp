// 日志模块（全局单例，按组件打标签）

#pragma once

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <iomanip>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace core {

enum class LogLevel {
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Critical
};

// 把配置文件里的字符串（"debug"、"INFO"...）解析成日志级别，无法识别返回 nullopt
std::optional<LogLevel> parseLogLevel(std::string_view text);

// 日志级别转字符串
std::string_view levelToString(LogLevel level);

// 旁路输出：每条通过级别过滤的日志都会回调一次（测试里用来收集日志）
using LogSink = std::function<void(LogLevel, std::string_view component, const std::string& message)>;

// Logger 类（单例模式）
class Logger {
public:
    static Logger& instance();

    // 配置日志（启动时调用一次）
    // level: 最低日志级别
    // filePath: 日志文件路径，为空则不写文件
    // useConsole: 是否同时输出到控制台（写到 stderr，stdout 留给查询结果）
    void configure(LogLevel level, const std::string& filePath = "", bool useConsole = true);

    void setLevel(LogLevel level) { minLevel_.store(level); }
    LogLevel level() const { return minLevel_.load(); }

    // 设置 / 清除旁路输出
    void setSink(LogSink sink);
    void clearSink();

    // 可变参数模板日志函数，例如 LOG_INFO("connection", "attempt ", 3, " of ", 5);
    template <typename... Args>
    void log(LogLevel level, std::string_view component, Args&&... args) {
        if (level < minLevel_.load()) {
            return;
        }

        std::ostringstream oss;
        (oss << ... << std::forward<Args>(args));

        write(level, component, oss.str());
    }

private:
    Logger() = default;
    ~Logger() = default;

    void write(LogLevel level, std::string_view component, const std::string& message);

    std::mutex mutex_;
    std::atomic<LogLevel> minLevel_{LogLevel::Info};
    std::ofstream fileStream_;
    bool consoleEnabled_{true};
    bool fileEnabled_{false};
    LogSink sink_;
};

} // namespace core

#define LOG_TRACE(component, ...) ::core::Logger::instance().log(::core::LogLevel::Trace, component, __VA_ARGS__)
#define LOG_DEBUG(component, ...) ::core::Logger::instance().log(::core::LogLevel::Debug, component, __VA_ARGS__)
#define LOG_INFO(component, ...)  ::core::Logger::instance().log(::core::LogLevel::Info, component, __VA_ARGS__)
#define LOG_WARN(component, ...)  ::core::Logger::instance().log(::core::LogLevel::Warn, component, __VA_ARGS__)
#define LOG_ERROR(component, ...) ::core::Logger::instance().log(::core::LogLevel::Error, component, __VA_ARGS__)
#define LOG_CRITICAL(component, ...) ::core::Logger::instance().log(::core::LogLevel::Critical, component, __VA_ARGS__)
