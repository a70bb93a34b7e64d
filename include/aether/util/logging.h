// AETHER - Logging System
// Copyright (c) 2024 AETHER Developers
// MIT License
//
// Provides a small logging system with:
// - Log levels (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)
// - Categories for filtering
// - Console, file and callback sinks
// - Printf-style and stream-style interfaces
//
// Never log passphrases, private keys, seeds or mnemonic words.

#ifndef AETHER_UTIL_LOGGING_H
#define AETHER_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace aether {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

/// Convert log level to string
const char* LogLevelToString(LogLevel level);

/// Parse log level from string (case-insensitive, defaults to Info)
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* HARMONIC = "harmonic";
    constexpr const char* QUANTUM = "quantum";
    constexpr const char* WALLET = "wallet";
    constexpr const char* CRYPTO = "crypto";
    constexpr const char* CONFIG = "config";
    constexpr const char* CLI = "cli";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::string function;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;
};

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

/// Writes to stdout, or stderr for errors when configured
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};           // ANSI colors when attached to a tty
        bool useStderr{true};           // Errors and above go to stderr
        bool showTimestamp{true};
        bool showLevel{true};
        bool showCategory{true};
        bool showLocation{false};       // file:line
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    const Config& GetConfig() const { return config_; }

    /// Render an entry the way Write would print it (without color)
    std::string Format(const LogEntry& entry) const;

private:
    Config config_;
    std::mutex mutex_;

    const char* GetColorCode(LogLevel level) const;
};

/// Appends to a file; one line per entry
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path, LogLevel level = LogLevel::Debug);
    ~FileSink() override;

    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    std::ofstream file_;
    std::mutex mutex_;
    LogLevel level_;
};

/// Forwards entries to a callback
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info);

    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    Callback callback_;
    LogLevel level_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    /// Get the singleton instance
    static Logger& Instance();

    /// Install the default console sink (idempotent)
    void Initialize();

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    /// Global minimum level
    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the enabled categories
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0,
             const char* function = nullptr);

    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* function,
              const char* format, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 7, 8)))
#endif
        ;

    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    mutable std::mutex categoriesMutex_;
    std::atomic<bool> allCategoriesEnabled_{true};

    std::atomic<bool> initialized_{false};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message with operator<< and emits it on destruction
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category,
              const char* file, int line, const char* function);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    std::string category_;
    const char* file_;
    int line_;
    const char* function_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define AETHER_LOGGER ::aether::util::Logger::Instance()

#define AETHER_LOG_ENABLED(level, category) \
    AETHER_LOGGER.WillLog(::aether::util::LogLevel::level, category)

#define AETHER_LOG(level, category) \
    if (!AETHER_LOG_ENABLED(level, category)) {} else \
        ::aether::util::LogStream(::aether::util::LogLevel::level, category, \
                                  __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   AETHER_LOG(Trace, category)
#define LOG_DEBUG(category)   AETHER_LOG(Debug, category)
#define LOG_INFO(category)    AETHER_LOG(Info, category)
#define LOG_WARN(category)    AETHER_LOG(Warn, category)
#define LOG_ERROR(category)   AETHER_LOG(Error, category)
#define LOG_FATAL(category)   AETHER_LOG(Fatal, category)

#define AETHER_LOGF(level, category, ...) \
    do { \
        if (AETHER_LOG_ENABLED(level, category)) { \
            AETHER_LOGGER.LogF(::aether::util::LogLevel::level, category, \
                               __FILE__, __LINE__, __func__, __VA_ARGS__); \
        } \
    } while (0)

#define LogDebugF(category, ...)  AETHER_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   AETHER_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   AETHER_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  AETHER_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Scoped Log Timer
// ============================================================================

/// RAII timer; logs the elapsed time of a scope at Debug level
class ScopedLogTimer {
public:
    ScopedLogTimer(const std::string& category, const std::string& operation);
    ~ScopedLogTimer();

private:
    std::string category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

#define AETHER_LOG_TIMER_CAT2(a, b) a##b
#define AETHER_LOG_TIMER_CAT(a, b) AETHER_LOG_TIMER_CAT2(a, b)
#define AETHER_LOG_TIMER(category, operation) \
    ::aether::util::ScopedLogTimer AETHER_LOG_TIMER_CAT(aether_timer_, __LINE__)(category, operation)

// ============================================================================
// Utility Functions
// ============================================================================

/// Format timestamp as "YYYY-MM-DD HH:MM:SS.mmm" in local time
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Get basename from file path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace aether

#endif // AETHER_UTIL_LOGGING_H
