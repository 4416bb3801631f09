// QUORUM - Logging System
// Copyright (c) 2024 QUORUM Developers
// MIT License
//
// Leveled, categorized logging with pluggable sinks (console, file, callback)
// and stream-style (LOG_INFO(cat) << ...) or printf-style (LogInfoF) macros.
// Thread-safe.

#ifndef QUORUM_UTIL_LOGGING_H
#define QUORUM_UTIL_LOGGING_H

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

namespace quorum {
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

const char* LogLevelToString(LogLevel level);

/// Parse "debug", "WARN", ...; unknown strings give Info
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* GOVERNANCE = "governance";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* TOKEN = "token";
    constexpr const char* DB = "db";
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
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;
};

// ============================================================================
// Sinks
// ============================================================================

/// Output destination for log entries
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;

    /// Entries below this level are dropped by the sink
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

/// Writes to stdout (errors optionally to stderr)
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{true};
        bool showTimestamp{true};
        bool showCategory{true};
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink() = default;
    explicit ConsoleSink(const Config& config) : config_(config) {}

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    std::string Format(const LogEntry& entry) const;

    Config config_;
    std::mutex mutex_;
};

/// Appends to a log file (debug.log in the data directory)
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path, LogLevel level = LogLevel::Debug);
    ~FileSink() override;

    bool IsOpen() const { return file_.is_open(); }
    const std::string& GetPath() const { return path_; }

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    std::string path_;
    std::ofstream file_;
    std::mutex mutex_;
    LogLevel level_;
};

/// Forwards entries to a callback; used by tests to capture output
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Trace)
        : callback_(std::move(callback)), level_(level) {}

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
    static Logger& Instance();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    /// Global minimum level
    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the enabled categories. Until the first
    /// EnableCategory call every category is logged.
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    void EnableAllCategories();
    bool IsCategoryEnabled(const std::string& category) const;

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);

    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* format, ...);

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
    std::atomic<bool> allCategoriesEnabled_{true};
    mutable std::mutex categoriesMutex_;
};

/// Configure the global logger for a tool run: console output when
/// printToConsole, plus a FileSink when logFile is non-empty.
/// Returns false if the log file could not be opened.
bool InitLogging(LogLevel level, bool printToConsole, const std::string& logFile);

// ============================================================================
// Log Stream
// ============================================================================

/// Collects one message and hands it to the Logger on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line)
        : level_(level), category_(category), file_(file), line_(line) {}
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
    const char* category_;
    const char* file_;
    int line_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define QUORUM_LOGGER ::quorum::util::Logger::Instance()

#define QUORUM_LOG_ENABLED(level, category) \
    QUORUM_LOGGER.WillLog(::quorum::util::LogLevel::level, category)

#define QUORUM_LOG(level, category) \
    if (!QUORUM_LOG_ENABLED(level, category)) {} else \
        ::quorum::util::LogStream(::quorum::util::LogLevel::level, category, \
                                  __FILE__, __LINE__)

#define LOG_TRACE(category)   QUORUM_LOG(Trace, category)
#define LOG_DEBUG(category)   QUORUM_LOG(Debug, category)
#define LOG_INFO(category)    QUORUM_LOG(Info, category)
#define LOG_WARN(category)    QUORUM_LOG(Warn, category)
#define LOG_ERROR(category)   QUORUM_LOG(Error, category)

#define QUORUM_LOGF(level, category, ...) \
    do { \
        if (QUORUM_LOG_ENABLED(level, category)) { \
            QUORUM_LOGGER.LogF(::quorum::util::LogLevel::level, category, \
                               __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while (0)

#define LogDebugF(category, ...)  QUORUM_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   QUORUM_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   QUORUM_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  QUORUM_LOGF(Error, category, __VA_ARGS__)

/// "2024-05-01 12:00:00.123"
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

} // namespace util
} // namespace quorum

#endif // QUORUM_UTIL_LOGGING_H
