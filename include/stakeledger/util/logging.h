// StakeLedger - Logging System
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// Provides a small logging system with:
// - Log levels (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)
// - Categories for filtering (ledger, accrual, vesting, ...)
// - Console and file sinks
// - Stream-style macros: LOG_INFO(LogCategory::LEDGER) << "...";

#ifndef STAKELEDGER_UTIL_LOGGING_H
#define STAKELEDGER_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace stakeledger {
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

/// Parse log level name (case-insensitive); unknown names map to Info
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* ACCRUAL = "accrual";
    constexpr const char* VESTING = "vesting";
    constexpr const char* RESERVE = "reserve";
    constexpr const char* ASSET = "asset";
    constexpr const char* DB = "db";
    constexpr const char* CONFIG = "config";
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

class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

/// Writes to stdout (errors optionally to stderr)
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{false};
        bool showTimestamp{true};
        bool showCategory{true};
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    Config config_;
    std::mutex mutex_;

    std::string Format(const LogEntry& entry) const;
};

/// Appends to a file
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path, LogLevel level = LogLevel::Debug);
    ~FileSink() override;

    bool IsOpen() const { return file_.is_open(); }

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    std::ofstream file_;
    std::mutex mutex_;
    LogLevel level_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);

    void SetLevel(LogLevel level) { level_.store(level); }

    /// Restrict output to the named categories; an empty list enables all
    void SetCategories(const std::vector<std::string>& categories);
    bool IsCategoryEnabled(const std::string& category) const;

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);

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
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message and hands it to the Logger on destruction
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category,
              const char* file, int line);
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
};

// ============================================================================
// Logging Macros
// ============================================================================

#define STAKELEDGER_LOGGER ::stakeledger::util::Logger::Instance()

#define STAKELEDGER_LOG(level, category) \
    if (!STAKELEDGER_LOGGER.WillLog(::stakeledger::util::LogLevel::level, category)) {} \
    else ::stakeledger::util::LogStream(::stakeledger::util::LogLevel::level, category, \
                                        __FILE__, __LINE__)

#define LOG_TRACE(category)   STAKELEDGER_LOG(Trace, category)
#define LOG_DEBUG(category)   STAKELEDGER_LOG(Debug, category)
#define LOG_INFO(category)    STAKELEDGER_LOG(Info, category)
#define LOG_WARN(category)    STAKELEDGER_LOG(Warn, category)
#define LOG_ERROR(category)   STAKELEDGER_LOG(Error, category)
#define LOG_FATAL(category)   STAKELEDGER_LOG(Fatal, category)

// ============================================================================
// Utility Functions
// ============================================================================

/// "2024-01-15 10:30:00.123" in local time
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Basename of a source path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace stakeledger

#endif // STAKELEDGER_UTIL_LOGGING_H
