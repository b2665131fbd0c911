// ============================================================================
// pactum/core/logging.hpp - Leveled Logging
// ============================================================================
//
// A process-wide Logger with a swappable sink. The initial level comes from
// the PACTUM_LOG_LEVEL environment variable (trace, debug, info, warn,
// error, off; default info). Messages are composed with operator<< only
// when the level is enabled, so disabled debug logging costs one atomic
// load.
//
// USAGE:
// ------
//   PACTUM_LOG_INFO("task " << id << " assigned to " << freelancer);
//
//   auto capture = std::make_shared<CaptureSink>();
//   Logger::Default().SetSink(capture);   // e.g. in a test fixture
//
// ============================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace pactum {

enum class LogLevel : uint8_t {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5,
};

std::string_view LogLevelName(LogLevel level) noexcept;

// Case-insensitive; "warning" is accepted as an alias of "warn"
std::optional<LogLevel> ParseLogLevel(std::string_view name) noexcept;

struct LogRecord {
    LogLevel level;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
};

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
   public:
    virtual ~LogSink() = default;
    virtual void Write(const LogRecord& record) = 0;
};

// Writes "[2026-01-01 12:00:00.123] [INFO ] message" lines to stderr
class StderrSink : public LogSink {
   public:
    void Write(const LogRecord& record) override;

   private:
    std::mutex mutex_;
};

// Keeps every record in memory
class CaptureSink : public LogSink {
   public:
    void Write(const LogRecord& record) override;

    std::vector<LogRecord> Records() const;
    bool Contains(std::string_view needle) const;
    void Clear();

   private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
};

// ============================================================================
// Logger
// ============================================================================
class Logger {
   public:
    Logger();
    explicit Logger(LogLevel level, std::shared_ptr<LogSink> sink = nullptr);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static Logger& Default();

    void SetLevel(LogLevel level) noexcept { level_.store(level, std::memory_order_relaxed); }
    LogLevel Level() const noexcept { return level_.load(std::memory_order_relaxed); }

    bool IsEnabled(LogLevel level) const noexcept {
        auto current = Level();
        return current != LogLevel::Off && level >= current;
    }

    // Replace the sink; nullptr restores the stderr sink
    void SetSink(std::shared_ptr<LogSink> sink);

    // Never throws; a failing sink drops the record
    void Log(LogLevel level, std::string message) noexcept;

   private:
    std::atomic<LogLevel> level_;
    std::mutex sink_mutex_;
    std::shared_ptr<LogSink> sink_;
};

}  // namespace pactum

#define PACTUM_LOG(level, expr)                                   \
    do {                                                          \
        auto& pactum_logger_ = ::pactum::Logger::Default();       \
        if (pactum_logger_.IsEnabled(level)) {                    \
            std::ostringstream pactum_log_stream_;                \
            pactum_log_stream_ << expr;                           \
            pactum_logger_.Log(level, pactum_log_stream_.str());  \
        }                                                         \
    } while (0)

#define PACTUM_LOG_TRACE(expr) PACTUM_LOG(::pactum::LogLevel::Trace, expr)
#define PACTUM_LOG_DEBUG(expr) PACTUM_LOG(::pactum::LogLevel::Debug, expr)
#define PACTUM_LOG_INFO(expr) PACTUM_LOG(::pactum::LogLevel::Info, expr)
#define PACTUM_LOG_WARN(expr) PACTUM_LOG(::pactum::LogLevel::Warn, expr)
#define PACTUM_LOG_ERROR(expr) PACTUM_LOG(::pactum::LogLevel::Error, expr)
