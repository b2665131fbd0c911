// ============================================================================
// pactum/core/logging.cpp - Logger and Sink Implementation
// ============================================================================

#include "pactum/core/logging.hpp"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>

namespace pactum {

namespace {

LogLevel LevelFromEnvironment() noexcept {
    const char* value = std::getenv("PACTUM_LOG_LEVEL");
    if (value == nullptr) return LogLevel::Info;
    return ParseLogLevel(value).value_or(LogLevel::Info);
}

}  // namespace

std::string_view LogLevelName(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace:
            return "TRACE";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Off:
            return "OFF";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> ParseLogLevel(std::string_view name) noexcept {
    std::string lowered;
    lowered.reserve(name.size());
    for (char c : name) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lowered == "trace") return LogLevel::Trace;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "off") return LogLevel::Off;
    return std::nullopt;
}

// ============================================================================
// Sinks
// ============================================================================

void StderrSink::Write(const LogRecord& record) {
    auto time = std::chrono::system_clock::to_time_t(record.timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(record.timestamp.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time, &local);

    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << "[" << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0') << std::setw(3)
              << ms.count() << "] [" << std::setfill(' ') << std::left << std::setw(5) << LogLevelName(record.level)
              << std::right << "] " << record.message << '\n';
}

void CaptureSink::Write(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back(record);
}

std::vector<LogRecord> CaptureSink::Records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

bool CaptureSink::Contains(std::string_view needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& record : records_) {
        if (record.message.find(needle) != std::string::npos) return true;
    }
    return false;
}

void CaptureSink::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() : Logger(LevelFromEnvironment()) {}

Logger::Logger(LogLevel level, std::shared_ptr<LogSink> sink)
    : level_(level), sink_(sink ? std::move(sink) : std::make_shared<StderrSink>()) {}

Logger& Logger::Default() {
    static Logger instance;
    return instance;
}

void Logger::SetSink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = sink ? std::move(sink) : std::make_shared<StderrSink>();
}

void Logger::Log(LogLevel level, std::string message) noexcept {
    if (!IsEnabled(level)) return;

    try {
        std::shared_ptr<LogSink> sink;
        {
            std::lock_guard<std::mutex> lock(sink_mutex_);
            sink = sink_;
        }
        sink->Write(LogRecord{level, std::chrono::system_clock::now(), std::move(message)});
    } catch (const std::exception& e) {
        std::fputs("pactum: log sink failed: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputc('\n', stderr);
    }
}

}  // namespace pactum
