#pragma once

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>

namespace gurgeh {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

[[nodiscard]] inline const char* level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO ";
        case LogLevel::Warn: return "WARN ";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off: return "OFF  ";
    }
    return "UNKNOWN";
}

// ============================================================================
// Logger
// ============================================================================

/**
 * @brief Process-wide logger shared by every engine component.
 *
 * Messages below the configured level are dropped before formatting. The
 * default sink writes timestamped lines to stderr; hosts (GUI, tests) can
 * install their own sink.
 *
 * @threadsafety All methods are thread-safe. The sink is invoked under the
 * logger mutex, so sinks must not log re-entrantly.
 */
class Logger {
public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static Logger& get() {
        static Logger instance;
        return instance;
    }

    void set_level(LogLevel level) {
        level_.store(level, std::memory_order_relaxed);
    }

    LogLevel level() const {
        return level_.load(std::memory_order_relaxed);
    }

    bool enabled(LogLevel level) const {
        return level != LogLevel::Off && level >= this->level();
    }

    /// Replace the sink; an empty function restores the stderr sink.
    void set_sink(Sink sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(sink);
    }

    void log(LogLevel level, const std::string& message) {
        if (!enabled(level)) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (sink_) {
            sink_(level, message);
            return;
        }
        write_stderr(level, message);
    }

private:
    Logger() = default;

    static void write_stderr(LogLevel level, const std::string& message) {
        auto now = std::chrono::system_clock::now();
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &t);
#else
        localtime_r(&t, &tm_buf);
#endif
        char stamp[32];
        std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_buf);
        std::fprintf(stderr, "%s [%s] [gurgeh] %s\n", stamp, level_to_string(level), message.c_str());
    }

    std::atomic<LogLevel> level_{LogLevel::Warn};
    std::mutex mutex_;
    Sink sink_;
};

} // namespace gurgeh

// Stream-style logging: GURGEH_LOG_INFO("round " << n << " started");
#define GURGEH_LOG_AT(lvl, expr)                                              \
    do {                                                                      \
        if (::gurgeh::Logger::get().enabled(lvl)) {                           \
            std::ostringstream gurgeh_log_stream_;                            \
            gurgeh_log_stream_ << expr;                                       \
            ::gurgeh::Logger::get().log(lvl, gurgeh_log_stream_.str());       \
        }                                                                     \
    } while (0)

#define GURGEH_LOG_DEBUG(expr) GURGEH_LOG_AT(::gurgeh::LogLevel::Debug, expr)
#define GURGEH_LOG_INFO(expr) GURGEH_LOG_AT(::gurgeh::LogLevel::Info, expr)
#define GURGEH_LOG_WARN(expr) GURGEH_LOG_AT(::gurgeh::LogLevel::Warn, expr)
#define GURGEH_LOG_ERROR(expr) GURGEH_LOG_AT(::gurgeh::LogLevel::Error, expr)
