//! # Logging
//!
//! Leveled, module-tagged logging for the `scoped` library and its tools:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-component filtering
//! - Console (stderr, text or JSON lines) and Null sinks
//! - Thread-safe output with mutex protection
//! - Compile-time level elision via SCOPED_MIN_LOG_LEVEL
//! - Configuration from the SCOPED_LOG environment variable
//!
//! ## Usage
//!
//! ```cpp
//! SCOPED_LOG_DEBUG("carrier", "Selected " << name << " carrier");
//! SCOPED_LOG_WARN("registry", "Var " << name << " shadows #" << id);
//! ```
//!
//! Module tags used by the library: `carrier`, `scope`, `registry`, `options`.

#ifndef SCOPED_LOG_HPP
#define SCOPED_LOG_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace scoped::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained internal tracing
    Debug = 1, ///< Debugging information
    Info = 2,  ///< General informational messages
    Warn = 3,  ///< Potential issues
    Error = 4, ///< Recoverable errors
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

inline constexpr const char* LEVEL_NAMES[] = {"TRACE", "DEBUG", "INFO", "WARN",
                                              "ERROR", "FATAL", "OFF"};

/// Upper-case name of a level ("TRACE" ... "OFF").
inline const char* level_name(LogLevel level) {
    auto index = static_cast<int>(level);
    return index >= 0 && index <= static_cast<int>(LogLevel::Off) ? LEVEL_NAMES[index] : "???";
}

/// Parses a level name in any letter case ("warn", "WARN", "Warn").
/// Returns LogLevel::Info if the string is not recognized.
inline LogLevel parse_level(std::string_view s) {
    for (int i = 0; i <= static_cast<int>(LogLevel::Off); ++i) {
        std::string_view name = LEVEL_NAMES[i];
        if (name.size() != s.size()) {
            continue;
        }
        bool same = true;
        for (std::size_t j = 0; j < s.size() && same; ++j) {
            char c = s[j];
            same = (c >= 'a' && c <= 'z' ? static_cast<char>(c - 'a' + 'A') : c) == name[j];
        }
        if (same) {
            return static_cast<LogLevel>(i);
        }
    }
    return LogLevel::Info;
}

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g., "carrier")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< Human-readable text with optional ANSI colors
    JSON  ///< One JSON object per line
};

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Console sink that writes to stderr with optional ANSI colors.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

    /// Renders a record the way `write` would, without the trailing newline.
    std::string render(const LogRecord& record) const;

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
};

/// Null sink that discards all messages.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based log level filter.
///
/// Parses filter strings like "carrier=trace,registry=debug,*=warn".
class LogFilter {
public:
    LogFilter() = default;

    /// Format: "module1=level,module2=level,*=default_level".
    /// A module name without "=level" enables Trace for that module.
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// The lowest level configured for any module or the default.
    LogLevel min_level() const {
        LogLevel min = default_level_;
        for (const auto& [_, level] : module_levels_) {
            if (level < min)
                min = level;
        }
        return min;
    }

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;    ///< Global minimum log level
    LogFormat format = LogFormat::Text; ///< Output format
    std::string filter_spec;            ///< Module filter string
    bool console = true;                ///< Enable console (stderr) output
    bool colors = true;                 ///< Enable ANSI colors on console
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe global logger.
///
/// On first use the logger configures itself from SCOPED_LOG (see
/// `log_config_from_env`); `Logger::init()` replaces that configuration.
class Logger {
public:
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before formatting the message.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink (messages are dropped until one is added).
    void clear_sinks();

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_.load(std::memory_order_relaxed);
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    void configure(const LogConfig& config);

    std::atomic<LogLevel> level_{LogLevel::Warn};
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Timestamp Helpers
// ============================================================================

/// Returns current local time formatted as "HH:MM:SS.mmm".
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto now_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &now_c);
#else
    localtime_r(&now_c, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << now_ms.count();
    return oss.str();
}

/// Returns milliseconds since epoch.
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// Configuration Parsing
// ============================================================================

/// Builds a LogConfig from the SCOPED_LOG environment variable.
///
/// SCOPED_LOG holds either a level name ("debug") or a filter spec
/// ("carrier=trace,*=warn"). Unset means Warn.
LogConfig log_config_from_env();

/// Parses logging options from argv for executables.
/// Extracts: --log-level, --log-filter, --log-format, -v/-vv/-vvv, -q.
/// Falls back to SCOPED_LOG when neither a level nor a filter is given.
LogConfig parse_log_options(int argc, char* argv[]);

// ============================================================================
// Logging Macros
// ============================================================================

// Define SCOPED_MIN_LOG_LEVEL before including this header to elide calls
// below that level at compile time (0=Trace ... 6=Off).
#ifndef SCOPED_MIN_LOG_LEVEL
#define SCOPED_MIN_LOG_LEVEL 0
#endif

/// Internal macro, do not use directly.
#define SCOPED_LOG_IMPL(level, module_str, msg)                                                    \
    do {                                                                                           \
        if (static_cast<int>(level) >= SCOPED_MIN_LOG_LEVEL) {                                     \
            auto& logger_ = ::scoped::log::Logger::instance();                                     \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define SCOPED_LOG_TRACE(module, msg) SCOPED_LOG_IMPL(::scoped::log::LogLevel::Trace, module, msg)
#define SCOPED_LOG_DEBUG(module, msg) SCOPED_LOG_IMPL(::scoped::log::LogLevel::Debug, module, msg)
#define SCOPED_LOG_INFO(module, msg) SCOPED_LOG_IMPL(::scoped::log::LogLevel::Info, module, msg)
#define SCOPED_LOG_WARN(module, msg) SCOPED_LOG_IMPL(::scoped::log::LogLevel::Warn, module, msg)
#define SCOPED_LOG_ERROR(module, msg) SCOPED_LOG_IMPL(::scoped::log::LogLevel::Error, module, msg)
#define SCOPED_LOG_FATAL(module, msg) SCOPED_LOG_IMPL(::scoped::log::LogLevel::Fatal, module, msg)

} // namespace scoped::log

#endif // SCOPED_LOG_HPP
