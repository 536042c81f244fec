//! # Logger Implementation
//!
//! Logger singleton, ConsoleSink rendering and LogFilter parsing.

#include "log/log.hpp"
#include "scoped/common.hpp"

#include <array>
#include <cstdio>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace scoped::log {

namespace {

// ============================================================================
// Console Helpers
// ============================================================================

/// ANSI colors are used only on a POSIX terminal that is not "dumb" and when
/// NO_COLOR is unset.
auto stderr_supports_colors() -> bool {
#ifdef _WIN32
    return false;
#else
    if (read_env("NO_COLOR") || isatty(fileno(stderr)) == 0) {
        return false;
    }
    auto term = read_env("TERM");
    return term && *term != "dumb";
#endif
}

constexpr std::array<const char*, 7> LEVEL_COLORS = {
    "\033[90m",   // Trace
    "\033[36m",   // Debug
    "\033[32m",   // Info
    "\033[33m",   // Warn
    "\033[31m",   // Error
    "\033[1;31m", // Fatal
    "",           // Off
};

constexpr const char* COLOR_RESET = "\033[0m";

auto level_color(LogLevel level) -> const char* {
    return LEVEL_COLORS[static_cast<std::size_t>(level)];
}

/// Writes `text` as the body of a JSON string.
void write_json_string(std::ostream& out, std::string_view text) {
    for (char c : text) {
        switch (c) {
        case '"':
            out << "\\\"";
            break;
        case '\\':
            out << "\\\\";
            break;
        case '\n':
            out << "\\n";
            break;
        case '\r':
            out << "\\r";
            break;
        case '\t':
            out << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                out << buf;
            } else {
                out << c;
            }
        }
    }
}

auto trim(std::string_view s) -> std::string_view {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

} // namespace

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors) : colors_enabled_(use_colors && stderr_supports_colors()) {}

std::string ConsoleSink::render(const LogRecord& record) const {
    std::ostringstream out;

    if (format_ == LogFormat::JSON) {
        out << "{\"ts\":" << record.timestamp_ms << ",\"level\":\"" << level_name(record.level)
            << "\",\"module\":\"";
        write_json_string(out, record.module);
        out << "\",\"msg\":\"";
        write_json_string(out, record.message);
        out << "\"}";
        return out.str();
    }

    // HH:MM:SS.mmm LEVEL [module] message
    out << get_timestamp() << ' ';
    if (colors_enabled_) {
        out << level_color(record.level) << std::left << std::setw(5) << level_name(record.level)
            << COLOR_RESET;
    } else {
        out << std::left << std::setw(5) << level_name(record.level);
    }
    out << " [" << record.module << "] " << record.message;
    return out.str();
}

void ConsoleSink::write(const LogRecord& record) {
    // One insertion per record so concurrent writers never interleave a line.
    std::cerr << render(record) + "\n";
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();

    while (!spec.empty()) {
        std::size_t comma = spec.find(',');
        std::string_view entry = trim(spec.substr(0, comma));
        spec = comma == std::string_view::npos ? std::string_view() : spec.substr(comma + 1);

        if (entry.empty()) {
            continue;
        }

        std::size_t eq = entry.find('=');
        if (eq == std::string_view::npos) {
            module_levels_[std::string(entry)] = LogLevel::Trace;
            continue;
        }

        std::string_view module = trim(entry.substr(0, eq));
        LogLevel level = parse_level(trim(entry.substr(eq + 1)));
        if (module == "*") {
            default_level_ = level;
        } else {
            module_levels_[std::string(module)] = level;
        }
    }
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    auto it = module_levels_.find(std::string(module));
    LogLevel threshold = it != module_levels_.end() ? it->second : default_level_;
    return level >= threshold;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    configure(log_config_from_env());
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    instance().configure(config);
}

void Logger::configure(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    filter_ = LogFilter();
    filter_.set_default_level(config.level);
    if (!config.filter_spec.empty()) {
        // A "*=level" entry in the spec replaces the configured default.
        filter_.parse(config.filter_spec);
    }
    level_.store(filter_.min_level(), std::memory_order_relaxed);

    sinks_.clear();
    if (config.console) {
        auto console = std::make_unique<ConsoleSink>(config.colors);
        console->set_format(config.format);
        sinks_.push_back(std::move(console));
    }
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    if (level < level_.load(std::memory_order_relaxed)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    log(LogRecord{level, module, message, file, line, epoch_ms()});
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.set_default_level(level);
    level_.store(filter_.min_level(), std::memory_order_relaxed);
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    level_.store(filter_.min_level(), std::memory_order_relaxed);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace scoped::log
