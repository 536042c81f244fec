//! # Log Configuration from the Environment and argv
//!
//! SCOPED_LOG holds either one level name or a module filter spec. Command
//! lines may override it with the flags listed on `parse_log_options`.

#include "log/log.hpp"
#include "scoped/common.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace scoped::log {

namespace {

void apply_env_value(LogConfig& config, std::string_view value) {
    if (value.empty()) {
        return;
    }
    if (value.find_first_of("=,") != std::string_view::npos) {
        config.filter_spec = std::string(value);
    } else {
        config.level = parse_level(value);
    }
}

/// The text after `--name=` if `arg` is that flag.
auto flag_value(std::string_view arg, std::string_view name) -> std::optional<std::string_view> {
    if (arg.size() < name.size() + 3 || !arg.starts_with("--") ||
        arg.substr(2, name.size()) != name || arg[name.size() + 2] != '=') {
        return std::nullopt;
    }
    return arg.substr(name.size() + 3);
}

/// Number of 'v's in "-v", "-vv", ...; 0 for anything else.
auto verbosity(std::string_view arg) -> int {
    if (arg.size() < 2 || arg[0] != '-' || arg.find_first_not_of('v', 1) != std::string_view::npos) {
        return 0;
    }
    return static_cast<int>(arg.size() - 1);
}

} // namespace

LogConfig log_config_from_env() {
    LogConfig config;
    if (auto env = read_env("SCOPED_LOG")) {
        apply_env_value(config, *env);
    }
    return config;
}

LogConfig parse_log_options(int argc, char* argv[]) {
    LogConfig config;
    std::optional<LogLevel> explicit_level;
    bool has_filter = false;
    int verbose = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (auto value = flag_value(arg, "log-level")) {
            explicit_level = parse_level(*value);
        } else if (auto value = flag_value(arg, "log-filter")) {
            config.filter_spec = std::string(*value);
            has_filter = true;
        } else if (auto value = flag_value(arg, "log-format")) {
            config.format = (*value == "json" || *value == "JSON") ? LogFormat::JSON : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            explicit_level = LogLevel::Error;
        } else if (arg == "--verbose") {
            verbose = verbose > 0 ? verbose : 1;
        } else if (int n = verbosity(arg); n > verbose) {
            verbose = n;
        }
    }

    if (explicit_level) {
        config.level = *explicit_level;
    } else if (verbose >= 3) {
        config.level = LogLevel::Trace;
    } else if (verbose == 2) {
        config.level = LogLevel::Debug;
    } else if (verbose == 1) {
        config.level = LogLevel::Info;
    } else if (!has_filter) {
        if (auto env = read_env("SCOPED_LOG")) {
            apply_env_value(config, *env);
        }
    }

    return config;
}

} // namespace scoped::log
