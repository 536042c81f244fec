//! # Options from the Environment

#include "log/log.hpp"
#include "scoped/common.hpp"

#include <charconv>
#include <cstdlib>
#include <mutex>

namespace scoped {

auto read_env(const char* name) -> std::optional<std::string> {
#ifdef _WIN32
    char* env_buf = nullptr;
    size_t env_len = 0;
    if (_dupenv_s(&env_buf, &env_len, name) == 0 && env_buf) {
        std::string value = env_buf;
        free(env_buf);
        return value;
    }
    return std::nullopt;
#else
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    return std::string(value);
#endif
}

void load_options_from_env() {
    if (auto fallback = read_env("SCOPED_FORCE_FALLBACK")) {
        if (*fallback == "true" || *fallback == "1") {
            Options::force_fallback = true;
        } else if (fallback->empty() || *fallback == "false" || *fallback == "0") {
            Options::force_fallback = false;
        } else {
            SCOPED_LOG_WARN("options", "Ignoring SCOPED_FORCE_FALLBACK=" << *fallback);
        }
    }

    if (auto threshold = read_env("SCOPED_BULK_THRESHOLD")) {
        std::size_t value = 0;
        const char* first = threshold->data();
        const char* last = first + threshold->size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec == std::errc() && ptr == last && value >= 1) {
            Options::bulk_extend_threshold = value;
        } else {
            SCOPED_LOG_WARN("options", "Ignoring SCOPED_BULK_THRESHOLD=" << *threshold);
        }
    }

    SCOPED_LOG_DEBUG("options", "force_fallback=" << Options::force_fallback
                                                  << " bulk_extend_threshold="
                                                  << Options::bulk_extend_threshold);
}

void ensure_options_loaded() {
    static std::once_flag loaded;
    std::call_once(loaded, load_options_from_env);
}

} // namespace scoped
