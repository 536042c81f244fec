//! # Common Definitions
//!
//! Types and process-wide settings shared by every `scoped` component.
//!
//! ## Overview
//!
//! - **Version Information**: library version constants
//! - **Options**: process configuration, read once from the environment
//! - **Result Type**: error values for input that callers are expected to
//!   validate (binding forms)
//!
//! Contract violations at an API boundary (an unbound var, a malformed
//! `Binding`) are reported with exceptions; see `scoped/error.hpp`.

#ifndef SCOPED_COMMON_HPP
#define SCOPED_COMMON_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace scoped {

// ============================================================================
// Version Information
// ============================================================================

/// The library version string.
constexpr const char* VERSION = "0.1.14";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 14;

// ============================================================================
// Identity
// ============================================================================

/// Process-unique identity of a dynamically scoped variable.
///
/// Ids are drawn from a monotonically increasing counter and never reused,
/// so a scope map never confuses a destroyed var with a new one that happens
/// to live at the same address.
using VarId = std::uint64_t;

// ============================================================================
// Options
// ============================================================================

/// Process-wide configuration.
///
/// Fields are applied from the environment by `load_options_from_env()`,
/// which runs once before the carrier is first selected. Environment values
/// take precedence over assignments made before that point.
///
/// | Field                   | Environment              |
/// |-------------------------|--------------------------|
/// | `force_fallback`        | `SCOPED_FORCE_FALLBACK`  |
/// | `bulk_extend_threshold` | `SCOPED_BULK_THRESHOLD`  |
struct Options {
    /// Select the thread-local cell carrier even when the structured-scope
    /// carrier is available.
    static inline bool force_fallback = false;

    /// Extensions with at least this many bindings go through
    /// `ScopeMap::Builder` instead of chained `assoc` calls.
    static inline std::size_t bulk_extend_threshold = 8;
};

/// Applies `SCOPED_FORCE_FALLBACK` and `SCOPED_BULK_THRESHOLD` to `Options`.
/// Unrecognized values are logged and ignored.
void load_options_from_env();

/// Runs `load_options_from_env()` exactly once per process.
void ensure_options_loaded();

/// Reads an environment variable; `std::nullopt` if it is not set.
[[nodiscard]] auto read_env(const char* name) -> std::optional<std::string>;

// ============================================================================
// Result Type
// ============================================================================

/// Either a success value or an error.
///
/// # Example
///
/// ```cpp
/// auto result = extend_scope_forms(current_scope(), forms);
/// if (is_err(result)) {
///     std::cerr << unwrap_err(result).to_string() << "\n";
/// }
/// ```
template <typename T, typename E> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

} // namespace scoped

#endif // SCOPED_COMMON_HPP
