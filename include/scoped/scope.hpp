//! # Scope Lifecycle and Resolution
//!
//! The entry points callers use:
//!
//! | Operation                    | Effect                                              |
//! |------------------------------|-----------------------------------------------------|
//! | `current_scope()`            | capture the active map                              |
//! | `extend_scope(scope, ...)`   | new map with bindings applied (pure)                |
//! | `with_scope(scope, body)`    | run `body` with `scope` installed                   |
//! | `scoping({bindings}, body)`  | `with_scope(extend_scope(current_scope(), ...), …)` |
//! | `ask(var)` / `ask(var, d)`   | resolve a var: scope, then root, then `d` or throw  |
//! | `bound_fn(f)`                | capture now, reinstall whenever `f` is invoked      |
//!
//! ## Example
//!
//! ```cpp
//! scoped::Var<std::string> request_id{"http/request-id"};
//!
//! void handle() {
//!     log_line(scoped::ask(request_id)); // no parameter threading
//! }
//!
//! scoped::scoping({scoped::bind(request_id, "r-17")}, [] { handle(); });
//! ```
//!
//! Nothing is propagated to other threads on its own. To continue a scope
//! on a worker, capture it and reinstall it there:
//!
//! ```cpp
//! auto scope = scoped::current_scope();
//! std::thread worker([scope] { scoped::with_scope(scope, [] { handle(); }); });
//! ```

#ifndef SCOPED_SCOPE_HPP
#define SCOPED_SCOPE_HPP

#include "scoped/carrier.hpp"
#include "scoped/common.hpp"
#include "scoped/error.hpp"
#include "scoped/scope_map.hpp"
#include "scoped/var.hpp"

#include <any>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

namespace scoped {

// ============================================================================
// Lifecycle
// ============================================================================

/// The map active on the calling thread, or the empty map.
[[nodiscard]] auto current_scope() -> ScopeMap;

/// `scope` with `bindings` applied left to right (last wins). Does not touch
/// the carrier.
[[nodiscard]] auto extend_scope(const ScopeMap& scope, std::span<const Binding> bindings)
    -> ScopeMap;

[[nodiscard]] inline auto extend_scope(const ScopeMap& scope,
                                       std::initializer_list<Binding> bindings) -> ScopeMap {
    return extend_scope(scope, std::span<const Binding>(bindings.begin(), bindings.size()));
}

/// `extend_scope` over a flat list of binding forms (see `scoped/registry.hpp`).
/// An invalid list yields a `ScopeError` and no map.
[[nodiscard]] auto extend_scope_forms(const ScopeMap& scope, const std::vector<std::any>& forms)
    -> Result<ScopeMap, ScopeError>;

/// Runs `body` with `scope` installed on the calling thread and returns its
/// result. The previously active map is restored before `with_scope`
/// returns or before an exception from `body` leaves it.
template <typename F> decltype(auto) with_scope(const ScopeMap& scope, F&& body) {
    using R = std::invoke_result_t<F&>;
    Carrier& carrier = global_carrier();

    if constexpr (std::is_void_v<R>) {
        carrier.run(scope, [&body] { std::invoke(body); });
    } else if constexpr (std::is_reference_v<R>) {
        std::remove_reference_t<R>* result = nullptr;
        carrier.run(scope, [&body, &result] {
            auto&& ref = std::invoke(body);
            result = std::addressof(ref);
        });
        return static_cast<R>(*result);
    } else {
        std::optional<R> result;
        carrier.run(scope, [&body, &result] { result.emplace(std::invoke(body)); });
        return R(std::move(*result));
    }
}

/// Extends the current scope with `bindings` and runs `body` under it.
template <typename F> decltype(auto) scoping(std::initializer_list<Binding> bindings, F&& body) {
    return with_scope(extend_scope(current_scope(), bindings), std::forward<F>(body));
}

template <typename F> decltype(auto) scoping(std::span<const Binding> bindings, F&& body) {
    return with_scope(extend_scope(current_scope(), bindings), std::forward<F>(body));
}

/// Captures the current scope and returns a callable that runs `f` under it.
///
/// The returned callable may be invoked on any thread, any number of times;
/// each call installs the captured map for the duration of that call only.
template <typename F> auto bound_fn(F&& f) {
    return [scope = current_scope(), fn = std::forward<F>(f)](auto&&... args) mutable
           -> decltype(auto) {
        return with_scope(scope, [&]() -> decltype(auto) {
            return std::invoke(fn, std::forward<decltype(args)>(args)...);
        });
    };
}

// ============================================================================
// Resolution
// ============================================================================

/// Resolves `var` on the calling thread:
///
/// 1. a binding in the active map wins, whatever its value;
/// 2. otherwise the root value, if bound;
/// 3. otherwise `std::nullopt`.
[[nodiscard]] auto try_resolve(const VarBase& var) -> std::optional<std::any>;

/// Like `try_resolve`, but throws `UnboundError` instead of returning
/// `std::nullopt`.
[[nodiscard]] auto resolve(const VarBase& var) -> std::any;

/// The value of `var` for the current dynamic extent.
///
/// Throws `UnboundError` if `var` is neither bound in scope nor at the root.
template <typename T> [[nodiscard]] auto ask(const Var<T>& var) -> T {
    return std::any_cast<T>(resolve(var));
}

/// The value of `var`, or `default_value` when `var` is neither bound in
/// scope nor at the root. A scope binding to a null-like value is returned
/// as is; the default only applies when nothing is bound.
template <typename T>
[[nodiscard]] auto ask(const Var<T>& var, std::type_identity_t<T> default_value) -> T {
    if (auto value = try_resolve(var)) {
        return std::any_cast<T>(std::move(*value));
    }
    return default_value;
}

} // namespace scoped

#endif // SCOPED_SCOPE_HPP
