//! # Scope Maps
//!
//! An immutable mapping from var identity to value. A scope map is the unit
//! that gets installed into the carrier, captured with `current_scope()` and
//! handed to other threads.
//!
//! ## Invariants
//!
//! - A map never changes after construction. `assoc`, `Builder` and `extend`
//!   return new maps; copies share storage.
//! - Every stored value is a `std::any` holding exactly the var's `T`. A
//!   stored null-like value (`std::nullopt`, `nullptr`, `false`) is an entry
//!   like any other; `get` returns `nullptr` only for absent keys.
//! - `ScopeMap::empty()` is a process-wide singleton, and a
//!   default-constructed map shares its storage.
//!
//! ## Example
//!
//! ```cpp
//! auto base = ScopeMap::empty();
//! auto scope = extend(base, {bind(request_id, "r-17"), bind(max_retries, 5)});
//! // base is still empty
//! const int* retries = scope.get_as(max_retries); // -> 5
//! ```

#ifndef SCOPED_SCOPE_MAP_HPP
#define SCOPED_SCOPE_MAP_HPP

#include "scoped/var.hpp"

#include <any>
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <span>
#include <unordered_map>
#include <utility>
#include <vector>

namespace scoped {

// ============================================================================
// Binding
// ============================================================================

/// One var/value pair to be applied to a scope map.
///
/// The constructor validates the pair: a null var or a value whose type is
/// not the var's value type throws `std::invalid_argument`, so a malformed
/// binding can never reach a map or the carrier.
class Binding {
public:
    Binding(const VarBase* var, std::any value);

    [[nodiscard]] auto var() const -> const VarBase& {
        return *var_;
    }

    [[nodiscard]] auto value() const -> const std::any& {
        return value_;
    }

private:
    const VarBase* var_;
    std::any value_;
};

/// Creates a binding of `var` to `value`, converting `value` to `T`.
/// Unqualified `bind(var, value)` must resolve here rather than to
/// `std::bind` for both const and non-const vars.
template <typename T, typename U> [[nodiscard]] auto bind(const Var<T>& var, U&& value) -> Binding {
    return Binding(&var, std::any(T(std::forward<U>(value))));
}

template <typename T, typename U> [[nodiscard]] auto bind(Var<T>& var, U&& value) -> Binding {
    return bind(static_cast<const Var<T>&>(var), std::forward<U>(value));
}

// ============================================================================
// ScopeMap
// ============================================================================

class ScopeMap {
public:
    using Entries = std::unordered_map<VarId, std::any>;

    /// The empty map (shares the singleton's storage).
    ScopeMap();

    /// The canonical empty map.
    [[nodiscard]] static auto empty() -> const ScopeMap&;

    /// Looks up `var`. Returns `nullptr` if the var is not present; a present
    /// entry always yields a non-null pointer, whatever its value.
    [[nodiscard]] auto get(const VarBase& var) const -> const std::any*;

    /// Typed view of `get`.
    template <typename T> [[nodiscard]] auto get_as(const Var<T>& var) const -> const T* {
        const std::any* value = get(var);
        return value ? std::any_cast<T>(value) : nullptr;
    }

    [[nodiscard]] auto contains(const VarBase& var) const -> bool {
        return get(var) != nullptr;
    }

    [[nodiscard]] auto size() const -> std::size_t {
        return entries_->size();
    }

    [[nodiscard]] auto is_empty() const -> bool {
        return entries_->empty();
    }

    /// Ids of all bound vars in ascending order.
    [[nodiscard]] auto keys() const -> std::vector<VarId>;

    /// True if both maps share the same storage. Identical maps are equal;
    /// the converse does not hold.
    [[nodiscard]] auto identical(const ScopeMap& other) const -> bool {
        return entries_ == other.entries_;
    }

    /// Returns a new map with `binding` applied.
    [[nodiscard]] auto assoc(const Binding& binding) const -> ScopeMap;

    /// Accumulates bindings into a private copy of a map and freezes it once.
    ///
    /// A builder is single-use: after `build()` further calls throw
    /// `std::logic_error`.
    class Builder {
    public:
        explicit Builder(const ScopeMap& base);

        auto assoc(const Binding& binding) -> Builder&;

        [[nodiscard]] auto build() -> ScopeMap;

    private:
        std::shared_ptr<Entries> entries_;
    };

private:
    explicit ScopeMap(std::shared_ptr<const Entries> entries) : entries_(std::move(entries)) {}

    std::shared_ptr<const Entries> entries_;
};

// ============================================================================
// Extension
// ============================================================================

/// How `extend` applies bindings. Every strategy yields the same map.
enum class ExtendStrategy {
    Auto,    ///< Chained below `Options::bulk_extend_threshold`, bulk at or above
    Chained, ///< One `assoc` per binding
    Bulk     ///< One `Builder` for all bindings
};

/// Returns `map` with `bindings` applied left to right; for repeated vars the
/// last binding wins. With no bindings, returns `map` itself.
[[nodiscard]] auto extend(const ScopeMap& map, std::span<const Binding> bindings,
                          ExtendStrategy strategy = ExtendStrategy::Auto) -> ScopeMap;

[[nodiscard]] inline auto extend(const ScopeMap& map, std::initializer_list<Binding> bindings,
                                 ExtendStrategy strategy = ExtendStrategy::Auto) -> ScopeMap {
    return extend(map, std::span<const Binding>(bindings.begin(), bindings.size()), strategy);
}

} // namespace scoped

#endif // SCOPED_SCOPE_MAP_HPP
