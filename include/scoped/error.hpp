//! # Error Types
//!
//! - `UnboundError`: thrown by `ask`/`resolve` when a var has no scope
//!   binding, no root value and no default was supplied.
//! - `ScopeError`: returned (inside a `Result`) when a flat list of binding
//!   forms cannot be turned into bindings.
//!
//! ## Example
//!
//! ```cpp
//! try {
//!     auto user = ask(current_user);
//! } catch (const UnboundError& e) {
//!     std::cerr << e.what() << "\n"; // "Unbound: app/current-user"
//! }
//! ```

#pragma once

#include "scoped/common.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace scoped {

/// A var was read outside of any scope binding while its root is unbound.
class UnboundError : public std::runtime_error {
public:
    UnboundError(VarId id, const std::string& name)
        : std::runtime_error("Unbound: " + name), var_id_(id), var_name_(name) {}

    /// Identity of the var that was read.
    [[nodiscard]] auto var_id() const noexcept -> VarId {
        return var_id_;
    }

    /// Qualified name of the var that was read.
    [[nodiscard]] auto var_name() const noexcept -> const std::string& {
        return var_name_;
    }

private:
    VarId var_id_;
    std::string var_name_;
};

/// An error found while validating binding forms.
///
/// # Fields
///
/// - `kind`: which rule was violated
/// - `message`: human-readable description
/// - `index`: position of the offending element in the form list
struct ScopeError {
    enum class Kind {
        OddBindingForms, ///< The list does not contain key/value pairs
        UnresolvedKey,   ///< A key is not a var and does not name a registered var
        TypeMismatch     ///< A value's type differs from the var's value type
    };

    Kind kind;
    std::string message;
    std::size_t index = 0;

    static auto make(Kind kind, std::string msg, std::size_t index = 0) -> ScopeError {
        return ScopeError{kind, std::move(msg), index};
    }

    /// Formats the error as `"forms[<index>]: <message>"`, or just the
    /// message for errors about the list as a whole.
    [[nodiscard]] auto to_string() const -> std::string {
        if (kind == Kind::OddBindingForms) {
            return message;
        }
        return "forms[" + std::to_string(index) + "]: " + message;
    }
};

} // namespace scoped
