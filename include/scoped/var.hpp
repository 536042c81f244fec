//! # Dynamically Scoped Variables
//!
//! A `Var<T>` is the binding key of the library. It has a stable identity,
//! a qualified name used for diagnostics and name lookup, and a root value
//! that is either bound or unbound.
//!
//! ```cpp
//! scoped::Var<std::string> request_id{"http/request-id"};      // unbound
//! scoped::Var<int> max_retries{"http/max-retries", 3};         // root = 3
//! scoped::Var<std::optional<std::string>> user{"http/user", std::nullopt};
//! ```
//!
//! "Unbound" is a state of the root, not a value: a var whose root is
//! `std::nullopt` is bound (to a null-like value).

#ifndef SCOPED_VAR_HPP
#define SCOPED_VAR_HPP

#include "scoped/common.hpp"

#include <any>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <typeinfo>

namespace scoped {

/// Type-erased part of a var. Scope maps and the registry only see this.
class VarBase {
public:
    VarBase(const VarBase&) = delete;
    auto operator=(const VarBase&) -> VarBase& = delete;
    VarBase(VarBase&&) = delete;
    auto operator=(VarBase&&) -> VarBase& = delete;

    virtual ~VarBase();

    [[nodiscard]] auto id() const -> VarId {
        return id_;
    }

    [[nodiscard]] auto name() const -> const std::string& {
        return name_;
    }

    /// The `T` of the `Var<T>` this object belongs to.
    [[nodiscard]] auto value_type() const -> const std::type_info& {
        return type_;
    }

    /// True if the root holds a value.
    [[nodiscard]] auto is_bound() const -> bool;

    /// A copy of the root value, or `std::nullopt` when the root is unbound.
    [[nodiscard]] auto root() const -> std::optional<std::any>;

    /// Puts the root back into the unbound state.
    void unbind_root();

protected:
    VarBase(std::string name, const std::type_info& type);
    VarBase(std::string name, const std::type_info& type, std::any root);

    void set_root_value(std::any value);

private:
    VarId id_;
    std::string name_;
    const std::type_info& type_;

    mutable std::mutex mutex_;
    bool bound_ = false;
    std::any root_;
};

/// A dynamically scoped variable holding values of type `T`.
///
/// Vars register themselves under their name with `VarRegistry` for the
/// duration of their lifetime (anonymous vars, with an empty name, are not
/// registered). They are neither copyable nor movable.
template <typename T> class Var final : public VarBase {
    static_assert(std::is_same_v<T, std::decay_t<T>>, "Var<T> requires a non-reference value type");
    static_assert(!std::is_same_v<T, std::any>, "Var<std::any> would erase the value type twice");
    static_assert(std::is_copy_constructible_v<T>, "scoped values must be copy constructible");

public:
    using value_type = T;

    /// Declares a var whose root is unbound.
    explicit Var(std::string name) : VarBase(std::move(name), typeid(T)) {}

    /// Declares a var with a root value.
    Var(std::string name, T root) : VarBase(std::move(name), typeid(T), std::any(std::move(root))) {}

    /// Replaces the root value (the root becomes bound if it was not).
    void set_root(T value) {
        set_root_value(std::any(std::move(value)));
    }
};

} // namespace scoped

#endif // SCOPED_VAR_HPP
