//! # Var Registry and Binding Forms
//!
//! Resolves qualified names to live vars, and turns flat key/value lists
//! ("binding forms") into validated `Binding`s.
//!
//! A binding-form list alternates keys and values:
//!
//! ```cpp
//! std::vector<std::any> forms = {
//!     var_key(request_id), std::string("r-17"),   // key given as a var
//!     std::string("http/max-retries"), 5,         // key given by name
//! };
//! auto bindings = parse_binding_forms(forms);
//! ```
//!
//! The whole list is validated before anything is built, so an invalid list
//! is rejected as a unit and never partially applied.

#ifndef SCOPED_REGISTRY_HPP
#define SCOPED_REGISTRY_HPP

#include "scoped/common.hpp"
#include "scoped/error.hpp"
#include "scoped/scope_map.hpp"

#include <any>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace scoped {

/// Name → var lookup for every live, named var.
///
/// Vars add themselves on construction and remove themselves on
/// destruction. When two live vars share a name the newest one wins until it
/// is destroyed, after which the older one is visible again.
class VarRegistry {
public:
    static auto instance() -> VarRegistry&;

    VarRegistry(const VarRegistry&) = delete;
    auto operator=(const VarRegistry&) -> VarRegistry& = delete;

    void add(const VarBase& var);
    void remove(const VarBase& var);

    /// The newest live var registered under `name`, or `nullptr`.
    ///
    /// The lock is released before returning, so the pointer stays valid only
    /// while that var lives. A var looked up by name must not be destroyed
    /// while another thread may be calling `find` or `parse_binding_forms`.
    [[nodiscard]] auto find(std::string_view name) const -> const VarBase*;

    /// Number of distinct registered names.
    [[nodiscard]] auto size() const -> std::size_t;

private:
    VarRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<const VarBase*>> vars_;
};

/// Wraps a var as a binding-form key.
[[nodiscard]] inline auto var_key(const VarBase& var) -> std::any {
    return std::any(&var);
}

/// Validates a flat key/value list and converts it to bindings.
///
/// Keys may be `const VarBase*` (see `var_key`), `std::string` or
/// `const char*` names. Errors:
///
/// - odd element count: `ScopeError::Kind::OddBindingForms`
/// - null var, unknown name or unsupported key type: `UnresolvedKey`
/// - value type differs from the var's type: `TypeMismatch`
///
/// Name keys resolve through `VarRegistry::find`; the named vars must outlive
/// the returned bindings and any concurrent call.
[[nodiscard]] auto parse_binding_forms(const std::vector<std::any>& forms)
    -> Result<std::vector<Binding>, ScopeError>;

} // namespace scoped

#endif // SCOPED_REGISTRY_HPP
