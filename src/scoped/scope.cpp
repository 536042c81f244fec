//! # Scope Lifecycle and Resolution Implementation

#include "scoped/scope.hpp"

#include "log/log.hpp"
#include "scoped/registry.hpp"

namespace scoped {

auto current_scope() -> ScopeMap {
    return global_carrier().current();
}

auto extend_scope(const ScopeMap& scope, std::span<const Binding> bindings) -> ScopeMap {
    return extend(scope, bindings);
}

auto extend_scope_forms(const ScopeMap& scope, const std::vector<std::any>& forms)
    -> Result<ScopeMap, ScopeError> {
    auto parsed = parse_binding_forms(forms);
    if (is_err(parsed)) {
        return unwrap_err(parsed);
    }
    return extend(scope, unwrap(parsed));
}

auto try_resolve(const VarBase& var) -> std::optional<std::any> {
    ScopeMap scope = current_scope();
    if (const std::any* value = scope.get(var)) {
        return std::optional<std::any>(std::in_place, *value);
    }
    return var.root();
}

auto resolve(const VarBase& var) -> std::any {
    if (auto value = try_resolve(var)) {
        return std::move(*value);
    }
    SCOPED_LOG_DEBUG("scope", "Unbound var " << var.name() << " #" << var.id());
    throw UnboundError(var.id(), var.name());
}

} // namespace scoped
