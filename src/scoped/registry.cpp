//! # Var Registry Implementation

#include "scoped/registry.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace scoped {

// ============================================================================
// VarRegistry
// ============================================================================

auto VarRegistry::instance() -> VarRegistry& {
    static VarRegistry registry;
    return registry;
}

void VarRegistry::add(const VarBase& var) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entries = vars_[var.name()];
    if (!entries.empty()) {
        SCOPED_LOG_WARN("registry", "Var " << var.name() << " #" << var.id() << " shadows #"
                                           << entries.back()->id());
    }
    entries.push_back(&var);
}

void VarRegistry::remove(const VarBase& var) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = vars_.find(var.name());
    if (it == vars_.end()) {
        return;
    }
    auto& entries = it->second;
    entries.erase(std::remove(entries.begin(), entries.end(), &var), entries.end());
    if (entries.empty()) {
        vars_.erase(it);
    }
}

auto VarRegistry::find(std::string_view name) const -> const VarBase* {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = vars_.find(std::string(name));
    if (it == vars_.end()) {
        return nullptr;
    }
    return it->second.back();
}

auto VarRegistry::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return vars_.size();
}

// ============================================================================
// Binding Forms
// ============================================================================

namespace {

/// Resolves one key form; `nullptr` if it names no live var.
auto resolve_key(const std::any& form, std::string& label) -> const VarBase* {
    if (const auto* var = std::any_cast<const VarBase*>(&form)) {
        label = *var ? (*var)->name() : "<null var>";
        return *var;
    }
    if (const auto* var = std::any_cast<VarBase*>(&form)) {
        label = *var ? (*var)->name() : "<null var>";
        return *var;
    }
    if (const auto* name = std::any_cast<std::string>(&form)) {
        label = *name;
        return VarRegistry::instance().find(*name);
    }
    if (const auto* name = std::any_cast<const char*>(&form)) {
        if (*name == nullptr) {
            label = "<null name>";
            return nullptr;
        }
        label = *name;
        return VarRegistry::instance().find(*name);
    }
    label = std::string("<") + form.type().name() + ">";
    return nullptr;
}

} // namespace

auto parse_binding_forms(const std::vector<std::any>& forms)
    -> Result<std::vector<Binding>, ScopeError> {
    if (forms.size() % 2 != 0) {
        SCOPED_LOG_WARN("scope", "Rejected " << forms.size() << " binding forms (odd count)");
        return ScopeError::make(ScopeError::Kind::OddBindingForms,
                                "binding forms must contain an even number of elements, got " +
                                    std::to_string(forms.size()));
    }

    std::vector<const VarBase*> vars;
    vars.reserve(forms.size() / 2);
    for (std::size_t i = 0; i < forms.size(); i += 2) {
        std::string label;
        const VarBase* var = resolve_key(forms[i], label);
        if (var == nullptr) {
            SCOPED_LOG_WARN("scope", "Cannot resolve binding key " << label);
            return ScopeError::make(ScopeError::Kind::UnresolvedKey, "Cannot resolve: " + label, i);
        }
        const std::any& value = forms[i + 1];
        if (value.type() != var->value_type()) {
            return ScopeError::make(ScopeError::Kind::TypeMismatch,
                                    "value for " + var->name() + " has type " +
                                        value.type().name() + ", expected " +
                                        var->value_type().name(),
                                    i + 1);
        }
        vars.push_back(var);
    }

    std::vector<Binding> bindings;
    bindings.reserve(vars.size());
    for (std::size_t i = 0; i < vars.size(); ++i) {
        bindings.emplace_back(vars[i], forms[2 * i + 1]);
    }
    return bindings;
}

} // namespace scoped
