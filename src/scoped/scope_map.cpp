//! # Scope Map Implementation

#include "scoped/scope_map.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <stdexcept>

namespace scoped {

// ============================================================================
// Binding
// ============================================================================

Binding::Binding(const VarBase* var, std::any value) : var_(var), value_(std::move(value)) {
    if (var_ == nullptr) {
        throw std::invalid_argument("Binding: var must not be null");
    }
    if (value_.type() != var_->value_type()) {
        throw std::invalid_argument("Binding: value type does not match var " + var_->name());
    }
}

// ============================================================================
// ScopeMap
// ============================================================================

namespace {

auto empty_entries() -> const std::shared_ptr<const ScopeMap::Entries>& {
    static const std::shared_ptr<const ScopeMap::Entries> entries =
        std::make_shared<ScopeMap::Entries>();
    return entries;
}

} // namespace

ScopeMap::ScopeMap() : entries_(empty_entries()) {}

auto ScopeMap::empty() -> const ScopeMap& {
    static const ScopeMap map;
    return map;
}

auto ScopeMap::get(const VarBase& var) const -> const std::any* {
    auto it = entries_->find(var.id());
    if (it == entries_->end()) {
        return nullptr;
    }
    return &it->second;
}

auto ScopeMap::keys() const -> std::vector<VarId> {
    std::vector<VarId> ids;
    ids.reserve(entries_->size());
    for (const auto& [id, _] : *entries_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

auto ScopeMap::assoc(const Binding& binding) const -> ScopeMap {
    auto next = std::make_shared<Entries>(*entries_);
    next->insert_or_assign(binding.var().id(), binding.value());
    return ScopeMap(std::move(next));
}

// ============================================================================
// ScopeMap::Builder
// ============================================================================

ScopeMap::Builder::Builder(const ScopeMap& base)
    : entries_(std::make_shared<Entries>(*base.entries_)) {}

auto ScopeMap::Builder::assoc(const Binding& binding) -> Builder& {
    if (!entries_) {
        throw std::logic_error("ScopeMap::Builder::assoc() called after build()");
    }
    entries_->insert_or_assign(binding.var().id(), binding.value());
    return *this;
}

auto ScopeMap::Builder::build() -> ScopeMap {
    if (!entries_) {
        throw std::logic_error("ScopeMap::Builder::build() called twice");
    }
    std::shared_ptr<const Entries> frozen = std::move(entries_);
    return ScopeMap(std::move(frozen));
}

// ============================================================================
// Extension
// ============================================================================

auto extend(const ScopeMap& map, std::span<const Binding> bindings, ExtendStrategy strategy)
    -> ScopeMap {
    if (bindings.empty()) {
        return map;
    }

    if (strategy == ExtendStrategy::Auto) {
        ensure_options_loaded();
        strategy = bindings.size() < Options::bulk_extend_threshold ? ExtendStrategy::Chained
                                                                     : ExtendStrategy::Bulk;
    }

    if (strategy == ExtendStrategy::Chained) {
        ScopeMap result = map;
        for (const auto& binding : bindings) {
            result = result.assoc(binding);
        }
        return result;
    }

    SCOPED_LOG_TRACE("scope", "Bulk extend with " << bindings.size() << " bindings");
    ScopeMap::Builder builder(map);
    for (const auto& binding : bindings) {
        builder.assoc(binding);
    }
    return builder.build();
}

} // namespace scoped
