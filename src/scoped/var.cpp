//! # Var Implementation
//!
//! Identity allocation, registry membership and synchronized root access.

#include "scoped/var.hpp"

#include "log/log.hpp"
#include "scoped/registry.hpp"

#include <atomic>

namespace scoped {

namespace {

auto next_var_id() -> VarId {
    static std::atomic<VarId> counter{0};
    return counter.fetch_add(1, std::memory_order_relaxed) + 1;
}

} // namespace

VarBase::VarBase(std::string name, const std::type_info& type)
    : id_(next_var_id()), name_(std::move(name)), type_(type) {
    if (!name_.empty()) {
        VarRegistry::instance().add(*this);
    }
    SCOPED_LOG_TRACE("registry", "Declared unbound var " << name_ << " #" << id_);
}

VarBase::VarBase(std::string name, const std::type_info& type, std::any root)
    : id_(next_var_id()), name_(std::move(name)), type_(type), bound_(true),
      root_(std::move(root)) {
    if (!name_.empty()) {
        VarRegistry::instance().add(*this);
    }
    SCOPED_LOG_TRACE("registry", "Declared var " << name_ << " #" << id_);
}

VarBase::~VarBase() {
    if (!name_.empty()) {
        VarRegistry::instance().remove(*this);
    }
}

auto VarBase::is_bound() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return bound_;
}

auto VarBase::root() const -> std::optional<std::any> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!bound_) {
        return std::nullopt;
    }
    return std::optional<std::any>(std::in_place, root_);
}

void VarBase::unbind_root() {
    std::lock_guard<std::mutex> lock(mutex_);
    bound_ = false;
    root_.reset();
}

void VarBase::set_root_value(std::any value) {
    std::lock_guard<std::mutex> lock(mutex_);
    root_ = std::move(value);
    bound_ = true;
}

} // namespace scoped
