//! # Carrier Implementation

#include "scoped/carrier.hpp"

#include "log/log.hpp"

namespace scoped {

auto carrier_kind_name(CarrierKind kind) -> const char* {
    switch (kind) {
    case CarrierKind::Structured:
        return "structured";
    case CarrierKind::ThreadLocal:
        return "thread-local";
    }
    return "???";
}

// ============================================================================
// StructuredCarrier
// ============================================================================

struct StructuredCarrier::Frame {
    const ScopeMap scope;
    const Frame* parent;
};

thread_local const StructuredCarrier::Frame* StructuredCarrier::top_ = nullptr;

auto StructuredCarrier::current() const -> ScopeMap {
    if (top_ == nullptr) {
        return ScopeMap::empty();
    }
    return top_->scope;
}

void StructuredCarrier::run(const ScopeMap& scope, const std::function<void()>& body) {
    const Frame frame{scope, top_};
    top_ = &frame;
    struct Pop {
        const Frame* parent;
        ~Pop() {
            top_ = parent;
        }
    } pop{frame.parent};

    SCOPED_LOG_TRACE("carrier", "Entered structured frame with " << scope.size() << " bindings");
    body();
}

auto StructuredCarrier::depth() -> std::size_t {
    std::size_t n = 0;
    for (const Frame* frame = top_; frame != nullptr; frame = frame->parent) {
        ++n;
    }
    return n;
}

// ============================================================================
// ThreadLocalCarrier
// ============================================================================

namespace {

/// Puts the saved map back into the thread's cell.
class RestoreGuard {
public:
    explicit RestoreGuard(ScopeMap& slot) : slot_(slot), saved_(slot) {}
    RestoreGuard(const RestoreGuard&) = delete;
    auto operator=(const RestoreGuard&) -> RestoreGuard& = delete;

    ~RestoreGuard() {
        slot_ = std::move(saved_);
    }

private:
    ScopeMap& slot_;
    ScopeMap saved_;
};

} // namespace

auto ThreadLocalCarrier::cell() -> ScopeMap& {
    thread_local ScopeMap slot;
    return slot;
}

auto ThreadLocalCarrier::current() const -> ScopeMap {
    return cell();
}

void ThreadLocalCarrier::run(const ScopeMap& scope, const std::function<void()>& body) {
    ScopeMap& slot = cell();
    RestoreGuard guard(slot);
    slot = scope;

    SCOPED_LOG_TRACE("carrier", "Installed thread-local scope with " << scope.size()
                                                                      << " bindings");
    body();
}

// ============================================================================
// Selection
// ============================================================================

auto detect_carrier_kind() -> CarrierKind {
#if SCOPED_HAS_STRUCTURED_SCOPE
    if (!Options::force_fallback) {
        return CarrierKind::Structured;
    }
#endif
    return CarrierKind::ThreadLocal;
}

auto carrier_for(CarrierKind kind) -> Carrier& {
    static StructuredCarrier structured;
    static ThreadLocalCarrier thread_local_cells;

    switch (kind) {
    case CarrierKind::Structured:
        return structured;
    case CarrierKind::ThreadLocal:
        return thread_local_cells;
    }
    return thread_local_cells;
}

auto global_carrier() -> Carrier& {
    static Carrier& selected = []() -> Carrier& {
        ensure_options_loaded();
        CarrierKind kind = detect_carrier_kind();
        SCOPED_LOG_DEBUG("carrier", "Selected " << carrier_kind_name(kind) << " carrier"
                                                << (Options::force_fallback ? " (forced)" : ""));
        return carrier_for(kind);
    }();
    return selected;
}

} // namespace scoped
