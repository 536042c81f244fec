//! # Carrier
//!
//! The carrier holds the active scope map. It is a process-wide singleton,
//! but it is **partitioned per thread**: every thread observes only the map
//! most recently installed on that thread. Installing a map on one thread
//! never changes what another thread sees; sharing a scope across threads is
//! always an explicit capture (`current()`) followed by `run()` on the other
//! thread.
//!
//! The mutability surface is exactly two operations:
//!
//! - `current()`: read the active map (empty when nothing is installed)
//! - `run(scope, body)`: install `scope` for the dynamic extent of `body`
//!
//! ## Strategies
//!
//! | Strategy              | Storage                                 | Restore             |
//! |-----------------------|-----------------------------------------|---------------------|
//! | `StructuredCarrier`   | chain of frames on the caller's stack   | frame destructor    |
//! | `ThreadLocalCarrier`  | one `ScopeMap` cell per thread          | guard destructor    |
//!
//! Both restore from a destructor, so restoration happens on normal return,
//! on exception propagation and on forced unwinding of a cancelled thread.
//! The strategy is chosen once per process by `detect_carrier_kind()`.

#ifndef SCOPED_CARRIER_HPP
#define SCOPED_CARRIER_HPP

#include "scoped/scope_map.hpp"

#include <functional>

/// Build-time capability switch for the structured-scope carrier. The CMake
/// option `SCOPED_STRUCTURED_SCOPE` defines it to 0 or 1.
#ifndef SCOPED_HAS_STRUCTURED_SCOPE
#define SCOPED_HAS_STRUCTURED_SCOPE 1
#endif

namespace scoped {

enum class CarrierKind {
    Structured, ///< Frame chain bound to the dynamic extent of `run`
    ThreadLocal ///< Per-thread cell with explicit save/restore
};

/// Returns "structured" or "thread-local".
[[nodiscard]] auto carrier_kind_name(CarrierKind kind) -> const char*;

/// Storage for the active scope map.
class Carrier {
public:
    virtual ~Carrier() = default;

    [[nodiscard]] virtual auto kind() const -> CarrierKind = 0;

    /// The map active on the calling thread, or the empty map.
    [[nodiscard]] virtual auto current() const -> ScopeMap = 0;

    /// Installs `scope` on the calling thread while `body` runs, then
    /// restores the previous map. Exceptions thrown by `body` propagate
    /// unchanged after the restore.
    virtual void run(const ScopeMap& scope, const std::function<void()>& body) = 0;
};

/// Strategy A: every `run` pushes a frame that lives on the caller's stack
/// and points at the previous top frame. Values are never overwritten in
/// place; popping the frame is the only way back, and it happens when `run`
/// returns or unwinds. An empty chain reads as the empty map.
class StructuredCarrier final : public Carrier {
public:
    [[nodiscard]] auto kind() const -> CarrierKind override {
        return CarrierKind::Structured;
    }

    [[nodiscard]] auto current() const -> ScopeMap override;

    void run(const ScopeMap& scope, const std::function<void()>& body) override;

    /// Number of frames on the calling thread (for tests and diagnostics).
    [[nodiscard]] static auto depth() -> std::size_t;

private:
    struct Frame;

    static thread_local const Frame* top_;
};

/// Strategy B: one `ScopeMap` cell per thread, lazily initialized to the
/// empty map on first access. `run` saves the cell, overwrites it, runs the
/// body and restores the saved map from a guard's destructor, which runs
/// exactly once however the body exits.
class ThreadLocalCarrier final : public Carrier {
public:
    [[nodiscard]] auto kind() const -> CarrierKind override {
        return CarrierKind::ThreadLocal;
    }

    [[nodiscard]] auto current() const -> ScopeMap override;

    void run(const ScopeMap& scope, const std::function<void()>& body) override;

private:
    [[nodiscard]] static auto cell() -> ScopeMap&;
};

/// Chooses the strategy from the build capability and `Options`.
[[nodiscard]] auto detect_carrier_kind() -> CarrierKind;

/// The process-wide instance of a given strategy.
[[nodiscard]] auto carrier_for(CarrierKind kind) -> Carrier&;

/// The carrier selected on first use. The choice is never revisited.
[[nodiscard]] auto global_carrier() -> Carrier&;

} // namespace scoped

#endif // SCOPED_CARRIER_HPP
