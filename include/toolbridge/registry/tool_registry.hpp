#pragma once

#include <toolbridge/registry/i_capability_provider.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace toolbridge {

// ---------------------------------------------------------------------------
// ProviderState: lifecycle of one registered provider.
//
//   Uninitialized -> Ready -> ShuttingDown -> Closed
//
// A handle that fails or times out in Init() goes straight to Closed and is
// never installed.
// ---------------------------------------------------------------------------
enum class ProviderState {
    Uninitialized,
    Ready,
    ShuttingDown,
    Closed,
};

const char* ProviderStateName(ProviderState state);

// ---------------------------------------------------------------------------
// ProviderHandle: registry-owned wrapper around one provider instance.
//
// The operation list is captured once at construction and never changes.
// Handles are shared (shared_ptr) so in-flight requests keep the provider
// alive across a replacement or an abandoned timeout.
// ---------------------------------------------------------------------------
class ProviderHandle {
public:
    explicit ProviderHandle(std::shared_ptr<ICapabilityProvider> provider);

    ProviderHandle(const ProviderHandle&) = delete;
    ProviderHandle& operator=(const ProviderHandle&) = delete;

    [[nodiscard]] const std::string& Name() const noexcept { return name_; }

    [[nodiscard]] ProviderState State() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] const std::vector<CapabilityDescriptor>& Operations() const noexcept {
        return operations_;
    }

    [[nodiscard]] const std::shared_ptr<ICapabilityProvider>& Provider() const noexcept {
        return provider_;
    }

    /// Descriptor for `operation`, or nullptr.
    [[nodiscard]] const CapabilityDescriptor* FindOperation(
        std::string_view operation) const;

    /// The operation a bare "<provider>" method selects: the sole operation
    /// of a single-operation provider, nullopt otherwise.
    [[nodiscard]] std::optional<std::string> DefaultOperation() const;

    /// Run the provider's Init() with a bounded wait. Ready on success,
    /// Closed on failure.
    [[nodiscard]] Result<void, Error> Initialize(std::chrono::milliseconds timeout);

    /// Run the provider's Shutdown() exactly once (later calls are no-ops)
    /// with a bounded wait. Always ends in Closed.
    [[nodiscard]] Result<void, Error> Shutdown(std::chrono::milliseconds timeout);

private:
    std::string name_;
    std::shared_ptr<ICapabilityProvider> provider_;
    std::vector<CapabilityDescriptor> operations_;
    std::atomic<ProviderState> state_{ProviderState::Uninitialized};
};

struct RegistryOptions {
    std::chrono::milliseconds init_timeout{5000};
    std::chrono::milliseconds shutdown_timeout{5000};
};

// ---------------------------------------------------------------------------
// ToolRegistry: the single source of truth for which providers exist and
// whether they are usable.
//
// Concurrency:
//   - One slot per provider name. A per-slot mutex serialises registrations
//     of the same name; registrations of different names run in parallel.
//   - The name -> slot map is guarded by a reader/writer lock. Lookups take
//     it shared. Writers take it exclusive only to swap a handle pointer;
//     no provider hook ever runs while it is held.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    explicit ToolRegistry(RegistryOptions options = {});

    /// Shuts down any provider still Ready (errors are logged).
    ~ToolRegistry();

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    /// Initialise `provider` and install it under provider->Name(),
    /// superseding (and then shutting down) any previous provider of that
    /// name. On failure nothing changes and the previous provider, if any,
    /// stays active.
    [[nodiscard]] Result<void, Error> Register(
        std::shared_ptr<ICapabilityProvider> provider);

    /// Remove `name` and shut its provider down. The entry is removed even
    /// when the shutdown hook fails; that failure is still returned.
    [[nodiscard]] Result<void, Error> Unregister(std::string_view name);

    /// The Ready handle for `name`, or a CapabilityNotFound error.
    [[nodiscard]] Result<std::shared_ptr<ProviderHandle>, Error> Lookup(
        std::string_view name) const;

    /// Snapshot of the operations of every Ready provider, fully qualified,
    /// in first-registration order of their providers.
    [[nodiscard]] std::vector<CapabilityDescriptor> ListCapabilities() const;

    /// Names with a Ready provider, in first-registration order.
    [[nodiscard]] std::vector<std::string> ProviderNames() const;

    [[nodiscard]] std::optional<ProviderState> StateOf(std::string_view name) const;

    /// Shut every provider down. Every hook runs regardless of the others;
    /// all failures come back together in one aggregate RegistryFault.
    [[nodiscard]] Result<void, Error> ShutdownAll();

private:
    struct Slot {
        std::mutex registration;
        std::shared_ptr<ProviderHandle> current;  // guarded by mutex_
    };

    std::shared_ptr<Slot> AcquireSlot(const std::string& name);
    std::vector<std::shared_ptr<ProviderHandle>> SnapshotHandles() const;

    RegistryOptions options_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
    std::vector<std::string> order_;
};

} // namespace toolbridge
