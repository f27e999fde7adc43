#include <toolbridge/registry/tool_registry.hpp>

#include <toolbridge/core/deadline.hpp>
#include <toolbridge/core/log.hpp>
#include <toolbridge/core/types.hpp>

#include <algorithm>
#include <exception>
#include <memory>
#include <mutex>
#include <set>
#include <utility>

namespace toolbridge {

namespace {

Error MakeRegistryError(const std::string& operation,
                        const std::string& message,
                        std::optional<std::string> detail = std::nullopt) {
    return Error{operation, message, ErrorCode::RegistryFault,
                 std::move(detail), {}};
}

// Run a lifecycle hook (Init or Shutdown) of `provider` with a bounded wait
// and fold timeout, Err and exceptions into one Result.
template <typename Hook>
Result<void, Error> RunHook(const std::string& operation,
                            const std::string& provider_name,
                            std::chrono::milliseconds timeout,
                            Hook hook) {
    std::optional<Result<void, Error>> outcome;
    try {
        outcome = RunWithDeadline(std::move(hook), timeout);
    } catch (const std::exception& e) {
        return Result<void, Error>::Err(MakeRegistryError(
            operation, "provider '" + provider_name + "' threw", e.what()));
    } catch (...) {
        return Result<void, Error>::Err(MakeRegistryError(
            operation, "provider '" + provider_name + "' threw",
            "non-standard exception"));
    }

    if (!outcome.has_value()) {
        return Result<void, Error>::Err(MakeRegistryError(
            operation,
            "provider '" + provider_name + "' timed out after " +
                std::to_string(timeout.count()) + " ms"));
    }
    if (outcome->IsErr()) {
        const auto& cause = outcome->Error();
        auto error = MakeRegistryError(
            operation, "provider '" + provider_name + "' failed",
            cause.message);
        error.causes.push_back(cause);
        return Result<void, Error>::Err(std::move(error));
    }
    return Result<void, Error>::Ok();
}

// Shared between Initialize and its hook thread, which can outlive it.
struct LateInit {
    std::mutex mutex;
    bool abandoned = false;
    bool succeeded = false;
};

// Shut down a provider whose Init finished after Initialize gave up on it.
void ShutdownAbandoned(ICapabilityProvider& provider, const std::string& name) {
    LogWarn("registry", "provider '" + name +
                            "' finished init after its deadline; shutting it down");
    try {
        auto down = provider.Shutdown();
        if (down.IsErr()) {
            LogWarn("registry", "late shutdown of '" + name + "' failed: " +
                                    down.Error().ToString());
        }
    } catch (const std::exception& e) {
        LogWarn("registry", "late shutdown of '" + name + "' threw: " + e.what());
    } catch (...) {
        LogWarn("registry", "late shutdown of '" + name +
                                "' threw a non-standard exception");
    }
}

Result<void, Error> ValidateOperations(const ProviderHandle& handle) {
    const auto& ops = handle.Operations();
    if (ops.empty()) {
        return Result<void, Error>::Err(MakeRegistryError(
            "Register",
            "provider '" + handle.Name() + "' declares no operations"));
    }
    std::set<std::string> seen;
    for (const auto& op : ops) {
        if (!IsValidIdentifier(op.name)) {
            return Result<void, Error>::Err(MakeRegistryError(
                "Register",
                "provider '" + handle.Name() + "' declares invalid operation name '" +
                    op.name + "'"));
        }
        if (!seen.insert(op.name).second) {
            return Result<void, Error>::Err(MakeRegistryError(
                "Register",
                "provider '" + handle.Name() + "' declares operation '" +
                    op.name + "' twice"));
        }
        if (!op.input_schema.is_object()) {
            return Result<void, Error>::Err(MakeRegistryError(
                "Register",
                "operation '" + QualifiedName(handle.Name(), op.name) +
                    "' has a non-object input schema"));
        }
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

const char* ProviderStateName(ProviderState state) {
    switch (state) {
        case ProviderState::Uninitialized: return "Uninitialized";
        case ProviderState::Ready:         return "Ready";
        case ProviderState::ShuttingDown:  return "ShuttingDown";
        case ProviderState::Closed:        return "Closed";
    }
    return "Closed";
}

// ---------------------------------------------------------------------------
// ProviderHandle
// ---------------------------------------------------------------------------
ProviderHandle::ProviderHandle(std::shared_ptr<ICapabilityProvider> provider)
    : name_(provider->Name()),
      provider_(std::move(provider)),
      operations_(provider_->Capabilities()) {}

const CapabilityDescriptor* ProviderHandle::FindOperation(
    std::string_view operation) const {
    for (const auto& op : operations_) {
        if (op.name == operation) {
            return &op;
        }
    }
    return nullptr;
}

std::optional<std::string> ProviderHandle::DefaultOperation() const {
    if (operations_.size() == 1) {
        return operations_.front().name;
    }
    return std::nullopt;
}

Result<void, Error> ProviderHandle::Initialize(std::chrono::milliseconds timeout) {
    auto provider = provider_;
    auto late = std::make_shared<LateInit>();
    auto name = name_;
    auto result = RunHook("Initialize", name_, timeout, [provider, late, name] {
        auto init = provider->Init();
        if (init.IsOk()) {
            std::unique_lock<std::mutex> lock(late->mutex);
            late->succeeded = true;
            if (late->abandoned) {
                lock.unlock();
                ShutdownAbandoned(*provider, name);
            }
        }
        return init;
    });

    if (result.IsErr()) {
        // The hook may still be running. Whichever side sees both flags
        // shuts the provider down.
        std::unique_lock<std::mutex> lock(late->mutex);
        late->abandoned = true;
        if (late->succeeded) {
            lock.unlock();
            ShutdownAbandoned(*provider, name_);
        }
    }
    state_.store(result.IsOk() ? ProviderState::Ready : ProviderState::Closed,
                 std::memory_order_release);
    return result;
}

Result<void, Error> ProviderHandle::Shutdown(std::chrono::milliseconds timeout) {
    auto expected = ProviderState::Ready;
    if (!state_.compare_exchange_strong(expected, ProviderState::ShuttingDown,
                                        std::memory_order_acq_rel)) {
        return Result<void, Error>::Ok();
    }

    auto provider = provider_;
    auto result = RunHook("Shutdown", name_, timeout,
                          [provider] { return provider->Shutdown(); });
    state_.store(ProviderState::Closed, std::memory_order_release);
    return result;
}

// ---------------------------------------------------------------------------
// ToolRegistry
// ---------------------------------------------------------------------------
ToolRegistry::ToolRegistry(RegistryOptions options) : options_(options) {}

ToolRegistry::~ToolRegistry() {
    for (const auto& handle : SnapshotHandles()) {
        if (handle->State() != ProviderState::Ready) continue;
        auto down = handle->Shutdown(options_.shutdown_timeout);
        if (down.IsErr()) {
            LogWarn("registry", down.Error().ToString());
        }
    }
}

std::shared_ptr<ToolRegistry::Slot> ToolRegistry::AcquireSlot(
    const std::string& name) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = slots_.find(name);
        if (it != slots_.end()) {
            return it->second;
        }
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& slot = slots_[name];
    if (!slot) {
        slot = std::make_shared<Slot>();
    }
    return slot;
}

std::vector<std::shared_ptr<ProviderHandle>> ToolRegistry::SnapshotHandles() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::shared_ptr<ProviderHandle>> handles;
    handles.reserve(order_.size());
    for (const auto& name : order_) {
        auto it = slots_.find(name);
        if (it != slots_.end() && it->second->current) {
            handles.push_back(it->second->current);
        }
    }
    return handles;
}

Result<void, Error> ToolRegistry::Register(
    std::shared_ptr<ICapabilityProvider> provider) {
    if (!provider) {
        return Result<void, Error>::Err(
            MakeRegistryError("Register", "provider must not be null"));
    }

    std::shared_ptr<ProviderHandle> handle;
    try {
        handle = std::make_shared<ProviderHandle>(std::move(provider));
    } catch (const std::exception& e) {
        return Result<void, Error>::Err(MakeRegistryError(
            "Register", "failed to read provider metadata", e.what()));
    }

    auto name = ProviderName::Create(handle->Name());
    if (name.IsErr()) {
        return Result<void, Error>::Err(
            MakeRegistryError("Register", name.Error()));
    }
    auto ops = ValidateOperations(*handle);
    if (ops.IsErr()) {
        return ops;
    }

    const auto& key = handle->Name();
    auto slot = AcquireSlot(key);
    std::lock_guard<std::mutex> registration(slot->registration);

    auto init = handle->Initialize(options_.init_timeout);
    if (init.IsErr()) {
        LogError("registry", init.Error().ToString());
        return init;
    }

    std::shared_ptr<ProviderHandle> previous;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        previous = std::exchange(slot->current, handle);
        slots_[key] = slot;
        if (std::find(order_.begin(), order_.end(), key) == order_.end()) {
            order_.push_back(key);
        }
    }

    if (previous) {
        auto down = previous->Shutdown(options_.shutdown_timeout);
        if (down.IsErr()) {
            LogWarn("registry", "replaced provider '" + key +
                                    "' but its predecessor failed to shut down: " +
                                    down.Error().ToString());
        }
        LogInfo("registry", "replaced provider '" + key + "'");
    } else {
        LogInfo("registry", "registered provider '" + key + "' with " +
                                std::to_string(handle->Operations().size()) +
                                " operation(s)");
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> ToolRegistry::Unregister(std::string_view name) {
    const std::string key(name);
    std::shared_ptr<Slot> slot;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = slots_.find(key);
        if (it != slots_.end()) {
            slot = it->second;
        }
    }
    if (!slot) {
        return Result<void, Error>::Err(MakeRegistryError(
            "Unregister", "no provider named '" + key + "' is registered"));
    }

    std::lock_guard<std::mutex> registration(slot->registration);
    std::shared_ptr<ProviderHandle> removed;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        removed = std::exchange(slot->current, nullptr);
        auto it = slots_.find(key);
        if (it != slots_.end() && it->second == slot) {
            slots_.erase(it);
        }
        order_.erase(std::remove(order_.begin(), order_.end(), key), order_.end());
    }
    if (!removed) {
        return Result<void, Error>::Err(MakeRegistryError(
            "Unregister", "no provider named '" + key + "' is registered"));
    }

    LogInfo("registry", "unregistered provider '" + key + "'");
    return removed->Shutdown(options_.shutdown_timeout);
}

Result<std::shared_ptr<ProviderHandle>, Error> ToolRegistry::Lookup(
    std::string_view name) const {
    using R = Result<std::shared_ptr<ProviderHandle>, Error>;
    std::shared_ptr<ProviderHandle> handle;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = slots_.find(std::string(name));
        if (it != slots_.end()) {
            handle = it->second->current;
        }
    }
    if (!handle || handle->State() != ProviderState::Ready) {
        return R::Err(Error{"Lookup",
                            "no capability provider named '" + std::string(name) + "'",
                            ErrorCode::CapabilityNotFound, std::nullopt, {}});
    }
    return R::Ok(std::move(handle));
}

std::vector<CapabilityDescriptor> ToolRegistry::ListCapabilities() const {
    std::vector<CapabilityDescriptor> out;
    for (const auto& handle : SnapshotHandles()) {
        if (handle->State() != ProviderState::Ready) continue;
        for (const auto& op : handle->Operations()) {
            out.push_back({QualifiedName(handle->Name(), op.name),
                           op.description, op.input_schema});
        }
    }
    return out;
}

std::vector<std::string> ToolRegistry::ProviderNames() const {
    std::vector<std::string> names;
    for (const auto& handle : SnapshotHandles()) {
        if (handle->State() == ProviderState::Ready) {
            names.push_back(handle->Name());
        }
    }
    return names;
}

std::optional<ProviderState> ToolRegistry::StateOf(std::string_view name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = slots_.find(std::string(name));
    if (it == slots_.end() || !it->second->current) {
        return std::nullopt;
    }
    return it->second->current->State();
}

Result<void, Error> ToolRegistry::ShutdownAll() {
    std::vector<Error> failures;
    size_t closed = 0;
    for (const auto& handle : SnapshotHandles()) {
        auto down = handle->Shutdown(options_.shutdown_timeout);
        if (down.IsErr()) {
            failures.push_back(std::move(down).Error());
        } else {
            ++closed;
        }
    }

    if (failures.empty()) {
        LogInfo("registry", "shut down " + std::to_string(closed) + " provider(s)");
        return Result<void, Error>::Ok();
    }

    auto aggregate = Error::Aggregate("ShutdownAll", std::move(failures));
    LogError("registry", aggregate.ToString());
    return Result<void, Error>::Err(std::move(aggregate));
}

} // namespace toolbridge
