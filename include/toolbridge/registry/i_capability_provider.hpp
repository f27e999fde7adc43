#pragma once

#include <toolbridge/core/result.hpp>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace toolbridge {

// ---------------------------------------------------------------------------
// CapabilityDescriptor: one operation a provider can perform.
//
// Providers declare descriptors with the bare operation name ("get_state").
// The registry reports them fully qualified ("home_assistant.get_state").
// ---------------------------------------------------------------------------
struct CapabilityDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object

    bool operator==(const CapabilityDescriptor& other) const {
        return name == other.name && description == other.description &&
               input_schema == other.input_schema;
    }
};

// ---------------------------------------------------------------------------
// ICapabilityProvider: the fixed interface every capability provider
// implements. The registry and the dispatcher only ever see this interface.
//
// Contract:
//   - Name() and Capabilities() are constant for the provider's lifetime.
//   - Init() and Shutdown() are each called at most once by the registry.
//   - Execute() may be called concurrently from many threads; providers are
//     stateless or synchronise internally.
//   - Execute() receives arguments already validated against the operation's
//     input schema.
//   - Methods return Result<T, Error>; a throw is tolerated but is reported
//     as an execution failure.
// ---------------------------------------------------------------------------
class ICapabilityProvider {
public:
    virtual ~ICapabilityProvider() = default;

    ICapabilityProvider(const ICapabilityProvider&) = delete;
    ICapabilityProvider& operator=(const ICapabilityProvider&) = delete;
    ICapabilityProvider(ICapabilityProvider&&) = delete;
    ICapabilityProvider& operator=(ICapabilityProvider&&) = delete;

    [[nodiscard]] virtual std::string Name() const = 0;

    [[nodiscard]] virtual std::vector<CapabilityDescriptor> Capabilities() const = 0;

    [[nodiscard]] virtual Result<void, Error> Init() {
        return Result<void, Error>::Ok();
    }

    [[nodiscard]] virtual Result<void, Error> Shutdown() {
        return Result<void, Error>::Ok();
    }

    [[nodiscard]] virtual Result<nlohmann::json, Error> Execute(
        const std::string& operation,
        const nlohmann::json& arguments) = 0;

protected:
    ICapabilityProvider() = default;
};

} // namespace toolbridge
