#pragma once

#include <toolbridge/protocol/context_store.hpp>
#include <toolbridge/protocol/envelope.hpp>
#include <toolbridge/registry/tool_registry.hpp>

#include <chrono>
#include <memory>
#include <string_view>

#include <nlohmann/json.hpp>

namespace toolbridge {

// ---------------------------------------------------------------------------
// RequestPhase: lifecycle of one in-flight request.
//
//   Received -> Validated -> Routed -> Executing -> Completed
//
// Rejected is reachable from every phase but Completed. Every request ends
// in exactly one of Completed or Rejected.
// ---------------------------------------------------------------------------
enum class RequestPhase {
    Received,
    Validated,
    Routed,
    Executing,
    Completed,
    Rejected,
};

const char* RequestPhaseName(RequestPhase phase);

struct DispatcherOptions {
    std::chrono::milliseconds execute_timeout{30000};
};

/// {"capabilities": [{name, description, input_schema}, ...]}
[[nodiscard]] nlohmann::json DescribeCapabilities(
    const std::vector<CapabilityDescriptor>& capabilities);

// ---------------------------------------------------------------------------
// ProtocolDispatcher: turns request envelopes into response envelopes.
//
// Every Dispatch* call returns exactly one ResponseEnvelope and never throws
// on account of the request or the provider. Safe to call concurrently.
//
// Methods are "<provider>.<operation>"; a bare "<provider>" selects the
// sole operation of a single-operation provider. The "rpc" namespace holds
// the built-ins:
//   rpc.list  -> {"capabilities": [...]}
//   rpc.ping  -> {"status": "ok", "version": "..."}
// ---------------------------------------------------------------------------
class ProtocolDispatcher {
public:
    explicit ProtocolDispatcher(const ToolRegistry& registry,
                                DispatcherOptions options = {},
                                std::shared_ptr<AsyncContextRecorder> recorder = nullptr);

    ProtocolDispatcher(const ProtocolDispatcher&) = delete;
    ProtocolDispatcher& operator=(const ProtocolDispatcher&) = delete;

    /// Handle one raw JSON message (not yet known to be a valid envelope).
    [[nodiscard]] ResponseEnvelope Dispatch(const nlohmann::json& message);

    /// Handle one already-parsed request envelope.
    [[nodiscard]] ResponseEnvelope Dispatch(const RequestEnvelope& request);

    /// Handle one line of envelope text.
    [[nodiscard]] ResponseEnvelope DispatchText(std::string_view text);

    [[nodiscard]] const ToolRegistry& Registry() const noexcept { return registry_; }
    [[nodiscard]] const DispatcherOptions& Options() const noexcept { return options_; }

private:
    struct Rejection {
        Error error;
        nlohmann::json context;  // extra fields for error.data, or null
    };
    using RouteResult = Result<nlohmann::json, Rejection>;

    RouteResult Route(const RequestEnvelope& request, RequestPhase& phase);
    RouteResult HandleBuiltin(const std::string& operation);
    RouteResult Execute(const std::shared_ptr<ProviderHandle>& handle,
                        const std::string& operation,
                        const nlohmann::json& params);

    void RecordInteraction(const std::string& method,
                           const std::optional<ErrorCode>& error_code,
                           std::chrono::steady_clock::time_point started);

    const ToolRegistry& registry_;
    DispatcherOptions options_;
    std::shared_ptr<AsyncContextRecorder> recorder_;
};

} // namespace toolbridge
