#include <toolbridge/protocol/dispatcher.hpp>

#include <toolbridge/core/deadline.hpp>
#include <toolbridge/core/log.hpp>
#include <toolbridge/core/types.hpp>
#include <toolbridge/core/version.hpp>
#include <toolbridge/protocol/schema_validator.hpp>

#include <string>
#include <utility>

namespace toolbridge {

namespace {

Error MakeError(const std::string& operation, const std::string& message,
                ErrorCode code, std::optional<std::string> detail = std::nullopt) {
    return Error{operation, message, code, std::move(detail), {}};
}

std::string DescribeId(const nlohmann::json& id) {
    return id.is_null() ? "<none>" : id.dump();
}

std::string JoinNames(const std::vector<CapabilityDescriptor>& ops) {
    std::string out;
    for (const auto& op : ops) {
        if (!out.empty()) out += ", ";
        out += op.name;
    }
    return out;
}

} // anonymous namespace

const char* RequestPhaseName(RequestPhase phase) {
    switch (phase) {
        case RequestPhase::Received:  return "Received";
        case RequestPhase::Validated: return "Validated";
        case RequestPhase::Routed:    return "Routed";
        case RequestPhase::Executing: return "Executing";
        case RequestPhase::Completed: return "Completed";
        case RequestPhase::Rejected:  return "Rejected";
    }
    return "Rejected";
}

nlohmann::json DescribeCapabilities(
    const std::vector<CapabilityDescriptor>& capabilities) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& cap : capabilities) {
        list.push_back({
            {"name", cap.name},
            {"description", cap.description},
            {"input_schema", cap.input_schema}
        });
    }
    return {{"capabilities", std::move(list)}};
}

ProtocolDispatcher::ProtocolDispatcher(const ToolRegistry& registry,
                                       DispatcherOptions options,
                                       std::shared_ptr<AsyncContextRecorder> recorder)
    : registry_(registry), options_(options), recorder_(std::move(recorder)) {}

// ---------------------------------------------------------------------------
// Entry points
// ---------------------------------------------------------------------------
ResponseEnvelope ProtocolDispatcher::DispatchText(std::string_view text) {
    auto parsed = ParseJsonText(text);
    if (parsed.IsErr()) {
        LogDebug("dispatcher", parsed.Error().ToString());
        return ResponseEnvelope::Failure(nullptr,
                                         ErrorObject::FromError(parsed.Error()));
    }
    return Dispatch(parsed.Value());
}

ResponseEnvelope ProtocolDispatcher::Dispatch(const nlohmann::json& message) {
    const auto started = std::chrono::steady_clock::now();
    auto request = ParseRequest(message);
    if (request.IsOk()) {
        return Dispatch(request.Value());
    }

    // Rejected before validation: answer with whatever id can be salvaged.
    auto id = ExtractCorrelationId(message);
    LogDebug("dispatcher", "rejected envelope id=" + DescribeId(id) + ": " +
                               request.Error().message);

    std::string method;
    if (message.is_object()) {
        auto it = message.find("method");
        if (it != message.end() && it->is_string()) {
            method = it->get<std::string>();
        }
    }
    RecordInteraction(method, request.Error().code, started);
    return ResponseEnvelope::Failure(std::move(id),
                                     ErrorObject::FromError(request.Error()));
}

ResponseEnvelope ProtocolDispatcher::Dispatch(const RequestEnvelope& request) {
    const auto started = std::chrono::steady_clock::now();
    auto phase = RequestPhase::Validated;

    auto routed = Route(request, phase);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (routed.IsOk()) {
        phase = RequestPhase::Completed;
        LogDebug("dispatcher", "id=" + DescribeId(request.id) + " method=" +
                                   request.method + " completed in " +
                                   std::to_string(elapsed.count()) + " ms");
        RecordInteraction(request.method, std::nullopt, started);
        return ResponseEnvelope::Success(request.id, std::move(routed).Value());
    }

    const auto rejected_in = phase;
    phase = RequestPhase::Rejected;
    auto rejection = std::move(routed).Error();
    const auto message = "id=" + DescribeId(request.id) + " method=" +
                         request.method + " rejected while " +
                         RequestPhaseName(rejected_in) + ": " +
                         rejection.error.ToString();
    if (rejection.error.code == ErrorCode::ExecutionFailed ||
        rejection.error.code == ErrorCode::ExecutionTimeout) {
        LogWarn("dispatcher", message);
    } else {
        LogDebug("dispatcher", message);
    }

    RecordInteraction(request.method, rejection.error.code, started);
    return ResponseEnvelope::Failure(
        request.id, ErrorObject::FromError(rejection.error, rejection.context));
}

// ---------------------------------------------------------------------------
// Routing
// ---------------------------------------------------------------------------
ProtocolDispatcher::RouteResult ProtocolDispatcher::Route(
    const RequestEnvelope& request, RequestPhase& phase) {
    auto method = MethodRef::Parse(request.method);
    if (method.IsErr()) {
        return RouteResult::Err({MakeError("Route", method.Error(),
                                           ErrorCode::CapabilityNotFound),
                                 nullptr});
    }
    const auto& ref = method.Value();

    if (ref.provider == kReservedNamespace) {
        phase = RequestPhase::Routed;
        return HandleBuiltin(ref.operation.value_or(""));
    }

    auto handle = registry_.Lookup(ref.provider);
    if (handle.IsErr()) {
        return RouteResult::Err(
            {MakeError("Route", "capability '" + request.method + "' not found",
                       ErrorCode::CapabilityNotFound),
             nullptr});
    }
    const auto& provider = handle.Value();

    std::string operation;
    if (ref.operation) {
        operation = *ref.operation;
    } else if (auto fallback = provider->DefaultOperation()) {
        operation = *fallback;
    } else {
        return RouteResult::Err(
            {MakeError("Route",
                       "capability '" + request.method + "' not found",
                       ErrorCode::CapabilityNotFound,
                       "provider '" + ref.provider +
                           "' has several operations, use one of: " +
                           JoinNames(provider->Operations())),
             nullptr});
    }

    const auto* descriptor = provider->FindOperation(operation);
    if (descriptor == nullptr) {
        return RouteResult::Err(
            {MakeError("Route", "capability '" + request.method + "' not found",
                       ErrorCode::CapabilityNotFound,
                       "available operations: " + JoinNames(provider->Operations())),
             nullptr});
    }
    phase = RequestPhase::Routed;

    auto valid = ValidateAgainstSchema(request.params, descriptor->input_schema);
    if (valid.IsErr()) {
        return RouteResult::Err(
            {MakeError("Route",
                       "invalid arguments for '" +
                           QualifiedName(ref.provider, operation) + "'",
                       ErrorCode::InvalidArguments, valid.Error()),
             nullptr});
    }

    phase = RequestPhase::Executing;
    return Execute(provider, operation, request.params);
}

ProtocolDispatcher::RouteResult ProtocolDispatcher::HandleBuiltin(
    const std::string& operation) {
    if (operation == "list") {
        return RouteResult::Ok(DescribeCapabilities(registry_.ListCapabilities()));
    }
    if (operation == "ping") {
        return RouteResult::Ok({{"status", "ok"}, {"version", kVersion}});
    }
    return RouteResult::Err(
        {MakeError("Route",
                   "capability '" + std::string(kReservedNamespace) +
                       (operation.empty() ? "" : "." + operation) + "' not found",
                   ErrorCode::CapabilityNotFound,
                   "built-in methods: rpc.list, rpc.ping"),
         nullptr});
}

ProtocolDispatcher::RouteResult ProtocolDispatcher::Execute(
    const std::shared_ptr<ProviderHandle>& handle,
    const std::string& operation,
    const nlohmann::json& params) {
    const auto qualified = QualifiedName(handle->Name(), operation);
    const nlohmann::json context = {
        {"provider", handle->Name()},
        {"operation", operation}
    };

    // The worker owns copies of everything it touches so an abandoned
    // (timed-out) call can finish safely on its own.
    auto work = [handle, operation, params] {
        return handle->Provider()->Execute(operation, params);
    };

    std::optional<Result<nlohmann::json, Error>> outcome;
    try {
        outcome = RunWithDeadline(std::move(work), options_.execute_timeout);
    } catch (const std::exception& e) {
        return RouteResult::Err(
            {MakeError("Execute", "capability '" + qualified + "' failed",
                       ErrorCode::ExecutionFailed, e.what()),
             context});
    } catch (...) {
        return RouteResult::Err(
            {MakeError("Execute", "capability '" + qualified + "' failed",
                       ErrorCode::ExecutionFailed, "non-standard exception"),
             context});
    }

    if (!outcome.has_value()) {
        return RouteResult::Err(
            {MakeError("Execute",
                       "capability '" + qualified + "' timed out after " +
                           std::to_string(options_.execute_timeout.count()) + " ms",
                       ErrorCode::ExecutionTimeout),
             context});
    }

    if (outcome->IsErr()) {
        const auto& cause = outcome->Error();
        return RouteResult::Err(
            {MakeError("Execute", "capability '" + qualified + "' failed",
                       ErrorCode::ExecutionFailed,
                       cause.detail ? cause.message + ": " + *cause.detail
                                    : cause.message),
             context});
    }

    return RouteResult::Ok(std::move(*outcome).Value());
}

void ProtocolDispatcher::RecordInteraction(
    const std::string& method, const std::optional<ErrorCode>& error_code,
    std::chrono::steady_clock::time_point started) {
    if (!recorder_) {
        return;
    }
    InteractionRecord record;
    record.method = method;
    record.outcome = error_code ? InteractionOutcome::Failure
                                : InteractionOutcome::Success;
    record.error_code = error_code;
    record.latency = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    record.timestamp = std::chrono::system_clock::now();
    recorder_->Submit(std::move(record));
}

} // namespace toolbridge
