#include <toolbridge/core/result.hpp>

#include <sstream>

namespace toolbridge {

namespace {

// Wire codes follow the JSON-RPC reserved ranges: the standard codes for
// envelope-level failures, the -32000 server range for execution failures.
constexpr int kMalformedRequest = -32600;
constexpr int kCapabilityNotFound = -32601;
constexpr int kInvalidArguments = -32602;
constexpr int kExecutionFailed = -32000;
constexpr int kExecutionTimeout = -32001;
constexpr int kRegistryFault = -32002;
constexpr int kInternalTransportError = -32700;

void AppendError(std::ostringstream& oss, const Error& e, int depth) {
    oss << std::string(static_cast<size_t>(depth) * 2, ' ');
    if (!e.operation.empty()) {
        oss << e.operation << ": ";
    }
    oss << e.message;
    if (e.detail.has_value() && !e.detail->empty()) {
        oss << " (" << *e.detail << ")";
    }
    for (const auto& cause : e.causes) {
        oss << '\n';
        AppendError(oss, cause, depth + 1);
    }
}

} // anonymous namespace

int WireCode(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::MalformedRequest:       return kMalformedRequest;
        case ErrorCode::CapabilityNotFound:     return kCapabilityNotFound;
        case ErrorCode::InvalidArguments:       return kInvalidArguments;
        case ErrorCode::ExecutionTimeout:       return kExecutionTimeout;
        case ErrorCode::ExecutionFailed:        return kExecutionFailed;
        case ErrorCode::RegistryFault:          return kRegistryFault;
        case ErrorCode::InternalTransportError: return kInternalTransportError;
    }
    return kExecutionFailed;
}

std::optional<ErrorCode> ErrorCodeFromWire(int wire_code) noexcept {
    switch (wire_code) {
        case kMalformedRequest:       return ErrorCode::MalformedRequest;
        case kCapabilityNotFound:     return ErrorCode::CapabilityNotFound;
        case kInvalidArguments:       return ErrorCode::InvalidArguments;
        case kExecutionTimeout:       return ErrorCode::ExecutionTimeout;
        case kExecutionFailed:        return ErrorCode::ExecutionFailed;
        case kRegistryFault:          return ErrorCode::RegistryFault;
        case kInternalTransportError: return ErrorCode::InternalTransportError;
        default:                      return std::nullopt;
    }
}

int HttpStatusFor(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::MalformedRequest:       return 400;
        case ErrorCode::CapabilityNotFound:     return 400;
        case ErrorCode::InvalidArguments:       return 400;
        case ErrorCode::InternalTransportError: return 400;
        case ErrorCode::ExecutionTimeout:       return 504;
        case ErrorCode::ExecutionFailed:        return 500;
        case ErrorCode::RegistryFault:          return 500;
    }
    return 500;
}

const char* ErrorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::MalformedRequest:       return "MalformedRequest";
        case ErrorCode::CapabilityNotFound:     return "CapabilityNotFound";
        case ErrorCode::InvalidArguments:       return "InvalidArguments";
        case ErrorCode::ExecutionTimeout:       return "ExecutionTimeout";
        case ErrorCode::ExecutionFailed:        return "ExecutionFailed";
        case ErrorCode::RegistryFault:          return "RegistryFault";
        case ErrorCode::InternalTransportError: return "InternalTransportError";
    }
    return "ExecutionFailed";
}

Error Error::Aggregate(const std::string& operation,
                       std::vector<Error> causes,
                       ErrorCode code) {
    Error aggregate;
    aggregate.operation = operation;
    aggregate.code = code;
    aggregate.message = std::to_string(causes.size()) +
                        (causes.size() == 1 ? " failure" : " failures");
    aggregate.causes = std::move(causes);
    return aggregate;
}

std::string Error::ToString() const {
    std::ostringstream oss;
    AppendError(oss, *this, 0);
    return oss.str();
}

} // namespace toolbridge
