#pragma once

#include <toolbridge/core/result.hpp>

#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace toolbridge {

// ---------------------------------------------------------------------------
// Wire envelope, one JSON object per message:
//
//   Request:  {"v":"1", "id": <string|integer>, "method": "...", "params": {...}}
//   Success:  {"v":"1", "id": <same>, "result": <any>}
//   Failure:  {"v":"1", "id": <same|null>,
//              "error": {"code": <int>, "message": "...", "data": {...}?}}
//
// A correlation id of null marks a response to a request whose id could not
// be recovered.
// ---------------------------------------------------------------------------

/// True for a usable correlation id: a string or a number.
[[nodiscard]] bool IsValidCorrelationId(const nlohmann::json& id);

/// The correlation id of a raw message if it has a usable one, else null.
[[nodiscard]] nlohmann::json ExtractCorrelationId(const nlohmann::json& message);

struct ErrorObject {
    int code = 0;
    std::string message;
    nlohmann::json data;  // null when absent

    /// Project an Error onto the wire. `data` carries {"kind": <code name>},
    /// the error's detail when present, and any extra fields in `context`.
    static ErrorObject FromError(const Error& error,
                                 const nlohmann::json& context = nullptr);

    bool operator==(const ErrorObject& other) const {
        return code == other.code && message == other.message &&
               data == other.data;
    }
    bool operator!=(const ErrorObject& other) const { return !(*this == other); }
};

struct RequestEnvelope {
    nlohmann::json id;
    std::string method;
    nlohmann::json params = nlohmann::json::object();

    bool operator==(const RequestEnvelope& other) const {
        return id == other.id && method == other.method && params == other.params;
    }
};

// ---------------------------------------------------------------------------
// ResponseEnvelope: exactly one of a result payload or an ErrorObject.
// ---------------------------------------------------------------------------
class ResponseEnvelope {
public:
    static ResponseEnvelope Success(nlohmann::json id, nlohmann::json result);
    static ResponseEnvelope Failure(nlohmann::json id, ErrorObject error);

    [[nodiscard]] const nlohmann::json& Id() const noexcept { return id_; }
    [[nodiscard]] bool IsSuccess() const noexcept { return body_.index() == 0; }

    [[nodiscard]] const nlohmann::json& ResultPayload() const {
        return std::get<0>(body_);
    }
    [[nodiscard]] const ErrorObject& ErrorPayload() const {
        return std::get<1>(body_);
    }

    bool operator==(const ResponseEnvelope& other) const {
        return id_ == other.id_ && body_ == other.body_;
    }
    bool operator!=(const ResponseEnvelope& other) const { return !(*this == other); }

private:
    ResponseEnvelope(nlohmann::json id,
                     std::variant<nlohmann::json, ErrorObject> body)
        : id_(std::move(id)), body_(std::move(body)) {}

    nlohmann::json id_;
    std::variant<nlohmann::json, ErrorObject> body_;
};

// ---------------------------------------------------------------------------
// Codec. Parse errors come back as MalformedRequest (shape problems) or
// InternalTransportError (text that is not JSON at all).
// ---------------------------------------------------------------------------
[[nodiscard]] nlohmann::json ToJson(const RequestEnvelope& request);
[[nodiscard]] nlohmann::json ToJson(const ResponseEnvelope& response);

[[nodiscard]] Result<RequestEnvelope, Error> ParseRequest(const nlohmann::json& message);
[[nodiscard]] Result<ResponseEnvelope, Error> ParseResponse(const nlohmann::json& message);

/// Parse one line of text as JSON. Fails with InternalTransportError.
[[nodiscard]] Result<nlohmann::json, Error> ParseJsonText(std::string_view text);

} // namespace toolbridge
