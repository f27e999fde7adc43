#include <toolbridge/protocol/envelope.hpp>

#include <toolbridge/core/version.hpp>

namespace toolbridge {

namespace {

Error Malformed(const std::string& operation, const std::string& message) {
    return Error{operation, message, ErrorCode::MalformedRequest, std::nullopt, {}};
}

bool HasSupportedVersion(const nlohmann::json& message) {
    auto it = message.find("v");
    return it != message.end() && it->is_string() &&
           it->get<std::string>() == kProtocolVersion;
}

} // anonymous namespace

bool IsValidCorrelationId(const nlohmann::json& id) {
    return id.is_string() || id.is_number();
}

nlohmann::json ExtractCorrelationId(const nlohmann::json& message) {
    if (!message.is_object()) {
        return nullptr;
    }
    auto it = message.find("id");
    if (it == message.end() || !IsValidCorrelationId(*it)) {
        return nullptr;
    }
    return *it;
}

// ---------------------------------------------------------------------------
// ErrorObject
// ---------------------------------------------------------------------------
ErrorObject ErrorObject::FromError(const Error& error,
                                   const nlohmann::json& context) {
    nlohmann::json data = {{"kind", error.CodeName()}};
    if (error.detail) {
        data["detail"] = *error.detail;
    }
    if (context.is_object()) {
        for (auto it = context.begin(); it != context.end(); ++it) {
            data[it.key()] = it.value();
        }
    }
    return ErrorObject{error.WireCode(), error.message, std::move(data)};
}

// ---------------------------------------------------------------------------
// ResponseEnvelope
// ---------------------------------------------------------------------------
ResponseEnvelope ResponseEnvelope::Success(nlohmann::json id,
                                           nlohmann::json result) {
    return ResponseEnvelope(
        std::move(id),
        std::variant<nlohmann::json, ErrorObject>(std::in_place_index<0>,
                                                  std::move(result)));
}

ResponseEnvelope ResponseEnvelope::Failure(nlohmann::json id, ErrorObject error) {
    return ResponseEnvelope(
        std::move(id),
        std::variant<nlohmann::json, ErrorObject>(std::in_place_index<1>,
                                                  std::move(error)));
}

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------
nlohmann::json ToJson(const RequestEnvelope& request) {
    return {
        {"v", kProtocolVersion},
        {"id", request.id},
        {"method", request.method},
        {"params", request.params}
    };
}

nlohmann::json ToJson(const ResponseEnvelope& response) {
    nlohmann::json out = {
        {"v", kProtocolVersion},
        {"id", response.Id()}
    };
    if (response.IsSuccess()) {
        out["result"] = response.ResultPayload();
        return out;
    }

    const auto& error = response.ErrorPayload();
    nlohmann::json error_json = {
        {"code", error.code},
        {"message", error.message}
    };
    if (!error.data.is_null()) {
        error_json["data"] = error.data;
    }
    out["error"] = std::move(error_json);
    return out;
}

// ---------------------------------------------------------------------------
// Decoding
// ---------------------------------------------------------------------------
Result<RequestEnvelope, Error> ParseRequest(const nlohmann::json& message) {
    using R = Result<RequestEnvelope, Error>;
    if (!message.is_object()) {
        return R::Err(Malformed("ParseRequest", "envelope must be a JSON object"));
    }
    if (!HasSupportedVersion(message)) {
        return R::Err(Malformed("ParseRequest",
                                std::string("protocol version must be \"") +
                                    kProtocolVersion + "\""));
    }

    auto id = message.find("id");
    if (id == message.end() || !IsValidCorrelationId(*id)) {
        return R::Err(Malformed("ParseRequest",
                                "correlation id must be a string or a number"));
    }

    auto method = message.find("method");
    if (method == message.end() || !method->is_string() ||
        method->get<std::string>().empty()) {
        return R::Err(Malformed("ParseRequest", "method must be a non-empty string"));
    }

    RequestEnvelope request;
    request.id = *id;
    request.method = method->get<std::string>();

    auto params = message.find("params");
    if (params != message.end() && !params->is_null()) {
        if (!params->is_object()) {
            return R::Err(Malformed("ParseRequest", "params must be an object"));
        }
        request.params = *params;
    }
    return R::Ok(std::move(request));
}

Result<ResponseEnvelope, Error> ParseResponse(const nlohmann::json& message) {
    using R = Result<ResponseEnvelope, Error>;
    if (!message.is_object()) {
        return R::Err(Malformed("ParseResponse", "envelope must be a JSON object"));
    }
    if (!HasSupportedVersion(message)) {
        return R::Err(Malformed("ParseResponse",
                                std::string("protocol version must be \"") +
                                    kProtocolVersion + "\""));
    }

    auto id = message.find("id");
    if (id == message.end() || !(id->is_null() || IsValidCorrelationId(*id))) {
        return R::Err(Malformed("ParseResponse",
                                "correlation id must be a string, an integer or null"));
    }

    auto result = message.find("result");
    auto error = message.find("error");
    const bool has_result = result != message.end();
    const bool has_error = error != message.end();
    if (has_result == has_error) {
        return R::Err(Malformed("ParseResponse",
                                "exactly one of result and error must be present"));
    }

    if (has_result) {
        return R::Ok(ResponseEnvelope::Success(*id, *result));
    }

    if (!error->is_object()) {
        return R::Err(Malformed("ParseResponse", "error must be an object"));
    }
    auto code = error->find("code");
    auto text = error->find("message");
    if (code == error->end() || !code->is_number_integer() ||
        text == error->end() || !text->is_string()) {
        return R::Err(Malformed("ParseResponse",
                                "error needs an integer code and a string message"));
    }

    ErrorObject object{code->get<int>(), text->get<std::string>(), nullptr};
    auto data = error->find("data");
    if (data != error->end()) {
        object.data = *data;
    }
    return R::Ok(ResponseEnvelope::Failure(*id, std::move(object)));
}

Result<nlohmann::json, Error> ParseJsonText(std::string_view text) {
    using R = Result<nlohmann::json, Error>;
    try {
        return R::Ok(nlohmann::json::parse(text.begin(), text.end()));
    } catch (const nlohmann::json::parse_error& e) {
        return R::Err(Error{"ParseJsonText", "parse error",
                            ErrorCode::InternalTransportError,
                            std::string(e.what()), {}});
    }
}

} // namespace toolbridge
