#include <toolbridge/providers/home_assistant_provider.hpp>

#include <toolbridge/core/log.hpp>
#include <toolbridge/core/types.hpp>

namespace toolbridge {

namespace {

Error HaError(const std::string& message,
              std::optional<std::string> detail = std::nullopt) {
    return Error{"HomeAssistant", message, ErrorCode::ExecutionFailed,
                 std::move(detail), {}};
}

nlohmann::json ObjectSchema(nlohmann::json properties, nlohmann::json required) {
    return {
        {"type", "object"},
        {"properties", std::move(properties)},
        {"required", std::move(required)},
        {"additionalProperties", false}
    };
}

} // anonymous namespace

HomeAssistantProvider::HomeAssistantProvider(HomeAssistantOptions options,
                                             std::shared_ptr<IHttpTransport> transport)
    : options_(std::move(options)), transport_(std::move(transport)) {}

std::vector<CapabilityDescriptor> HomeAssistantProvider::Capabilities() const {
    const nlohmann::json entity_id = {
        {"type", "string"},
        {"minLength", 1},
        {"description", "Entity id, e.g. light.living_room"}
    };
    return {
        {"get_states",
         "Get the states of all Home Assistant entities.",
         ObjectSchema(nlohmann::json::object(), nlohmann::json::array())},
        {"get_state",
         "Get the state of one Home Assistant entity.",
         ObjectSchema({{"entity_id", entity_id}}, {"entity_id"})},
        {"call_service",
         "Call a Home Assistant service, e.g. light.turn_on.",
         ObjectSchema({{"domain", {{"type", "string"}, {"minLength", 1},
                                   {"description", "Service domain, e.g. light"}}},
                       {"service", {{"type", "string"}, {"minLength", 1},
                                    {"description", "Service name, e.g. turn_on"}}},
                       {"service_data", {{"type", "object"},
                                         {"description", "Service payload, e.g. {\"entity_id\": \"light.kitchen\"}"}}}},
                      {"domain", "service"})},
        {"get_services",
         "List the services Home Assistant offers, grouped by domain.",
         ObjectSchema(nlohmann::json::object(), nlohmann::json::array())},
    };
}

Result<void, Error> HomeAssistantProvider::Init() {
    auto url = ParseHttpUrl(options_.url);
    if (url.IsErr()) {
        return Result<void, Error>::Err(Error{
            "Init", "invalid Home Assistant URL '" + options_.url + "'",
            ErrorCode::RegistryFault, url.Error(), {}});
    }
    base_ = url.Value();
    if (options_.token.empty()) {
        LogWarn("home_assistant", "no access token configured; calls will fail");
    }
    LogInfo("home_assistant", "using " + base_->Origin());
    return Result<void, Error>::Ok();
}

Result<nlohmann::json, Error> HomeAssistantProvider::Execute(
    const std::string& operation, const nlohmann::json& arguments) {
    using R = Result<nlohmann::json, Error>;

    if (operation == "get_states") {
        return Call("GET", "/api/states");
    }
    if (operation == "get_services") {
        return Call("GET", "/api/services");
    }
    if (operation == "get_state") {
        const auto entity = arguments.value("entity_id", std::string());
        if (entity.empty()) {
            return R::Err(HaError("entity_id is required"));
        }
        return Call("GET", "/api/states/" + UrlEncode(entity));
    }
    if (operation == "call_service") {
        const auto domain = arguments.value("domain", std::string());
        const auto service = arguments.value("service", std::string());
        if (!IsValidIdentifier(domain) || !IsValidIdentifier(service)) {
            return R::Err(HaError("domain and service must be lowercase identifiers",
                                  domain + "." + service));
        }
        auto data = arguments.value("service_data", nlohmann::json::object());
        return Call("POST", "/api/services/" + domain + "/" + service, data);
    }
    return R::Err(HaError("unsupported operation '" + operation + "'"));
}

Result<nlohmann::json, Error> HomeAssistantProvider::Call(
    const std::string& method, const std::string& path,
    const nlohmann::json& body) const {
    using R = Result<nlohmann::json, Error>;
    if (!base_) {
        return R::Err(HaError("provider is not initialized"));
    }
    if (options_.token.empty()) {
        return R::Err(HaError("Home Assistant token is not configured",
                              "set HOMEASSISTANT_TOKEN or providers.home_assistant.token"));
    }

    HttpCall call;
    call.method = method;
    call.url = *base_;
    call.url.path = base_->JoinPath(path);
    call.headers["Authorization"] = "Bearer " + options_.token;
    call.headers["Accept"] = "application/json";
    call.timeout = options_.timeout;
    if (!body.is_null()) {
        call.body = body.dump();
        call.content_type = "application/json";
    }

    auto reply = transport_->Send(call);
    if (reply.IsErr()) {
        return R::Err(reply.Error());
    }
    const auto& r = reply.Value();

    if (r.status == 401) {
        return R::Err(HaError("Home Assistant rejected the access token"));
    }
    if (r.status == 404) {
        return R::Err(HaError("not found: " + method + " " + path));
    }
    if (r.status < 200 || r.status >= 300) {
        return R::Err(HaError("Home Assistant returned HTTP " + std::to_string(r.status),
                              r.body));
    }

    try {
        return R::Ok(r.body.empty() ? nlohmann::json::object()
                                    : nlohmann::json::parse(r.body));
    } catch (const nlohmann::json::parse_error& e) {
        return R::Err(HaError("Home Assistant sent invalid JSON", e.what()));
    }
}

} // namespace toolbridge
