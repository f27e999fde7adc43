#include <catch2/catch_test_macros.hpp>

#include <toolbridge/providers/home_assistant_provider.hpp>

#include "mocks/mock_http_transport.hpp"

#include <memory>
#include <string>

using namespace toolbridge;
using namespace toolbridge::testing;
using nlohmann::json;

namespace {

struct HaFixture {
    explicit HaFixture(std::string url = "http://ha.local:8123",
                       std::string token = "secret-token")
        : transport(std::make_shared<MockHttpTransport>()) {
        HomeAssistantOptions options;
        options.url = std::move(url);
        options.token = std::move(token);
        options.timeout = std::chrono::seconds(7);
        provider = std::make_unique<HomeAssistantProvider>(options, transport);
    }

    std::shared_ptr<MockHttpTransport> transport;
    std::unique_ptr<HomeAssistantProvider> provider;
};

} // anonymous namespace

// ===========================================================================
// Description and lifecycle
// ===========================================================================

TEST_CASE("HomeAssistantProvider: four operations", "[providers][home_assistant]") {
    HaFixture f;
    CHECK(f.provider->Name() == "home_assistant");
    auto caps = f.provider->Capabilities();
    REQUIRE(caps.size() == 4);
    CHECK(caps[0].name == "get_states");
    CHECK(caps[1].name == "get_state");
    CHECK(caps[1].input_schema["required"] == json{"entity_id"});
    CHECK(caps[2].name == "call_service");
    CHECK(caps[2].input_schema["required"] == json{"domain", "service"});
    CHECK(caps[3].name == "get_services");
}

TEST_CASE("HomeAssistantProvider: Init rejects an unparseable URL", "[providers][home_assistant]") {
    HaFixture f("ha.local:8123");
    auto r = f.provider->Init();
    REQUIRE(r.IsErr());
    CHECK(r.Error().code == ErrorCode::RegistryFault);
    CHECK(r.Error().message == "invalid Home Assistant URL 'ha.local:8123'");
}

TEST_CASE("HomeAssistantProvider: calls before Init fail", "[providers][home_assistant]") {
    HaFixture f;
    auto r = f.provider->Execute("get_states", json::object());
    REQUIRE(r.IsErr());
    CHECK(r.Error().message == "provider is not initialized");
}

TEST_CASE("HomeAssistantProvider: missing token fails the call, not Init", "[providers][home_assistant]") {
    HaFixture f("http://ha.local:8123", "");
    REQUIRE(f.provider->Init().IsOk());
    auto r = f.provider->Execute("get_states", json::object());
    REQUIRE(r.IsErr());
    CHECK(r.Error().code == ErrorCode::ExecutionFailed);
    CHECK(r.Error().message == "Home Assistant token is not configured");
    CHECK(f.transport->Calls().empty());
}

// ===========================================================================
// Requests
// ===========================================================================

TEST_CASE("HomeAssistantProvider: get_states", "[providers][home_assistant]") {
    HaFixture f;
    REQUIRE(f.provider->Init().IsOk());
    f.transport->EnqueueReply(200, R"([{"entity_id":"light.kitchen","state":"on"}])");

    auto r = f.provider->Execute("get_states", json::object());
    REQUIRE(r.IsOk());
    CHECK(r.Value()[0]["state"] == "on");

    auto call = f.transport->Calls().at(0);
    CHECK(call.method == "GET");
    CHECK(call.url.host == "ha.local");
    CHECK(call.url.port == 8123);
    CHECK(call.url.path == "/api/states");
    CHECK(call.headers.at("Authorization") == "Bearer secret-token");
    CHECK(call.headers.at("Accept") == "application/json");
    CHECK(call.timeout == std::chrono::seconds(7));
    CHECK(call.body.empty());
}

TEST_CASE("HomeAssistantProvider: get_state encodes the entity id", "[providers][home_assistant]") {
    HaFixture f("http://ha.local:8123/prefix/");
    REQUIRE(f.provider->Init().IsOk());
    f.transport->EnqueueReply(200, R"({"entity_id":"sensor.temp","state":"21.5"})");
    f.transport->EnqueueReply(200, "{}");

    auto r = f.provider->Execute("get_state", {{"entity_id", "sensor.temp"}});
    REQUIRE(r.IsOk());
    CHECK(r.Value()["state"] == "21.5");
    CHECK(f.transport->Calls().at(0).url.path == "/prefix/api/states/sensor.temp");

    (void)f.provider->Execute("get_state", {{"entity_id", "a b/c"}});
    CHECK(f.transport->Calls().at(1).url.path == "/prefix/api/states/a%20b%2Fc");
}

TEST_CASE("HomeAssistantProvider: call_service posts the service data", "[providers][home_assistant]") {
    HaFixture f;
    REQUIRE(f.provider->Init().IsOk());
    f.transport->EnqueueReply(200, "[]");

    auto r = f.provider->Execute("call_service", {
        {"domain", "light"},
        {"service", "turn_on"},
        {"service_data", {{"entity_id", "light.kitchen"}, {"brightness", 200}}}
    });
    REQUIRE(r.IsOk());
    CHECK(r.Value() == json::array());

    auto call = f.transport->Calls().at(0);
    CHECK(call.method == "POST");
    CHECK(call.url.path == "/api/services/light/turn_on");
    CHECK(call.content_type == "application/json");
    CHECK(json::parse(call.body) ==
          json{{"entity_id", "light.kitchen"}, {"brightness", 200}});
}

TEST_CASE("HomeAssistantProvider: call_service without data sends an empty object", "[providers][home_assistant]") {
    HaFixture f;
    REQUIRE(f.provider->Init().IsOk());
    f.transport->EnqueueReply(200, "");

    auto r = f.provider->Execute("call_service", {{"domain", "scene"}, {"service", "apply"}});
    REQUIRE(r.IsOk());
    CHECK(r.Value() == json::object());
    CHECK(f.transport->Calls().at(0).body == "{}");
}

TEST_CASE("HomeAssistantProvider: call_service rejects path injection", "[providers][home_assistant]") {
    HaFixture f;
    REQUIRE(f.provider->Init().IsOk());
    auto r = f.provider->Execute("call_service", {{"domain", "light/../x"}, {"service", "on"}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().message == "domain and service must be lowercase identifiers");
    CHECK(f.transport->Calls().empty());
}

TEST_CASE("HomeAssistantProvider: get_services", "[providers][home_assistant]") {
    HaFixture f;
    REQUIRE(f.provider->Init().IsOk());
    f.transport->EnqueueReply(200, R"([{"domain":"light","services":{}}])");
    auto r = f.provider->Execute("get_services", json::object());
    REQUIRE(r.IsOk());
    CHECK(r.Value()[0]["domain"] == "light");
    CHECK(f.transport->Calls().at(0).url.path == "/api/services");
}

// ===========================================================================
// Failures
// ===========================================================================

TEST_CASE("HomeAssistantProvider: HTTP failures", "[providers][home_assistant]") {
    HaFixture f;
    REQUIRE(f.provider->Init().IsOk());

    SECTION("401") {
        f.transport->EnqueueReply(401, "");
        auto r = f.provider->Execute("get_states", json::object());
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "Home Assistant rejected the access token");
    }
    SECTION("404") {
        f.transport->EnqueueReply(404, "");
        auto r = f.provider->Execute("get_state", {{"entity_id", "light.ghost"}});
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "not found: GET /api/states/light.ghost");
    }
    SECTION("500") {
        f.transport->EnqueueReply(500, "boom");
        auto r = f.provider->Execute("get_services", json::object());
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "Home Assistant returned HTTP 500");
        CHECK(r.Error().detail == std::optional<std::string>("boom"));
    }
    SECTION("invalid JSON") {
        f.transport->EnqueueReply(200, "<html>");
        auto r = f.provider->Execute("get_states", json::object());
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "Home Assistant sent invalid JSON");
    }
    SECTION("transport error") {
        f.transport->EnqueueError(Error{"HttpSend", "connect failed",
                                        ErrorCode::ExecutionFailed, std::nullopt, {}});
        auto r = f.provider->Execute("get_states", json::object());
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "connect failed");
    }
    SECTION("unknown operation") {
        auto r = f.provider->Execute("restart", json::object());
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "unsupported operation 'restart'");
    }
}
