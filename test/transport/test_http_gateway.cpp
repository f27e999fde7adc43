#include <catch2/catch_test_macros.hpp>

#include <toolbridge/core/version.hpp>
#include <toolbridge/providers/system_info_provider.hpp>
#include <toolbridge/transport/http_gateway.hpp>

#include "mocks/local_server.hpp"
#include "mocks/mock_provider.hpp"

#include <httplib.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace toolbridge;
using namespace toolbridge::testing;
using namespace std::chrono_literals;
using nlohmann::json;

namespace {

struct GatewayFixture {
    explicit GatewayFixture(GatewayOptions options = {},
                            std::chrono::milliseconds timeout = 2000ms)
        : math(std::make_shared<MockProvider>("math")) {
        math->SetCapabilities({
            {"double", "Double a number", json::parse(R"({
                "type": "object",
                "properties": {"n": {"type": "integer"}},
                "required": ["n"]
            })")},
            {"broken", "Always fails", {{"type", "object"}}},
            {"slow", "Sleeps", {{"type", "object"}}},
        });
        math->SetExecuteHandler([](const std::string& op, const json& args)
                                    -> Result<json, Error> {
            if (op == "double") {
                return Result<json, Error>::Ok({{"value", args["n"].get<int>() * 2}});
            }
            if (op == "broken") {
                return Result<json, Error>::Err(Error{
                    "Math", "overflow", ErrorCode::ExecutionFailed, "too big", {}});
            }
            std::this_thread::sleep_for(400ms);
            return Result<json, Error>::Ok(json::object());
        });
        REQUIRE(registry.Register(math).IsOk());

        DispatcherOptions dispatcher_options;
        dispatcher_options.execute_timeout = timeout;
        dispatcher = std::make_unique<ProtocolDispatcher>(registry, dispatcher_options);
        gateway = std::make_unique<HttpGateway>(*dispatcher, std::move(options));
    }

    ToolRegistry registry;
    std::shared_ptr<MockProvider> math;
    std::unique_ptr<ProtocolDispatcher> dispatcher;
    std::unique_ptr<HttpGateway> gateway;
};

} // anonymous namespace

// ===========================================================================
// Handlers
// ===========================================================================

TEST_CASE("HttpGateway: health", "[transport][gateway]") {
    GatewayFixture f;
    auto reply = f.gateway->Health();
    CHECK(reply.status == 200);
    CHECK(reply.body["status"] == "healthy");
    CHECK(reply.body["version"] == kVersion);
}

TEST_CASE("HttpGateway: capabilities under either key", "[transport][gateway]") {
    GatewayFixture f;
    auto caps = f.gateway->Capabilities();
    CHECK(caps.status == 200);
    REQUIRE(caps.body["capabilities"].size() == 3);
    CHECK(caps.body["capabilities"][0]["name"] == "math.double");
    CHECK(caps.body["capabilities"][0]["input_schema"]["required"] == json{"n"});

    auto tools = f.gateway->Capabilities("tools");
    CHECK(tools.body.contains("tools"));
    CHECK_FALSE(tools.body.contains("capabilities"));
}

TEST_CASE("HttpGateway: successful invoke", "[transport][gateway]") {
    GatewayFixture f;
    auto reply = f.gateway->Invoke(R"({"tool_name":"math.double","arguments":{"n":21}})");
    CHECK(reply.status == 200);
    CHECK(reply.body["success"] == true);
    CHECK(reply.body["result"] == json{{"value", 42}});
    CHECK(reply.body["error"].is_null());
    REQUIRE(reply.body["content"].size() == 1);
    CHECK(reply.body["content"][0]["type"] == "text");
    CHECK(json::parse(reply.body["content"][0]["text"].get<std::string>()) ==
          json{{"value", 42}});
}

TEST_CASE("HttpGateway: invoke failures map to HTTP statuses", "[transport][gateway]") {
    GatewayFixture f(GatewayOptions{}, 100ms);

    SECTION("unparseable body") {
        auto reply = f.gateway->Invoke("{nope");
        CHECK(reply.status == 400);
        CHECK(reply.body["success"] == false);
        CHECK(reply.body["error_code"] == WireCode(ErrorCode::InternalTransportError));
    }
    SECTION("missing tool_name") {
        auto reply = f.gateway->Invoke(R"({"arguments":{}})");
        CHECK(reply.status == 400);
        CHECK(reply.body["error_code"] == WireCode(ErrorCode::MalformedRequest));
    }
    SECTION("body not an object") {
        auto reply = f.gateway->Invoke("[1,2]");
        CHECK(reply.status == 400);
        CHECK(reply.body["error_code"] == WireCode(ErrorCode::MalformedRequest));
    }
    SECTION("arguments not an object") {
        auto reply = f.gateway->Invoke(R"({"tool_name":"math.double","arguments":[1]})");
        CHECK(reply.status == 400);
        CHECK(reply.body["error_code"] == WireCode(ErrorCode::InvalidArguments));
    }
    SECTION("unknown capability") {
        auto reply = f.gateway->Invoke(R"({"tool_name":"nope.run"})");
        CHECK(reply.status == 400);
        CHECK(reply.body["error_code"] == WireCode(ErrorCode::CapabilityNotFound));
        CHECK(reply.body["error"] == "capability 'nope.run' not found");
        CHECK(reply.body["result"].is_null());
        CHECK(reply.body["content"] == json::array());
    }
    SECTION("schema violation") {
        auto reply = f.gateway->Invoke(R"({"tool_name":"math.double","arguments":{"n":"x"}})");
        CHECK(reply.status == 400);
        CHECK(reply.body["error_code"] == WireCode(ErrorCode::InvalidArguments));
        CHECK(reply.body["error_detail"] == "$.n: expected integer, got string");
    }
    SECTION("provider failure") {
        auto reply = f.gateway->Invoke(R"({"tool_name":"math.broken"})");
        CHECK(reply.status == 500);
        CHECK(reply.body["error_code"] == WireCode(ErrorCode::ExecutionFailed));
        CHECK(reply.body["error_detail"] == "overflow: too big");
    }
    SECTION("timeout") {
        auto reply = f.gateway->Invoke(R"({"tool_name":"math.slow"})");
        CHECK(reply.status == 504);
        CHECK(reply.body["error_code"] == WireCode(ErrorCode::ExecutionTimeout));
    }
}

TEST_CASE("HttpGateway: null arguments are treated as empty", "[transport][gateway]") {
    GatewayFixture f;
    auto reply = f.gateway->Invoke(R"({"tool_name":"math.broken","arguments":null})");
    CHECK(reply.body["error_code"] == WireCode(ErrorCode::ExecutionFailed));
    CHECK(f.math->ExecuteCount() == 1);
}

// ===========================================================================
// Over HTTP
// ===========================================================================

TEST_CASE("HttpGateway: routes over a live server", "[transport][gateway][http]") {
    GatewayOptions options;
    options.cors_origin = "https://app.example.com";
    GatewayFixture f(options);

    httplib::Server svr;
    f.gateway->Mount(svr);
    LocalServer server(svr);
    httplib::Client client("127.0.0.1", server.Port());

    SECTION("GET /health") {
        auto res = client.Get("/health");
        REQUIRE(res);
        CHECK(res->status == 200);
        CHECK(res->get_header_value("Content-Type") == "application/json");
        CHECK(res->get_header_value("Access-Control-Allow-Origin") ==
              "https://app.example.com");
        CHECK(json::parse(res->body)["status"] == "healthy");
    }
    SECTION("GET /tools") {
        auto res = client.Get("/tools");
        REQUIRE(res);
        CHECK(res->status == 200);
        CHECK(json::parse(res->body)["tools"].size() == 3);
    }
    SECTION("POST /invoke") {
        auto res = client.Post("/invoke", R"({"tool_name":"math.double","arguments":{"n":4}})",
                               "application/json");
        REQUIRE(res);
        CHECK(res->status == 200);
        CHECK(json::parse(res->body)["result"]["value"] == 8);
    }
    SECTION("POST /tools/call with an unknown tool") {
        auto res = client.Post("/tools/call", R"({"tool_name":"missing"})",
                               "application/json");
        REQUIRE(res);
        CHECK(res->status == 400);
        CHECK(json::parse(res->body)["success"] == false);
    }
    SECTION("OPTIONS preflight") {
        auto res = client.Options("/invoke");
        REQUIRE(res);
        CHECK(res->status == 204);
        CHECK(res->get_header_value("Access-Control-Allow-Methods") == "GET, POST, OPTIONS");
    }
    SECTION("unknown route") {
        auto res = client.Get("/nowhere");
        REQUIRE(res);
        CHECK(res->status == 404);
        auto body = json::parse(res->body);
        CHECK(body["success"] == false);
        CHECK(body["error"] == "no route for GET /nowhere");
    }
}

TEST_CASE("HttpGateway: empty CORS origin sends no CORS headers", "[transport][gateway][http]") {
    GatewayOptions options;
    options.cors_origin.clear();
    GatewayFixture f(options);

    httplib::Server svr;
    f.gateway->Mount(svr);
    LocalServer server(svr);
    httplib::Client client("127.0.0.1", server.Port());

    auto res = client.Get("/health");
    REQUIRE(res);
    CHECK_FALSE(res->has_header("Access-Control-Allow-Origin"));
}

TEST_CASE("HttpGateway: Listen reports a port that cannot be bound", "[transport][gateway][http]") {
    httplib::Server blocker;
    LocalServer occupied(blocker);

    GatewayOptions options;
    options.host = "127.0.0.1";
    options.port = static_cast<uint16_t>(occupied.Port());
    GatewayFixture f(options);

    auto r = f.gateway->Listen();
    REQUIRE(r.IsErr());
    CHECK(r.Error().code == ErrorCode::InternalTransportError);
}

TEST_CASE("HttpGateway: Stop ends Listen", "[transport][gateway][http]") {
    // Find a free port, release it, then listen on it.
    int port = 0;
    {
        httplib::Server scratch;
        port = scratch.bind_to_any_port("127.0.0.1");
    }
    GatewayOptions options;
    options.host = "127.0.0.1";
    options.port = static_cast<uint16_t>(port);
    GatewayFixture f(options);

    Result<void, Error> outcome = Result<void, Error>::Err(
        Error{"test", "not run", ErrorCode::InternalTransportError, std::nullopt, {}});
    std::thread listener([&] { outcome = f.gateway->Listen(); });

    httplib::Client client("127.0.0.1", port);
    bool healthy = false;
    for (int i = 0; i < 50 && !healthy; ++i) {
        auto res = client.Get("/health");
        healthy = res && res->status == 200;
        if (!healthy) std::this_thread::sleep_for(20ms);
    }
    f.gateway->Stop();
    listener.join();

    CHECK(healthy);
    CHECK(outcome.IsOk());
}

TEST_CASE("HttpGateway: system_info memory query end to end", "[transport][gateway][http]") {
    ToolRegistry registry;
    SystemInfoOptions info_options;
    info_options.cpu_sample = 1ms;
    REQUIRE(registry.Register(std::make_shared<SystemInfoProvider>(info_options)).IsOk());
    ProtocolDispatcher dispatcher(registry);
    HttpGateway gateway(dispatcher);

    httplib::Server svr;
    gateway.Mount(svr);
    LocalServer server(svr);
    httplib::Client client("127.0.0.1", server.Port());

    auto ok = client.Post("/invoke",
                          R"({"tool_name":"system_info","arguments":{"info_type":"memory"}})",
                          "application/json");
    REQUIRE(ok);
    CHECK(ok->status == 200);
    auto body = json::parse(ok->body);
    CHECK(body["success"] == true);
    CHECK(body["result"]["total_memory_kb"].get<uint64_t>() > 0);

    auto missing = client.Post("/invoke", R"({"tool_name":"does_not_exist","arguments":{}})",
                               "application/json");
    REQUIRE(missing);
    CHECK(missing->status == 400);
    auto missing_body = json::parse(missing->body);
    CHECK(missing_body["success"] == false);
    CHECK(missing_body["error"] == "capability 'does_not_exist' not found");
}
