#include <catch2/catch_test_macros.hpp>

#include <toolbridge/registry/tool_registry.hpp>

#include "mocks/mock_provider.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace toolbridge;
using namespace toolbridge::testing;
using namespace std::chrono_literals;

namespace {

RegistryOptions FastOptions() {
    RegistryOptions options;
    options.init_timeout = 200ms;
    options.shutdown_timeout = 200ms;
    return options;
}

} // anonymous namespace

// ===========================================================================
// Register / Lookup
// ===========================================================================

TEST_CASE("ToolRegistry: register then lookup", "[registry]") {
    ToolRegistry registry(FastOptions());
    auto provider = std::make_shared<MockProvider>("echo", std::vector<std::string>{"say", "shout"});

    REQUIRE(registry.Register(provider).IsOk());
    CHECK(provider->InitCount() == 1);
    CHECK(registry.StateOf("echo") == ProviderState::Ready);

    auto handle = registry.Lookup("echo");
    REQUIRE(handle.IsOk());
    CHECK(handle.Value()->Name() == "echo");
    CHECK(handle.Value()->Operations().size() == 2);
    CHECK(handle.Value()->FindOperation("say") != nullptr);
    CHECK(handle.Value()->FindOperation("whisper") == nullptr);
    CHECK_FALSE(handle.Value()->DefaultOperation().has_value());
}

TEST_CASE("ToolRegistry: lookup of unknown provider", "[registry]") {
    ToolRegistry registry(FastOptions());
    auto result = registry.Lookup("nope");
    REQUIRE(result.IsErr());
    CHECK(result.Error().code == ErrorCode::CapabilityNotFound);
    CHECK(result.Error().message.find("nope") != std::string::npos);
}

TEST_CASE("ToolRegistry: single-operation provider has a default", "[registry]") {
    ToolRegistry registry(FastOptions());
    REQUIRE(registry.Register(std::make_shared<MockProvider>("solo")).IsOk());
    auto handle = registry.Lookup("solo");
    REQUIRE(handle.IsOk());
    CHECK(handle.Value()->DefaultOperation() == std::optional<std::string>("run"));
}

TEST_CASE("ToolRegistry: list is qualified and in registration order", "[registry]") {
    ToolRegistry registry(FastOptions());
    REQUIRE(registry.Register(std::make_shared<MockProvider>(
        "beta", std::vector<std::string>{"one", "two"})).IsOk());
    REQUIRE(registry.Register(std::make_shared<MockProvider>("alpha")).IsOk());

    auto caps = registry.ListCapabilities();
    REQUIRE(caps.size() == 3);
    CHECK(caps[0].name == "beta.one");
    CHECK(caps[1].name == "beta.two");
    CHECK(caps[2].name == "alpha.run");
    CHECK(caps[0].input_schema.is_object());

    CHECK(registry.ProviderNames() == std::vector<std::string>{"beta", "alpha"});
}

// ===========================================================================
// Registration validation
// ===========================================================================

TEST_CASE("ToolRegistry: rejects null provider", "[registry]") {
    ToolRegistry registry(FastOptions());
    auto result = registry.Register(nullptr);
    REQUIRE(result.IsErr());
    CHECK(result.Error().code == ErrorCode::RegistryFault);
}

TEST_CASE("ToolRegistry: rejects invalid and reserved names", "[registry]") {
    ToolRegistry registry(FastOptions());
    auto bad = std::make_shared<MockProvider>("Bad-Name");
    auto reserved = std::make_shared<MockProvider>("rpc");

    CHECK(registry.Register(bad).IsErr());
    CHECK(registry.Register(reserved).IsErr());
    CHECK(bad->InitCount() == 0);
    CHECK(reserved->InitCount() == 0);
    CHECK(registry.ProviderNames().empty());
}

TEST_CASE("ToolRegistry: rejects bad operation lists", "[registry]") {
    ToolRegistry registry(FastOptions());

    SECTION("no operations") {
        auto p = std::make_shared<MockProvider>("empty", std::vector<std::string>{});
        auto r = registry.Register(p);
        REQUIRE(r.IsErr());
        CHECK(r.Error().message.find("no operations") != std::string::npos);
    }
    SECTION("duplicate operation") {
        auto p = std::make_shared<MockProvider>("dup", std::vector<std::string>{"a", "a"});
        auto r = registry.Register(p);
        REQUIRE(r.IsErr());
        CHECK(r.Error().message.find("twice") != std::string::npos);
    }
    SECTION("invalid operation name") {
        auto p = std::make_shared<MockProvider>("odd", std::vector<std::string>{"has.dot"});
        CHECK(registry.Register(p).IsErr());
    }
    SECTION("non-object schema") {
        auto p = std::make_shared<MockProvider>("schema");
        p->SetCapabilities({{"run", "bad schema", nlohmann::json::array()}});
        auto r = registry.Register(p);
        REQUIRE(r.IsErr());
        CHECK(r.Error().message.find("schema") != std::string::npos);
    }
    CHECK(registry.ProviderNames().empty());
}

// ===========================================================================
// Init failures
// ===========================================================================

TEST_CASE("ToolRegistry: init error leaves the provider out", "[registry]") {
    ToolRegistry registry(FastOptions());
    auto p = std::make_shared<MockProvider>("flaky");
    p->SetInitError(MakeTestError("disk missing"));

    auto result = registry.Register(p);
    REQUIRE(result.IsErr());
    CHECK(result.Error().code == ErrorCode::RegistryFault);
    REQUIRE(result.Error().causes.size() == 1);
    CHECK(result.Error().causes[0].message == "disk missing");
    CHECK(registry.Lookup("flaky").IsErr());
    CHECK(p->ShutdownCount() == 0);
}

TEST_CASE("ToolRegistry: init throw is a registry fault", "[registry]") {
    ToolRegistry registry(FastOptions());
    auto p = std::make_shared<MockProvider>("thrower");
    p->SetInitThrows(true);

    auto result = registry.Register(p);
    REQUIRE(result.IsErr());
    CHECK(result.Error().code == ErrorCode::RegistryFault);
    REQUIRE(result.Error().detail.has_value());
    CHECK(*result.Error().detail == "init exploded");
}

TEST_CASE("ToolRegistry: init timeout is bounded", "[registry]") {
    ToolRegistry registry(FastOptions());
    auto p = std::make_shared<MockProvider>("slow");
    p->SetInitDelay(1000ms);

    const auto start = std::chrono::steady_clock::now();
    auto result = registry.Register(p);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("timed out") != std::string::npos);
    CHECK(elapsed < 900ms);
    CHECK(registry.Lookup("slow").IsErr());
}

TEST_CASE("ToolRegistry: init that finishes after its deadline is shut down", "[registry]") {
    ToolRegistry registry(FastOptions());
    auto p = std::make_shared<MockProvider>("late");
    p->SetInitDelay(400ms);

    REQUIRE(registry.Register(p).IsErr());
    CHECK(p->ShutdownCount() == 0);

    for (int i = 0; i < 100 && p->ShutdownCount() == 0; ++i) {
        std::this_thread::sleep_for(20ms);
    }
    CHECK(p->InitCount() == 1);
    CHECK(p->ShutdownCount() == 1);
    CHECK(registry.Lookup("late").IsErr());
}

TEST_CASE("ToolRegistry: late init failure needs no shutdown", "[registry]") {
    ToolRegistry registry(FastOptions());
    auto p = std::make_shared<MockProvider>("late");
    p->SetInitDelay(400ms);
    p->SetInitError(Error{"Init", "no backend", ErrorCode::ExecutionFailed,
                          std::nullopt, {}});

    REQUIRE(registry.Register(p).IsErr());
    std::this_thread::sleep_for(600ms);
    CHECK(p->InitCount() == 1);
    CHECK(p->ShutdownCount() == 0);
}

// ===========================================================================
// Replacement
// ===========================================================================

TEST_CASE("ToolRegistry: re-register replaces and shuts down the old provider", "[registry]") {
    ToolRegistry registry(FastOptions());
    auto first = std::make_shared<MockProvider>("svc", std::vector<std::string>{"v1"});
    auto second = std::make_shared<MockProvider>("svc", std::vector<std::string>{"v2"});

    REQUIRE(registry.Register(first).IsOk());
    auto old_handle = registry.Lookup("svc").Value();
    REQUIRE(registry.Register(second).IsOk());

    CHECK(first->ShutdownCount() == 1);
    CHECK(second->ShutdownCount() == 0);
    CHECK(old_handle->State() == ProviderState::Closed);

    auto caps = registry.ListCapabilities();
    REQUIRE(caps.size() == 1);
    CHECK(caps[0].name == "svc.v2");
    CHECK(registry.ProviderNames() == std::vector<std::string>{"svc"});
}

TEST_CASE("ToolRegistry: failed replacement keeps the old provider", "[registry]") {
    ToolRegistry registry(FastOptions());
    auto good = std::make_shared<MockProvider>("svc");
    auto bad = std::make_shared<MockProvider>("svc");
    bad->SetInitError(MakeTestError("nope"));

    REQUIRE(registry.Register(good).IsOk());
    CHECK(registry.Register(bad).IsErr());

    CHECK(good->ShutdownCount() == 0);
    auto handle = registry.Lookup("svc");
    REQUIRE(handle.IsOk());
    CHECK(handle.Value()->Provider() == good);
}

TEST_CASE("ToolRegistry: concurrent registrations of one name", "[registry]") {
    ToolRegistry registry(FastOptions());
    constexpr int kThreads = 8;
    std::vector<std::shared_ptr<MockProvider>> providers;
    for (int i = 0; i < kThreads; ++i) {
        providers.push_back(std::make_shared<MockProvider>("shared"));
    }

    std::vector<std::thread> threads;
    std::atomic<int> ok{0};
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i]() {
            if (registry.Register(providers[static_cast<size_t>(i)]).IsOk()) ++ok;
        });
    }
    for (auto& t : threads) t.join();

    CHECK(ok.load() == kThreads);
    // Every provider but the winner was shut down exactly once.
    int shut_down = 0;
    for (const auto& p : providers) {
        CHECK(p->InitCount() == 1);
        shut_down += p->ShutdownCount();
    }
    CHECK(shut_down == kThreads - 1);
    CHECK(registry.ProviderNames().size() == 1);
}

TEST_CASE("ToolRegistry: lookups run alongside re-registration", "[registry]") {
    ToolRegistry registry(FastOptions());
    REQUIRE(registry.Register(std::make_shared<MockProvider>("svc")).IsOk());

    std::atomic<bool> done{false};
    std::atomic<int> hits{0};
    std::thread reader([&]() {
        while (!done.load()) {
            auto r = registry.Lookup("svc");
            if (r.IsOk()) {
                ++hits;
            } else {
                CHECK(r.Error().code == ErrorCode::CapabilityNotFound);
            }
        }
    });
    for (int i = 0; i < 20; ++i) {
        REQUIRE(registry.Register(std::make_shared<MockProvider>("svc")).IsOk());
    }
    done.store(true);
    reader.join();

    CHECK(hits.load() > 0);
    CHECK(registry.StateOf("svc") == ProviderState::Ready);
}

// ===========================================================================
// Unregister / Shutdown
// ===========================================================================

TEST_CASE("ToolRegistry: unregister removes and shuts down", "[registry]") {
    ToolRegistry registry(FastOptions());
    auto p = std::make_shared<MockProvider>("temp");
    REQUIRE(registry.Register(p).IsOk());

    REQUIRE(registry.Unregister("temp").IsOk());
    CHECK(p->ShutdownCount() == 1);
    CHECK(registry.Lookup("temp").IsErr());
    CHECK_FALSE(registry.StateOf("temp").has_value());
    CHECK(registry.ListCapabilities().empty());

    auto again = registry.Unregister("temp");
    REQUIRE(again.IsErr());
    CHECK(again.Error().code == ErrorCode::RegistryFault);
}

TEST_CASE("ToolRegistry: unregister reports shutdown failure but still removes", "[registry]") {
    ToolRegistry registry(FastOptions());
    auto p = std::make_shared<MockProvider>("temp");
    p->SetShutdownError(MakeTestError("busy"));
    REQUIRE(registry.Register(p).IsOk());

    CHECK(registry.Unregister("temp").IsErr());
    CHECK(registry.Lookup("temp").IsErr());
}

TEST_CASE("ToolRegistry: ShutdownAll aggregates failures", "[registry]") {
    ToolRegistry registry(FastOptions());
    auto ok = std::make_shared<MockProvider>("ok");
    auto broken = std::make_shared<MockProvider>("broken");
    auto slow = std::make_shared<MockProvider>("slow");
    broken->SetShutdownError(MakeTestError("cannot close"));
    slow->SetShutdownDelay(1000ms);

    REQUIRE(registry.Register(ok).IsOk());
    REQUIRE(registry.Register(broken).IsOk());
    REQUIRE(registry.Register(slow).IsOk());

    auto result = registry.ShutdownAll();
    REQUIRE(result.IsErr());
    CHECK(result.Error().code == ErrorCode::RegistryFault);
    CHECK(result.Error().causes.size() == 2);

    CHECK(ok->ShutdownCount() == 1);
    CHECK(broken->ShutdownCount() == 1);
    CHECK(slow->ShutdownCount() == 1);
    CHECK(registry.ProviderNames().empty());
}

TEST_CASE("ToolRegistry: shutdown runs at most once per provider", "[registry]") {
    auto p = std::make_shared<MockProvider>("once");
    {
        ToolRegistry registry(FastOptions());
        REQUIRE(registry.Register(p).IsOk());
        REQUIRE(registry.ShutdownAll().IsOk());
        REQUIRE(registry.ShutdownAll().IsOk());
    }
    CHECK(p->ShutdownCount() == 1);
}

TEST_CASE("ToolRegistry: destructor shuts down ready providers", "[registry]") {
    auto p = std::make_shared<MockProvider>("scoped");
    {
        ToolRegistry registry(FastOptions());
        REQUIRE(registry.Register(p).IsOk());
    }
    CHECK(p->ShutdownCount() == 1);
}

TEST_CASE("ProviderStateName: names", "[registry]") {
    CHECK(std::string(ProviderStateName(ProviderState::Uninitialized)) == "Uninitialized");
    CHECK(std::string(ProviderStateName(ProviderState::Ready)) == "Ready");
    CHECK(std::string(ProviderStateName(ProviderState::Closed)) == "Closed");
}
