#include <toolbridge/config/config_loader.hpp>
#include <toolbridge/core/log.hpp>
#include <toolbridge/core/terminal.hpp>
#include <toolbridge/core/version.hpp>
#include <toolbridge/protocol/context_store.hpp>
#include <toolbridge/protocol/dispatcher.hpp>
#include <toolbridge/providers/home_assistant_provider.hpp>
#include <toolbridge/providers/http_request_provider.hpp>
#include <toolbridge/providers/http_transport.hpp>
#include <toolbridge/providers/system_info_provider.hpp>
#include <toolbridge/registry/tool_registry.hpp>
#include <toolbridge/transport/http_gateway.hpp>
#include <toolbridge/transport/stdio_transport.hpp>

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <pthread.h>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitConfig  = 1;
constexpr int kExitBind    = 2;

void PrintError(const toolbridge::Error& error) {
    std::cerr << "Error: " << error.ToString() << "\n";
}

// Load YAML (when -c is given), apply CLI flags, then the environment.
toolbridge::Result<toolbridge::AppConfig, toolbridge::Error> BuildConfig(
    const toolbridge::CliOverrides& cli) {
    using namespace toolbridge;
    AppConfig base;
    if (cli.config_path) {
        auto yaml = LoadFromYaml(*cli.config_path);
        if (yaml.IsErr()) {
            return Result<AppConfig, Error>::Err(yaml.Error());
        }
        base = std::move(yaml).Value();
    }
    auto resolved = ResolveEnvironment(MergeConfigs(base, cli));
    if (resolved.IsErr()) {
        return resolved;
    }
    auto valid = ValidateConfig(resolved.Value());
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(valid.Error());
    }
    return resolved;
}

bool InitLogging(const toolbridge::LoggingConfig& logging) {
    using namespace toolbridge;
    const auto level = ParseLogLevel(logging.level).value_or(LogLevel::Info);

    if (logging.file) {
        auto sink = std::make_unique<FileSink>(*logging.file);
        if (!sink->IsOpen()) {
            std::cerr << "Error: cannot open log file '" << *logging.file << "'\n";
            return false;
        }
        InitGlobalLogger(std::move(sink), level);
    } else if (logging.json) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), level);
    } else {
        InitGlobalLogger(std::make_unique<ColorConsoleSink>(ShouldUseColor(false, false)),
                         level);
    }
    return true;
}

// A provider that fails to come up is logged and left out; the server
// still starts with the rest.
void RegisterProviders(toolbridge::ToolRegistry& registry,
                       const toolbridge::ProvidersConfig& providers) {
    using namespace toolbridge;
    auto transport = std::make_shared<HttplibTransport>();

    if (providers.system_info.enabled) {
        SystemInfoOptions options;
        options.cpu_sample = std::chrono::milliseconds(providers.system_info.cpu_sample_ms);
        auto result = registry.Register(std::make_shared<SystemInfoProvider>(options));
        if (result.IsErr()) {
            LogError("main", "system_info unavailable: " + result.Error().ToString());
        }
    }

    if (providers.http_request.enabled) {
        HttpRequestOptions options;
        options.default_timeout = std::chrono::seconds(providers.http_request.timeout_seconds);
        auto result = registry.Register(
            std::make_shared<HttpRequestProvider>(transport, options));
        if (result.IsErr()) {
            LogError("main", "http_request unavailable: " + result.Error().ToString());
        }
    }

    if (providers.home_assistant.enabled) {
        HomeAssistantOptions options;
        options.url = providers.home_assistant.url.value_or(kDefaultHomeAssistantUrl);
        options.token = providers.home_assistant.token;
        auto result = registry.Register(
            std::make_shared<HomeAssistantProvider>(options, transport));
        if (result.IsErr()) {
            LogError("main", "home_assistant unavailable: " + result.Error().ToString());
        }
    }
}

int RunStdio(toolbridge::ProtocolDispatcher& dispatcher, bool pipelined) {
    using namespace toolbridge;
    LogInfo("main", "serving envelopes on stdio");
    StdioTransport transport(dispatcher, std::cin, std::cout, StdioOptions{pipelined});
    const auto count = transport.Run();
    LogInfo("main", "stdin closed after " + std::to_string(count) + " responses");
    return kExitSuccess;
}

// SIGINT/SIGTERM are taken by a dedicated thread via sigwait. Must run
// before any other thread starts so every thread inherits the mask.
sigset_t BlockShutdownSignals() {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    return signals;
}

int RunHttp(toolbridge::ProtocolDispatcher& dispatcher,
            const toolbridge::ServerConfig& server,
            const sigset_t& signals) {
    using namespace toolbridge;

    GatewayOptions options;
    options.host = server.host;
    options.port = server.port;
    options.cors_origin = server.cors_origin;
    HttpGateway gateway(dispatcher, options);

    std::atomic<bool> listen_returned{false};
    std::thread signal_thread([&]() {
        int received = 0;
        sigwait(&signals, &received);
        if (!listen_returned.load()) {
            LogInfo("main", std::string("received ") +
                                (received == SIGINT ? "SIGINT" : "SIGTERM") +
                                ", stopping");
            gateway.Stop();
        }
    });

    LogInfo("main", "listening on " + server.host + ":" + std::to_string(server.port));
    auto result = gateway.Listen();

    listen_returned.store(true);
    pthread_kill(signal_thread.native_handle(), SIGTERM);
    signal_thread.join();

    if (result.IsErr()) {
        PrintError(result.Error());
        return kExitBind;
    }
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace toolbridge;

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        PrintError(cli.Error());
        return kExitConfig;
    }
    if (cli.Value().show_version) {
        std::cout << "toolbridge " << kVersion << "\n";
        return kExitSuccess;
    }

    auto config_result = BuildConfig(cli.Value());
    if (config_result.IsErr()) {
        PrintError(config_result.Error());
        return kExitConfig;
    }
    const auto config = std::move(config_result).Value();

    if (!InitLogging(config.logging)) {
        return kExitConfig;
    }
    LogInfo("main", std::string("toolbridge ") + kVersion + " starting in " +
                        ServerModeName(config.server.mode) + " mode");

    sigset_t shutdown_signals;
    sigemptyset(&shutdown_signals);
    if (config.server.mode == ServerMode::Http) {
        shutdown_signals = BlockShutdownSignals();
    }

    std::shared_ptr<AsyncContextRecorder> recorder;
    if (config.context_store_path) {
        auto store = std::make_shared<JsonlContextStore>(*config.context_store_path);
        if (!store->IsOpen()) {
            LogWarn("main", "cannot open context store '" + *config.context_store_path +
                                "'; interactions will not be recorded");
        } else {
            recorder = std::make_shared<AsyncContextRecorder>(store);
            LogInfo("main", "recording interactions to " + store->Path());
        }
    }

    RegistryOptions registry_options;
    registry_options.init_timeout = std::chrono::milliseconds(config.timeouts.init_ms);
    ToolRegistry registry(registry_options);
    RegisterProviders(registry, config.providers);

    const auto names = registry.ProviderNames();
    if (names.empty()) {
        LogWarn("main", "no capability providers are available");
    }
    for (const auto& name : names) {
        LogDebug("main", "provider ready: " + name);
    }

    DispatcherOptions dispatcher_options;
    dispatcher_options.execute_timeout = std::chrono::milliseconds(config.timeouts.execute_ms);
    ProtocolDispatcher dispatcher(registry, dispatcher_options, recorder);

    const int exit_code = config.server.mode == ServerMode::Stdio
        ? RunStdio(dispatcher, config.server.pipelined_stdio)
        : RunHttp(dispatcher, config.server, shutdown_signals);

    auto shutdown = registry.ShutdownAll();
    if (shutdown.IsErr()) {
        LogWarn("main", shutdown.Error().ToString());
    }
    if (recorder) {
        recorder->Flush();
    }
    LogInfo("main", "stopped");
    return exit_code;
}
