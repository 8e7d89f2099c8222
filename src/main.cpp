#include <op_mcp/backend/client_cache.hpp>
#include <op_mcp/config/config_loader.hpp>
#include <op_mcp/core/log.hpp>
#include <op_mcp/core/terminal.hpp>
#include <op_mcp/core/version.hpp>
#include <op_mcp/mcp/auth.hpp>
#include <op_mcp/mcp/protocol_engine.hpp>
#include <op_mcp/mcp/resource_catalog.hpp>
#include <op_mcp/mcp/tool_handlers.hpp>
#include <op_mcp/mcp/tool_registry.hpp>
#include <op_mcp/transport/health.hpp>
#include <op_mcp/transport/http_transport.hpp>
#include <op_mcp/transport/sse_transport.hpp>
#include <op_mcp/transport/stdio_transport.hpp>

#include <nlohmann/json.hpp>

#include <pthread.h>
#include <signal.h>

#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitRuntime = 1;
constexpr int kExitConfig  = 2;

void PrintError(const op_mcp::Error& error, bool json_output) {
    if (json_output) {
        std::cerr << nlohmann::json{{"error", error.ToJson()}}.dump() << "\n";
    } else {
        std::cerr << "Error: " << error.ToString() << "\n";
    }
}

op_mcp::LogLevel ResolveLogLevel(const op_mcp::AppConfig& config) {
    using op_mcp::LogLevel;
    if (config.log_level.has_value()) {
        if (auto parsed = op_mcp::ParseLogLevel(*config.log_level)) {
            return *parsed;
        }
    }
    if (config.quiet) return LogLevel::Error;
    if (config.verbosity >= 2) return LogLevel::Debug;
    if (config.verbosity == 1) return LogLevel::Info;
    return LogLevel::Warn;
}

void InitLogging(const op_mcp::AppConfig& config) {
    using namespace op_mcp;
    std::unique_ptr<ILogSink> sink;
    if (config.json_logs) {
        sink = std::make_unique<JsonSink>();
    } else {
        sink = std::make_unique<ConsoleSink>(UseColorLogs());
    }

    std::string file_warning;
    if (config.log_file.has_value()) {
        auto file = std::make_unique<FileSink>(*config.log_file);
        if (file->IsOpen()) {
            sink = std::make_unique<TeeSink>(std::move(sink), std::move(file));
        } else {
            file_warning = "cannot open log file " + *config.log_file;
        }
    }
    InitGlobalLogger(std::move(sink), ResolveLogLevel(config));
    GlobalLogger().AddSecret(config.backend.api_key);
    GlobalLogger().AddSecret(config.server.bearer_token);
    if (!file_warning.empty()) {
        LogWarn("main", file_warning);
    }
}

// Defaults <- YAML <- environment <- CLI, then secrets and validation.
op_mcp::Result<op_mcp::AppConfig, op_mcp::Error> LoadConfig(
    const op_mcp::ConfigOverlay& cli, const op_mcp::EnvLookup& env) {
    using namespace op_mcp;
    using R = Result<AppConfig, Error>;

    AppConfig config;
    if (cli.config_path.has_value()) {
        auto yaml = LoadFromYaml(*cli.config_path);
        if (yaml.IsErr()) {
            return R::Err(yaml.Error());
        }
        config = std::move(yaml).Value();
    }

    auto env_overlay = LoadFromEnv(env);
    if (env_overlay.IsErr()) {
        return R::Err(env_overlay.Error());
    }
    config = MergeConfigs(config, env_overlay.Value());
    config = MergeConfigs(config, cli);

    auto resolved = ResolveSecrets(std::move(config), env);
    if (resolved.IsErr()) {
        return resolved;
    }
    auto valid = ValidateConfig(resolved.Value());
    if (valid.IsErr()) {
        return R::Err(valid.Error());
    }
    return resolved;
}

// Runs an HTTP or SSE transport until SIGINT/SIGTERM. The signals are
// blocked in every thread and collected by a dedicated sigwait thread.
template <typename Transport>
int ServeUntilSignal(Transport& transport) {
    using namespace op_mcp;

    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    auto bound = transport.Bind();
    if (bound.IsErr()) {
        LogError("main", bound.Error().ToString());
        return kExitRuntime;
    }

    std::atomic<bool> served{false};
    std::thread waiter([&] {
        int received = 0;
        sigwait(&signals, &received);
        if (!served.load()) {
            LogInfo("main", std::string("received ") + (received == SIGINT ? "SIGINT" : "SIGTERM"));
            // Stop() shuts the engine down first, cancelling in-flight calls.
            transport.Stop();
        }
    });

    auto result = transport.Serve();
    served = true;
    pthread_kill(waiter.native_handle(), SIGTERM);
    waiter.join();

    if (result.IsErr()) {
        LogError("main", result.Error().ToString());
        return kExitRuntime;
    }
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace op_mcp;

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        PrintError(cli.Error(), false);
        return kExitConfig;
    }
    if (cli.Value().show_version) {
        std::cout << kServerName << " " << kVersion << "\n";
        return kExitSuccess;
    }

    const auto env = ProcessEnv();
    auto loaded = LoadConfig(cli.Value(), env);
    if (loaded.IsErr()) {
        PrintError(loaded.Error(), cli.Value().json_logs.value_or(false));
        return kExitConfig;
    }
    const auto config = std::move(loaded).Value();
    InitLogging(config);
    LogInfo("main", std::string(kServerName) + " " + kVersion + " (" +
                        TransportKindName(config.server.transport) + ") -> " +
                        config.backend.base_url + " key " +
                        RedactSecret(config.backend.api_key));

    BackendClientCache cache;
    auto client = cache.Acquire(config.backend);
    if (client.IsErr()) {
        PrintError(client.Error(), config.json_logs);
        return kExitConfig;
    }

    ToolRegistryBuilder builder;
    builder.DefaultTimeout(std::chrono::seconds(config.tool_timeout_seconds));
    RegisterProjectTools(builder, client.Value());
    auto registry = std::make_shared<const ToolRegistry>(builder.Build());
    auto resources = std::make_shared<const ResourceCatalog>(client.Value());

    std::shared_ptr<const Authenticator> auth;
    if (config.server.transport == TransportKind::Stdio) {
        auth = std::make_shared<AllowAllAuthenticator>();
    } else {
        auth = std::make_shared<BearerTokenAuthenticator>(config.server.bearer_token);
        if (config.server.bearer_token.empty()) {
            LogWarn("main", "no bearer token configured; " +
                                TransportKindName(config.server.transport) +
                                " callers are not authenticated");
        }
    }

    EngineOptions engine_options;
    engine_options.strict_initialization = config.server.strict_initialization;
    engine_options.resource_timeout = std::chrono::seconds(config.tool_timeout_seconds);
    ProtocolEngine engine(registry, resources, auth, engine_options);

    int exit_code = kExitSuccess;
    switch (config.server.transport) {
        case TransportKind::Stdio: {
            StdioTransport transport(engine);
            transport.Run();
            break;
        }
        case TransportKind::Http: {
            HealthReporter health(engine, client.Value());
            HttpTransport transport(engine, health,
                                    HttpTransportOptions{config.server.host,
                                                         config.server.port});
            exit_code = ServeUntilSignal(transport);
            break;
        }
        case TransportKind::Sse: {
            HealthReporter health(engine, client.Value());
            SseTransportOptions options;
            options.host = config.server.host;
            options.port = config.server.port;
            options.heartbeat_interval = std::chrono::seconds(config.server.heartbeat_seconds);
            SseTransport transport(engine, health, options);
            exit_code = ServeUntilSignal(transport);
            break;
        }
    }

    engine.Shutdown();
    cache.CloseAll();
    LogInfo("main", "bye");
    return exit_code;
}
