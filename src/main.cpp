#include <ens_mcp/cli/smoke_test.hpp>
#include <ens_mcp/config/config_loader.hpp>
#include <ens_mcp/core/log.hpp>
#include <ens_mcp/core/terminal.hpp>
#include <ens_mcp/core/url.hpp>
#include <ens_mcp/core/version.hpp>
#include <ens_mcp/ens/ens_resolver.hpp>
#include <ens_mcp/ens/rpc_session.hpp>
#include <ens_mcp/mcp/ens_tool_handlers.hpp>
#include <ens_mcp/mcp/mcp_server.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess = 0;

std::atomic<bool> g_stop_requested{false};

void HandleStopSignal(int /*signum*/) {
    g_stop_requested.store(true);
}

// SIGINT/SIGTERM raise the stop flag. No SA_RESTART, so a read blocked
// on stdin returns and the server loop gets to see the flag.
void InstallSignalHandlers() {
#ifdef _WIN32
    std::signal(SIGINT, HandleStopSignal);
    std::signal(SIGTERM, HandleStopSignal);
#else
    struct sigaction action {};
    action.sa_handler = HandleStopSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
#endif
}

// Print a startup error and map it to the process exit code.
int ReportError(const ens_mcp::Error& error) {
    std::cerr << "ens-mcp: " << error.CategoryName() << " error: " << error.message
              << "\n";
    if (error.category == ens_mcp::ErrorCategory::Config) {
        std::cerr << "Run 'ens-mcp --help' for usage.\n";
    }
    return error.ExitCode();
}

ens_mcp::Result<ens_mcp::AppConfig, ens_mcp::Error> LoadConfig(
    int argc, const char* const* argv) {
    using namespace ens_mcp;

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        return Result<AppConfig, Error>::Err(cli.Error());
    }
    if (cli.Value().show_version || !cli.Value().config_file) {
        return Result<AppConfig, Error>::Ok(MergeConfigs(AppConfig{}, cli.Value()));
    }
    auto yaml = LoadFromYaml(*cli.Value().config_file);
    if (yaml.IsErr()) {
        return yaml;
    }
    return Result<AppConfig, Error>::Ok(MergeConfigs(yaml.Value(), cli.Value()));
}

ens_mcp::Result<void, ens_mcp::Error> InitLogging(const ens_mcp::AppConfig& config) {
    using namespace ens_mcp;

    if (config.log_file) {
        auto sink = std::make_unique<FileSink>(*config.log_file);
        if (!sink->IsOpen()) {
            return Result<void, Error>::Err(
                Error{"InitLogging", "", "cannot open log file " + *config.log_file,
                      ErrorCategory::Config, std::nullopt});
        }
        InitGlobalLogger(std::move(sink), config.log_level);
    } else if (config.log_json) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), config.log_level);
    } else {
        bool use_color = config.color.value_or(!NoColorEnvSet() && IsStderrTty());
        InitGlobalLogger(std::make_unique<ConsoleSink>(use_color), config.log_level);
    }
    return Result<void, Error>::Ok();
}

int Run(int argc, const char* argv[]) {
    using namespace ens_mcp;

    auto loaded = LoadConfig(argc, argv);
    if (loaded.IsErr()) {
        return ReportError(loaded.Error());
    }
    const auto config = std::move(loaded).Value();
    if (config.show_version) {
        std::cout << "ens-mcp " << kVersion << "\n";
        return kExitSuccess;
    }
    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return ReportError(valid.Error());
    }
    auto logging = InitLogging(config);
    if (logging.IsErr()) {
        return ReportError(logging.Error());
    }

    InstallSignalHandlers();

    // ValidateConfig has already accepted the URL.
    auto endpoint = ParseHttpUrl(config.rpc_url).Value();
    const auto redacted = RedactUrl(config.rpc_url);
    LogInfo("main", "ens-mcp " + std::string(kVersion) + " using node " + redacted);

    RpcSessionOptions session_options;
    session_options.read_timeout = std::chrono::seconds(config.timeout_seconds);
    HttpRpcSession session(endpoint, session_options);

    EnsResolverOptions resolver_options;
    if (config.registry_address) {
        resolver_options.registry_address = *config.registry_address;
    }
    EnsResolver resolver(session, resolver_options);

    if (!resolver.IsConnected()) {
        LogError("main", "Could not connect to Ethereum node at " + redacted);
        return ReportError(Error{"IsConnected", redacted,
                                 "could not connect to Ethereum node at " + redacted,
                                 ErrorCategory::Connection, std::nullopt});
    }

    if (config.transport == Transport::Test) {
        bool use_color = config.color.value_or(!NoColorEnvSet() && IsStdoutTty());
        if (!RunSmokeTest(resolver, std::cout, use_color)) {
            LogWarn("main", "Smoke test finished with failed operations");
        }
        return kExitSuccess;
    }

    ToolRegistry registry;
    RegisterEnsTools(registry, resolver);

    McpServer server(std::move(registry));
    server.SetStopFlag(&g_stop_requested);
    server.Run();

    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    try {
        return Run(argc, argv);
    } catch (const std::exception& e) {
        ens_mcp::LogError("main", std::string("Fatal: ") + e.what());
        return ReportError(ens_mcp::Error{"main", "", e.what(),
                                          ens_mcp::ErrorCategory::Internal,
                                          std::nullopt});
    } catch (...) {
        ens_mcp::LogError("main", "Fatal: unknown exception");
        return ReportError(ens_mcp::Error{"main", "", "unknown exception",
                                          ens_mcp::ErrorCategory::Internal,
                                          std::nullopt});
    }
}
