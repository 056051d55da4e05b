#include <ens_mcp/config/config_loader.hpp>

#include <ens_mcp/core/strings.hpp>
#include <ens_mcp/core/url.hpp>
#include <ens_mcp/core/version.hpp>
#include <ens_mcp/ens/address.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <exception>

namespace ens_mcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", message, ErrorCategory::Config, std::nullopt};
}

} // anonymous namespace

std::optional<Transport> ParseTransport(std::string_view name) {
    const auto lower = ToLowerAscii(name);
    if (lower == "stdio") return Transport::Stdio;
    if (lower == "test") return Transport::Test;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config;
    config.config_file = std::string(file_path);
    if (!root || root.IsNull()) {
        return Result<AppConfig, Error>::Ok(std::move(config));
    }
    if (!root.IsMap()) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Config file must be a YAML mapping"));
    }

    try {
        if (root["rpc_url"]) {
            config.rpc_url = root["rpc_url"].as<std::string>();
        }
        if (root["transport"]) {
            auto name = root["transport"].as<std::string>();
            auto transport = ParseTransport(name);
            if (!transport) {
                return Result<AppConfig, Error>::Err(
                    MakeConfigError("Invalid transport: " + name));
            }
            config.transport = *transport;
        }
        if (root["registry"]) {
            config.registry_address = root["registry"].as<std::string>();
        }
        if (root["timeout"]) {
            config.timeout_seconds = root["timeout"].as<int>();
        }
        if (root["log_level"]) {
            auto name = root["log_level"].as<std::string>();
            auto level = ParseLogLevel(name);
            if (!level) {
                return Result<AppConfig, Error>::Err(
                    MakeConfigError("Invalid log_level: " + name));
            }
            config.log_level = *level;
        }
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["log_json"]) {
            config.log_json = root["log_json"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in config file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv) {
    // -v is --verbose here, so only --help is added automatically.
    argparse::ArgumentParser program("ens-mcp", kVersion,
                                     argparse::default_arguments::help);
    program.add_description(
        "Model Context Protocol server for Ethereum Name Service resolution.");

    // Node
    program.add_argument("--rpc-url")
        .help("Ethereum JSON-RPC endpoint (default: " +
              std::string(kDefaultRpcUrl) + ")");
    program.add_argument("--registry")
        .help("ENS registry contract address");
    program.add_argument("--timeout")
        .help("RPC read timeout in seconds (default: 30)")
        .scan<'i', int>();

    // Mode
    program.add_argument("--transport")
        .help("stdio (serve MCP) or test (run a smoke test and exit)");
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");

    // Logging
    program.add_argument("-v", "--verbose")
        .help("Debug logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-level")
        .help("debug, info, warn or error (default: info)");
    program.add_argument("--log-file")
        .help("Append JSON log lines to this file instead of stderr");
    program.add_argument("--log-json")
        .help("Log JSON lines to stderr")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOptions options;

    if (auto val = program.present("--rpc-url")) {
        options.rpc_url = *val;
    }
    if (auto val = program.present("--registry")) {
        options.registry_address = *val;
    }
    if (auto val = program.present<int>("--timeout")) {
        options.timeout_seconds = *val;
    }
    if (auto val = program.present("--transport")) {
        auto transport = ParseTransport(*val);
        if (!transport) {
            return Result<CliOptions, Error>::Err(
                MakeConfigError("Invalid --transport: " + *val +
                                " (expected stdio or test)"));
        }
        options.transport = *transport;
    }
    if (auto val = program.present("--config")) {
        options.config_file = *val;
    }

    if (auto val = program.present("--log-level")) {
        auto level = ParseLogLevel(*val);
        if (!level) {
            return Result<CliOptions, Error>::Err(
                MakeConfigError("Invalid --log-level: " + *val));
        }
        options.log_level = *level;
    }
    if (program.get<bool>("--verbose")) {
        options.log_level = LogLevel::Debug;
    }
    if (auto val = program.present("--log-file")) {
        options.log_file = *val;
    }
    if (program.get<bool>("--log-json")) {
        options.log_json = true;
    }

    const bool force_color = program.get<bool>("--color");
    const bool no_color = program.get<bool>("--no-color");
    if (force_color && no_color) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("--color and --no-color are mutually exclusive"));
    }
    if (force_color) {
        options.color = true;
    } else if (no_color) {
        options.color = false;
    }

    if (program.get<bool>("--version")) {
        options.show_version = true;
    }

    return Result<CliOptions, Error>::Ok(std::move(options));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const CliOptions& cli) {
    AppConfig merged = base;

    if (cli.rpc_url) {
        merged.rpc_url = *cli.rpc_url;
    }
    if (cli.transport) {
        merged.transport = *cli.transport;
    }
    if (cli.registry_address) {
        merged.registry_address = cli.registry_address;
    }
    if (cli.timeout_seconds) {
        merged.timeout_seconds = *cli.timeout_seconds;
    }
    if (cli.log_level) {
        merged.log_level = *cli.log_level;
    }
    if (cli.log_file) {
        merged.log_file = cli.log_file;
    }
    if (cli.log_json) {
        merged.log_json = true;
    }

    // CLI-only settings.
    merged.color = cli.color;
    merged.show_version = cli.show_version;
    if (cli.config_file) {
        merged.config_file = cli.config_file;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    auto url = ParseHttpUrl(config.rpc_url);
    if (url.IsErr()) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid RPC URL: " + url.Error()));
    }
    if (config.registry_address.has_value() &&
        !IsValidAddressFormat(*config.registry_address)) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid registry address: " + *config.registry_address));
    }
    if (config.timeout_seconds <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "Invalid timeout: " + std::to_string(config.timeout_seconds) +
            " (must be positive)"));
    }
    return Result<void, Error>::Ok();
}

} // namespace ens_mcp
