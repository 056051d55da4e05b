#pragma once

#include <ens_mcp/config/app_config.hpp>
#include <ens_mcp/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace ens_mcp {

// "stdio" or "test" (case-insensitive).
std::optional<Transport> ParseTransport(std::string_view name);

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Settings given on the command line. Unset fields were not passed and
// leave the base config alone.
struct CliOptions {
    std::optional<std::string> rpc_url;
    std::optional<Transport> transport;
    std::optional<std::string> registry_address;
    std::optional<int> timeout_seconds;
    std::optional<LogLevel> log_level;
    std::optional<std::string> log_file;
    bool log_json = false;
    std::optional<bool> color;
    std::optional<std::string> config_file;
    bool show_version = false;
};

// Parse CLI arguments. --help prints usage and exits.
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv);

// Apply every option passed on the command line on top of `base` (the YAML
// file, or a default AppConfig when there is none).
AppConfig MergeConfigs(const AppConfig& base, const CliOptions& cli);

// Check that the RPC URL, registry address and timeout are usable.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace ens_mcp
