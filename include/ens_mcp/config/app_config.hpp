#pragma once

#include <ens_mcp/core/log.hpp>

#include <optional>
#include <string>

namespace ens_mcp {

constexpr const char* kDefaultRpcUrl = "https://eth-mainnet.g.alchemy.com/v2/demo";

enum class Transport {
    Stdio,  // serve MCP on stdin/stdout
    Test,   // run the smoke test and exit
};

struct AppConfig {
    std::string rpc_url = kDefaultRpcUrl;
    Transport transport = Transport::Stdio;
    std::optional<std::string> registry_address;  // defaults to the ENS registry
    int timeout_seconds = 30;
    LogLevel log_level = LogLevel::Info;
    std::optional<std::string> log_file;
    bool log_json = false;
    std::optional<bool> color;  // unset: auto-detect from the terminal
    std::optional<std::string> config_file;
    bool show_version = false;
};

} // namespace ens_mcp
