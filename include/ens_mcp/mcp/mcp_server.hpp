#pragma once

#include <ens_mcp/mcp/tool_registry.hpp>

#include <atomic>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

namespace ens_mcp {

// MCP protocol revision spoken by the server.
constexpr const char* kProtocolVersion = "2024-11-05";

// JSON-RPC error codes used at the protocol layer.
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

// ---------------------------------------------------------------------------
// McpServer — MCP 2024-11-05 server over line-delimited JSON.
//
// Every input line gets exactly one response line:
//   - initialize
//   - tools/list
//   - tools/call
//   - anything else -> -32601
// Lines that are not JSON get {"error":{"code":-32700,...}} with no id.
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(ToolRegistry registry,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);

    // Flag polled between requests; when it becomes true Run() returns.
    // The flag must outlive the server.
    void SetStopFlag(const std::atomic<bool>* stop) noexcept { stop_ = stop; }

    // Serve until end of input or the stop flag is raised. Never throws.
    void Run();

    // Process a single parsed message and return its response. Exceptions
    // from tool handlers are converted to -32603 here.
    [[nodiscard]] nlohmann::json HandleMessage(const nlohmann::json& message);

    // Response for a line that failed to parse.
    [[nodiscard]] static nlohmann::json ParseErrorResponse();

private:
    nlohmann::json Dispatch(const nlohmann::json& message);
    nlohmann::json HandleInitialize(const nlohmann::json& request);
    nlohmann::json HandleToolsList(const nlohmann::json& request);
    nlohmann::json HandleToolsCall(const nlohmann::json& request,
                                   const nlohmann::json& params);

    // Both echo "jsonrpc" and "id" only when the request carried them.
    static nlohmann::json MakeError(const nlohmann::json& request,
                                    int code, const std::string& message);
    static nlohmann::json MakeResult(const nlohmann::json& request,
                                     nlohmann::json result);

    [[nodiscard]] bool StopRequested() const noexcept;

    const ToolRegistry registry_;
    std::istream& in_;
    std::ostream& out_;
    const std::atomic<bool>* stop_ = nullptr;
};

} // namespace ens_mcp
