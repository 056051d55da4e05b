#include <ens_mcp/mcp/mcp_server.hpp>

#include <ens_mcp/core/log.hpp>
#include <ens_mcp/core/version.hpp>

#include <chrono>
#include <exception>
#include <string>

namespace ens_mcp {

namespace {

std::string DescribeId(const nlohmann::json& message) {
    if (message.is_object() && message.contains("id")) {
        return message["id"].dump();
    }
    return "-";
}

std::string DescribeMethod(const nlohmann::json& message) {
    if (message.is_object() && message.contains("method") &&
        message["method"].is_string()) {
        return message["method"].get<std::string>();
    }
    return "?";
}

// String member of an object, or `fallback` when absent or not a string.
std::string StringOr(const nlohmann::json& object, const char* key,
                     const std::string& fallback) {
    if (object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return fallback;
}

} // anonymous namespace

McpServer::McpServer(ToolRegistry registry,
                     std::istream& in,
                     std::ostream& out)
    : registry_(std::move(registry)), in_(in), out_(out) {}

bool McpServer::StopRequested() const noexcept {
    return stop_ != nullptr && stop_->load();
}

void McpServer::Run() {
    LogInfo("mcp", "Server started (protocol " + std::string(kProtocolVersion) +
                       ", " + std::to_string(registry_.Tools().size()) + " tools)");
    std::string reason = "end of input";

    try {
        std::string line;
        while (true) {
            if (StopRequested()) {
                reason = "interrupted";
                break;
            }
            if (!std::getline(in_, line)) {
                if (StopRequested()) {
                    reason = "interrupted";
                }
                break;
            }
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }

            nlohmann::json response;
            try {
                auto message = nlohmann::json::parse(line);
                auto started = std::chrono::steady_clock::now();
                response = HandleMessage(message);
                auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - started);
                LogDebug("mcp", "method=" + DescribeMethod(message) +
                                    " id=" + DescribeId(message) + " elapsed=" +
                                    std::to_string(elapsed.count()) + "ms");
            } catch (const nlohmann::json::parse_error&) {
                LogDebug("mcp", "Unparseable line (" + std::to_string(line.size()) +
                                    " bytes)");
                response = ParseErrorResponse();
            } catch (const std::exception& e) {
                LogError("mcp", std::string("Failed to process line: ") + e.what());
                response = MakeError(nlohmann::json(), kInternalError,
                                     std::string("Internal error: ") + e.what());
            }

            out_ << response.dump(-1, ' ', false,
                                  nlohmann::json::error_handler_t::replace)
                 << "\n";
            out_.flush();
        }
    } catch (const std::exception& e) {
        reason = "error";
        LogError("mcp", std::string("Server error: ") + e.what());
    } catch (...) {
        reason = "error";
        LogError("mcp", "Server error: unknown exception");
    }

    LogInfo("mcp", "Server stopped (" + reason + ")");
}

nlohmann::json McpServer::HandleMessage(const nlohmann::json& message) {
    try {
        return Dispatch(message);
    } catch (const std::exception& e) {
        LogError("mcp", std::string("Request failed: ") + e.what());
        return MakeError(message, kInternalError,
                         std::string("Internal error: ") + e.what());
    } catch (...) {
        LogError("mcp", "Request failed: unknown exception");
        return MakeError(message, kInternalError, "Internal error: unknown exception");
    }
}

nlohmann::json McpServer::ParseErrorResponse() {
    return {{"error", {{"code", kParseError}, {"message", "Parse error"}}}};
}

nlohmann::json McpServer::Dispatch(const nlohmann::json& message) {
    if (!message.is_object() || !message.contains("method") ||
        !message["method"].is_string()) {
        return MakeError(message, kInvalidRequest, "Invalid Request");
    }

    const auto method = message["method"].get<std::string>();
    auto params = nlohmann::json::object();
    if (message.contains("params") && !message["params"].is_null()) {
        if (!message["params"].is_object()) {
            return MakeError(message, kInvalidParams, "Invalid params");
        }
        params = message["params"];
    }

    if (method == "initialize") {
        return HandleInitialize(message);
    } else if (method == "tools/list") {
        return HandleToolsList(message);
    } else if (method == "tools/call") {
        return HandleToolsCall(message, params);
    }
    return MakeError(message, kMethodNotFound, "Method not found: " + method);
}

nlohmann::json McpServer::HandleInitialize(const nlohmann::json& request) {
    const auto& params = request.value("params", nlohmann::json::object());
    if (params.is_object() && params.contains("clientInfo") &&
        params["clientInfo"].is_object()) {
        const auto& client = params["clientInfo"];
        LogInfo("mcp", "Client: " + StringOr(client, "name", "unknown") + " " +
                           StringOr(client, "version", ""));
    }

    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {
        {"tools", {{"listChanged", true}}}
    };
    result["serverInfo"] = {
        {"name", "ENS MCP Server"},
        {"version", kVersion},
        {"description",
         "A Model Context Protocol server for Ethereum Name Service resolution"},
        {"capabilities", {
            {"tools", true},
            {"resources", false},
            {"prompts", false}
        }}
    };

    return MakeResult(request, std::move(result));
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& request) {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& descriptor : registry_.Tools()) {
        tools.push_back(descriptor.ToJson());
    }
    return MakeResult(request, {{"tools", std::move(tools)}});
}

nlohmann::json McpServer::HandleToolsCall(const nlohmann::json& request,
                                          const nlohmann::json& params) {
    if (!params.contains("name") || !params["name"].is_string()) {
        return MakeError(request, kInvalidParams, "Missing 'name' parameter");
    }

    auto tool_name = params["name"].get<std::string>();
    auto arguments = nlohmann::json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        if (!params["arguments"].is_object()) {
            return MakeError(request, kInvalidParams,
                             "Invalid params: 'arguments' must be an object");
        }
        arguments = params["arguments"];
    }

    if (!registry_.HasTool(tool_name)) {
        LogWarn("mcp", "tools/call for unknown tool '" + tool_name + "'");
    }
    auto result = registry_.Execute(tool_name, arguments);

    nlohmann::json response_result;
    response_result["content"] = std::move(result.content);
    if (result.is_error) {
        response_result["isError"] = true;
    }
    return MakeResult(request, std::move(response_result));
}

nlohmann::json McpServer::MakeError(const nlohmann::json& request,
                                    int code, const std::string& message) {
    nlohmann::json response = nlohmann::json::object();
    if (request.is_object() && request.contains("jsonrpc")) {
        response["jsonrpc"] = request["jsonrpc"];
    }
    if (request.is_object() && request.contains("id")) {
        response["id"] = request["id"];
    }
    response["error"] = {{"code", code}, {"message", message}};
    return response;
}

nlohmann::json McpServer::MakeResult(const nlohmann::json& request,
                                     nlohmann::json result) {
    nlohmann::json response = nlohmann::json::object();
    if (request.is_object() && request.contains("jsonrpc")) {
        response["jsonrpc"] = request["jsonrpc"];
    }
    if (request.is_object() && request.contains("id")) {
        response["id"] = request["id"];
    }
    response["result"] = std::move(result);
    return response;
}

} // namespace ens_mcp
