#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ens_mcp {

// ---------------------------------------------------------------------------
// ToolDescriptor — name, description and JSON Schema of a tool's arguments.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object

    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// ToolResult — content blocks returned by a tool call.
// ---------------------------------------------------------------------------
struct ToolResult {
    bool is_error = false;
    nlohmann::json content;  // array of content blocks

    // Single text block holding `payload` serialized with 2-space indent.
    // Invalid UTF-8 in strings is replaced with U+FFFD rather than thrown.
    static ToolResult FromPayload(const nlohmann::json& payload, bool is_error);
};

// A tool handler takes the call's arguments object and returns a ToolResult.
using ToolHandler = std::function<ToolResult(const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// ToolRegistry — the tools served by tools/list and tools/call.
//
// Populated once at startup. Handler exceptions propagate to the caller.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    void Register(const std::string& name,
                  const std::string& description,
                  const nlohmann::json& input_schema,
                  ToolHandler handler);

    [[nodiscard]] const std::vector<ToolDescriptor>& Tools() const noexcept {
        return descriptors_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    // Unknown names yield a failed envelope, not an exception.
    [[nodiscard]] ToolResult Execute(const std::string& name,
                                     const nlohmann::json& arguments) const;

private:
    std::vector<ToolDescriptor> descriptors_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace ens_mcp
