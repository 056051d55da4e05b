#include <ens_mcp/mcp/tool_registry.hpp>

#include <ens_mcp/ens/result_envelope.hpp>

namespace ens_mcp {

nlohmann::json ToolDescriptor::ToJson() const {
    return {
        {"name", name},
        {"description", description},
        {"inputSchema", input_schema}
    };
}

ToolResult ToolResult::FromPayload(const nlohmann::json& payload, bool is_error) {
    auto text = payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    return ToolResult{
        is_error,
        nlohmann::json::array({{{"type", "text"}, {"text", std::move(text)}}})};
}

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& input_schema,
                            ToolHandler handler) {
    auto it = handlers_.find(name);
    if (it != handlers_.end()) {
        it->second = std::move(handler);
        for (auto& descriptor : descriptors_) {
            if (descriptor.name == name) {
                descriptor.description = description;
                descriptor.input_schema = input_schema;
            }
        }
        return;
    }
    descriptors_.push_back({name, description, input_schema});
    handlers_[name] = std::move(handler);
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

ToolResult ToolRegistry::Execute(const std::string& name,
                                 const nlohmann::json& arguments) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        auto envelope = ResultEnvelope::Fail("Unknown tool: " + name);
        return ToolResult::FromPayload(envelope.ToJson(), true);
    }
    return it->second(arguments);
}

} // namespace ens_mcp
