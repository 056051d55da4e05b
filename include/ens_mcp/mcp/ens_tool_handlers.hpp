#pragma once

#include <ens_mcp/ens/i_ens_resolver.hpp>
#include <ens_mcp/mcp/tool_registry.hpp>

namespace ens_mcp {

// Register resolve_ens_name, reverse_resolve_address, get_ens_text_record
// and get_ens_info. The resolver must outlive the registry.
void RegisterEnsTools(ToolRegistry& registry, IEnsResolver& resolver);

} // namespace ens_mcp
