#include <ens_mcp/mcp/ens_tool_handlers.hpp>

#include <ens_mcp/ens/ens_operations.hpp>
#include <ens_mcp/ens/result_envelope.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace ens_mcp {

namespace {

// ---------------------------------------------------------------------------
// Result helpers
// ---------------------------------------------------------------------------

// Domain outcomes are never flagged isError; success:false is in the payload.
ToolResult MakeEnvelopeResult(const ResultEnvelope& envelope) {
    return ToolResult::FromPayload(envelope.ToJson(), false);
}

ToolResult MakeArgumentError(const std::string& msg) {
    return ToolResult::FromPayload(ResultEnvelope::Fail(msg).ToJson(), true);
}

// Get a required string argument. Returns nullopt and sets out_error when it
// is missing, not a string, or empty.
std::optional<std::string> RequireString(const nlohmann::json& arguments,
                                         const std::string& key,
                                         ToolResult& out_error) {
    if (!arguments.contains(key) || !arguments[key].is_string() ||
        arguments[key].get<std::string>().empty()) {
        out_error = MakeArgumentError("Missing required argument: " + key);
        return std::nullopt;
    }
    return arguments[key].get<std::string>();
}

// Get an optional non-negative integer argument. Absent or null yields the
// default; anything else that is not a non-negative integer sets out_error.
std::optional<int64_t> OptCoinType(const nlohmann::json& arguments,
                                   const std::string& key,
                                   int64_t default_val,
                                   ToolResult& out_error) {
    if (!arguments.contains(key) || arguments[key].is_null()) {
        return default_val;
    }
    const auto& value = arguments[key];
    if (value.is_number_unsigned()) {
        auto raw = value.get<uint64_t>();
        if (raw <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return static_cast<int64_t>(raw);
        }
    } else if (value.is_number_integer() && value.get<int64_t>() >= 0) {
        return value.get<int64_t>();
    }
    out_error = MakeArgumentError("Invalid argument: " + key +
                                  " must be a non-negative integer");
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

nlohmann::json IntProp(const std::string& desc, int64_t default_val) {
    return {{"type", "integer"}, {"description", desc}, {"default", default_val}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

// ---------------------------------------------------------------------------
// Tool handlers
// ---------------------------------------------------------------------------

// resolve_ens_name
ToolResult HandleResolveName(IEnsResolver& resolver, const nlohmann::json& arguments) {
    ToolResult err;
    auto name = RequireString(arguments, "ens_name", err);
    if (!name) return err;
    auto coin_type = OptCoinType(arguments, "coin_type", kEthCoinType, err);
    if (!coin_type) return err;

    return MakeEnvelopeResult(ResolveName(resolver, *name, *coin_type));
}

// reverse_resolve_address
ToolResult HandleReverseResolve(IEnsResolver& resolver,
                                const nlohmann::json& arguments) {
    ToolResult err;
    auto address = RequireString(arguments, "address", err);
    if (!address) return err;

    return MakeEnvelopeResult(ReverseResolve(resolver, *address));
}

// get_ens_text_record
ToolResult HandleGetTextRecord(IEnsResolver& resolver,
                               const nlohmann::json& arguments) {
    ToolResult err;
    auto name = RequireString(arguments, "ens_name", err);
    if (!name) return err;
    auto key = RequireString(arguments, "key", err);
    if (!key) return err;

    return MakeEnvelopeResult(GetTextRecord(resolver, *name, *key));
}

// get_ens_info
ToolResult HandleGetFullInfo(IEnsResolver& resolver, const nlohmann::json& arguments) {
    ToolResult err;
    auto name = RequireString(arguments, "ens_name", err);
    if (!name) return err;

    return MakeEnvelopeResult(GetFullInfo(resolver, *name));
}

} // anonymous namespace

void RegisterEnsTools(ToolRegistry& registry, IEnsResolver& resolver) {
    registry.Register(
        "resolve_ens_name",
        "Resolve an ENS name to an Ethereum address",
        MakeSchema(
            {{"ens_name", StringProp("The ENS name to resolve (e.g., 'vitalik.eth')")},
             {"coin_type",
              IntProp("Optional coin type for multi-chain address resolution "
                      "(default: 60 for ETH)",
                      kEthCoinType)}},
            nlohmann::json::array({"ens_name"})),
        [&resolver](const nlohmann::json& arguments) {
            return HandleResolveName(resolver, arguments);
        });

    registry.Register(
        "reverse_resolve_address",
        "Reverse resolve an Ethereum address to find its primary ENS name",
        MakeSchema(
            {{"address",
              StringProp("The Ethereum address to reverse resolve (e.g., '0x...')")}},
            nlohmann::json::array({"address"})),
        [&resolver](const nlohmann::json& arguments) {
            return HandleReverseResolve(resolver, arguments);
        });

    registry.Register(
        "get_ens_text_record",
        "Get a text record from an ENS name",
        MakeSchema(
            {{"ens_name", StringProp("The ENS name to query")},
             {"key", StringProp("The text record key (e.g., 'url', 'email', "
                                "'twitter', 'github')")}},
            nlohmann::json::array({"ens_name", "key"})),
        [&resolver](const nlohmann::json& arguments) {
            return HandleGetTextRecord(resolver, arguments);
        });

    registry.Register(
        "get_ens_info",
        "Get comprehensive information about an ENS name",
        MakeSchema({{"ens_name", StringProp("The ENS name to get information for")}},
                   nlohmann::json::array({"ens_name"})),
        [&resolver](const nlohmann::json& arguments) {
            return HandleGetFullInfo(resolver, arguments);
        });
}

} // namespace ens_mcp
