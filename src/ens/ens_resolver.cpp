#include <ens_mcp/ens/ens_resolver.hpp>

#include <ens_mcp/core/log.hpp>
#include <ens_mcp/core/strings.hpp>
#include <ens_mcp/ens/abi.hpp>
#include <ens_mcp/ens/address.hpp>
#include <ens_mcp/ens/namehash.hpp>

#include <string>

namespace ens_mcp {

namespace {

Error MakeDecodeError(const std::string& operation, const std::string& message) {
    return Error{operation, "eth_call", message, ErrorCategory::Ens, std::nullopt};
}

Lookup None() {
    return Lookup::Ok(std::nullopt);
}

Lookup Found(std::string value) {
    return Lookup::Ok(std::optional<std::string>(std::move(value)));
}

} // anonymous namespace

EnsResolver::EnsResolver(IRpcSession& session, EnsResolverOptions options)
    : session_(session), options_(std::move(options)) {}

Result<std::string, Error> EnsResolver::EthCall(const std::string& to,
                                                const std::string& data,
                                                const std::string& operation) {
    nlohmann::json params = nlohmann::json::array({
        {{"to", to}, {"data", data}},
        options_.block_tag,
    });
    auto result = session_.Call("eth_call", params);
    if (result.IsErr()) {
        auto error = std::move(result).Error();
        error.operation = operation;
        return Result<std::string, Error>::Err(std::move(error));
    }
    if (!result.Value().is_string()) {
        return Result<std::string, Error>::Err(
            MakeDecodeError(operation, "eth_call result is not a hex string"));
    }
    return Result<std::string, Error>::Ok(result.Value().get<std::string>());
}

Lookup EnsResolver::FindResolver(const Hash256& node, const std::string& operation) {
    auto raw = EthCall(options_.registry_address,
                       abi::EncodeCall(abi::kRegistryResolver, node), operation);
    if (raw.IsErr()) {
        return Lookup::Err(raw.Error());
    }
    auto decoded = abi::DecodeAddress(raw.Value());
    if (decoded.IsErr()) {
        return Lookup::Err(MakeDecodeError(operation, decoded.Error()));
    }
    return Lookup::Ok(decoded.Value());
}

Lookup EnsResolver::Resolve(std::string_view name, int64_t coin_type) {
    const std::string op = "Resolve";
    if (coin_type < 0) {
        return Lookup::Err(Error{op, "", "coin_type must not be negative",
                                 ErrorCategory::InvalidInput, std::nullopt});
    }
    auto node = Namehash(name);
    if (node.IsErr()) {
        return Lookup::Err(node.Error());
    }
    auto resolver = FindResolver(node.Value(), op);
    if (resolver.IsErr() || !resolver.Value().has_value()) {
        return resolver;
    }

    if (coin_type == kEthCoinType) {
        auto raw = EthCall(*resolver.Value(),
                           abi::EncodeCall(abi::kResolverAddr, node.Value()), op);
        if (raw.IsErr()) {
            return Lookup::Err(raw.Error());
        }
        auto decoded = abi::DecodeAddress(raw.Value());
        if (decoded.IsErr()) {
            return Lookup::Err(MakeDecodeError(op, decoded.Error()));
        }
        if (!decoded.Value().has_value()) {
            return None();
        }
        auto checksummed = ToChecksumAddress(*decoded.Value());
        if (checksummed.IsErr()) {
            return Lookup::Err(checksummed.Error());
        }
        return Found(checksummed.Value());
    }

    auto raw = EthCall(*resolver.Value(),
                       abi::EncodeCall(abi::kResolverAddrCoin, node.Value(),
                                       static_cast<uint64_t>(coin_type)),
                       op);
    if (raw.IsErr()) {
        return Lookup::Err(raw.Error());
    }
    auto bytes = abi::DecodeBytes(raw.Value());
    if (bytes.IsErr()) {
        return Lookup::Err(MakeDecodeError(op, bytes.Error()));
    }
    if (bytes.Value().empty()) {
        return None();
    }
    return Found("0x" + ToHex(bytes.Value()));
}

Lookup EnsResolver::ReverseResolve(std::string_view address) {
    const std::string op = "ReverseResolve";
    if (!IsValidAddressFormat(address)) {
        return Lookup::Err(Error{op, "", "Invalid Ethereum address format: " +
                                             std::string(address),
                                 ErrorCategory::InvalidInput, std::nullopt});
    }
    auto node = Namehash(ReverseNodeName(address));
    if (node.IsErr()) {
        return Lookup::Err(node.Error());
    }
    auto resolver = FindResolver(node.Value(), op);
    if (resolver.IsErr() || !resolver.Value().has_value()) {
        return resolver;
    }

    auto raw = EthCall(*resolver.Value(),
                       abi::EncodeCall(abi::kResolverName, node.Value()), op);
    if (raw.IsErr()) {
        return Lookup::Err(raw.Error());
    }
    auto name = abi::DecodeString(raw.Value());
    if (name.IsErr()) {
        return Lookup::Err(MakeDecodeError(op, name.Error()));
    }
    if (name.Value().empty()) {
        return None();
    }

    // A reverse record is only trusted if the name points back at the address.
    auto normalized = NormalizeEnsName(name.Value());
    if (normalized.IsErr()) {
        LogDebug("ens", "Reverse record '" + name.Value() + "' is not a valid name");
        return None();
    }
    auto forward = Resolve(normalized.Value(), kEthCoinType);
    if (forward.IsErr()) {
        return forward;
    }
    if (!forward.Value().has_value() ||
        !IEquals(StripHexPrefix(*forward.Value()), StripHexPrefix(address))) {
        LogDebug("ens", "Reverse record '" + name.Value() +
                            "' does not resolve back to " + std::string(address));
        return None();
    }
    return Found(name.Value());
}

Lookup EnsResolver::GetText(std::string_view name, std::string_view key) {
    const std::string op = "GetText";
    auto node = Namehash(name);
    if (node.IsErr()) {
        return Lookup::Err(node.Error());
    }
    auto resolver = FindResolver(node.Value(), op);
    if (resolver.IsErr() || !resolver.Value().has_value()) {
        return resolver;
    }

    auto raw = EthCall(*resolver.Value(),
                       abi::EncodeCall(abi::kResolverText, node.Value(), key), op);
    if (raw.IsErr()) {
        return Lookup::Err(raw.Error());
    }
    auto text = abi::DecodeString(raw.Value());
    if (text.IsErr()) {
        return Lookup::Err(MakeDecodeError(op, text.Error()));
    }
    if (text.Value().empty()) {
        return None();
    }
    return Found(text.Value());
}

Lookup EnsResolver::GetOwner(std::string_view name) {
    const std::string op = "GetOwner";
    auto node = Namehash(name);
    if (node.IsErr()) {
        return Lookup::Err(node.Error());
    }
    auto raw = EthCall(options_.registry_address,
                       abi::EncodeCall(abi::kRegistryOwner, node.Value()), op);
    if (raw.IsErr()) {
        return Lookup::Err(raw.Error());
    }
    auto decoded = abi::DecodeAddress(raw.Value());
    if (decoded.IsErr()) {
        return Lookup::Err(MakeDecodeError(op, decoded.Error()));
    }
    if (!decoded.Value().has_value()) {
        return None();
    }
    auto checksummed = ToChecksumAddress(*decoded.Value());
    if (checksummed.IsErr()) {
        return Lookup::Err(checksummed.Error());
    }
    return Found(checksummed.Value());
}

Lookup EnsResolver::GetResolverAddress(std::string_view name) {
    const std::string op = "GetResolverAddress";
    auto node = Namehash(name);
    if (node.IsErr()) {
        return Lookup::Err(node.Error());
    }
    auto resolver = FindResolver(node.Value(), op);
    if (resolver.IsErr() || !resolver.Value().has_value()) {
        return resolver;
    }
    auto checksummed = ToChecksumAddress(*resolver.Value());
    if (checksummed.IsErr()) {
        return Lookup::Err(checksummed.Error());
    }
    return Found(checksummed.Value());
}

bool EnsResolver::IsValidAddressFormat(std::string_view s) const {
    return ens_mcp::IsValidAddressFormat(s);
}

Result<std::string, Error> EnsResolver::ToChecksumAddress(std::string_view s) const {
    return ens_mcp::ToChecksumAddress(s);
}

bool EnsResolver::IsConnected() {
    auto result = session_.Call("web3_clientVersion", nlohmann::json::array());
    if (result.IsErr()) {
        LogWarn("ens", "Node connectivity check failed: " + result.Error().ToString());
        return false;
    }
    if (result.Value().is_string()) {
        LogInfo("ens", "Connected to " + result.Value().get<std::string>());
    }
    return true;
}

} // namespace ens_mcp
