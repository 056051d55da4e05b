#pragma once

#include <ens_mcp/core/result.hpp>
#include <ens_mcp/ens/hex.hpp>
#include <ens_mcp/ens/keccak.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ens_mcp {
namespace abi {

// Function selectors (first four bytes of keccak256 of the signature).
constexpr std::string_view kRegistryResolver = "0178b8bf"; // resolver(bytes32)
constexpr std::string_view kRegistryOwner    = "02571be3"; // owner(bytes32)
constexpr std::string_view kResolverAddr     = "3b3b57de"; // addr(bytes32)
constexpr std::string_view kResolverAddrCoin = "f1cb7e06"; // addr(bytes32,uint256)
constexpr std::string_view kResolverText     = "59d1d43c"; // text(bytes32,string)
constexpr std::string_view kResolverName     = "691f3431"; // name(bytes32)

// Calldata as "0x"-prefixed hex, ready for eth_call's "data" field.
std::string EncodeCall(std::string_view selector, const Hash256& node);
std::string EncodeCall(std::string_view selector, const Hash256& node,
                       uint64_t value);
std::string EncodeCall(std::string_view selector, const Hash256& node,
                       std::string_view text);

// Decode a single static `address` return value. The zero address decodes
// to nullopt. Returned addresses are lowercase and "0x"-prefixed.
Result<std::optional<std::string>, std::string> DecodeAddress(
    std::string_view return_data);

// Decode a single dynamic `bytes` return value.
Result<Bytes, std::string> DecodeBytes(std::string_view return_data);

// Decode a single dynamic `string` return value. Bytes that are not valid
// UTF-8 are an error.
Result<std::string, std::string> DecodeString(std::string_view return_data);

} // namespace abi
} // namespace ens_mcp
