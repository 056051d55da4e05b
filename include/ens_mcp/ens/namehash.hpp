#pragma once

#include <ens_mcp/core/result.hpp>
#include <ens_mcp/ens/keccak.hpp>

#include <string>
#include <string_view>

namespace ens_mcp {

// Trim surrounding whitespace and lowercase ASCII letters. Rejects names that
// end up empty or that contain an empty label ("a..eth", ".eth", "eth.").
Result<std::string, std::string> NormalizeEnsName(std::string_view raw);

// EIP-137 namehash of an already-normalized name. The empty name hashes to
// 32 zero bytes.
Result<Hash256, Error> Namehash(std::string_view name);

// Reverse-registrar node name for an address: "<40 lowercase hex>.addr.reverse".
// The address must already be a valid 20-byte hex address.
std::string ReverseNodeName(std::string_view address);

} // namespace ens_mcp
