#pragma once

#include <ens_mcp/core/result.hpp>

#include <string>
#include <string_view>

namespace ens_mcp {

constexpr const char* kZeroAddress = "0x0000000000000000000000000000000000000000";

// True for 40 hex digits with an optional 0x prefix. All-lowercase and
// all-uppercase forms are accepted as-is; a mixed-case form must carry a
// correct EIP-55 checksum. Mixed-case input cannot be verified, and is
// accepted, when Keccak-256 is unavailable.
bool IsValidAddressFormat(std::string_view s);

// EIP-55 mixed-case checksum form, "0x"-prefixed. The input must pass
// IsValidAddressFormat.
Result<std::string, Error> ToChecksumAddress(std::string_view s);

// True for the all-zero address in any case, with or without prefix.
bool IsZeroAddress(std::string_view s);

} // namespace ens_mcp
