#pragma once

#include <ens_mcp/core/result.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace ens_mcp {

using Hash256 = std::array<uint8_t, 32>;

// Keccak-256 (the pre-standard SHA-3 padding Ethereum uses), computed with
// OpenSSL's "KECCAK-256" EVP digest. Fails with ErrorCategory::Internal when
// the linked OpenSSL does not provide it (added in OpenSSL 3.2).
Result<Hash256, Error> Keccak256(std::string_view data);

// True if Keccak256() can succeed with the linked OpenSSL.
bool Keccak256Available();

} // namespace ens_mcp
