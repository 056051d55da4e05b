#pragma once

#include <ens_mcp/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ens_mcp {

using Bytes = std::vector<uint8_t>;

// Lowercase hex, no "0x" prefix.
std::string ToHex(const uint8_t* data, size_t size);
std::string ToHex(const Bytes& bytes);

// Accepts an optional "0x"/"0X" prefix and either case. Odd length is an error.
Result<Bytes, std::string> FromHex(std::string_view hex);

bool IsHexDigit(char c);

// Drop a leading "0x"/"0X" if present.
std::string_view StripHexPrefix(std::string_view s);

} // namespace ens_mcp
