#pragma once

#include <string>
#include <string_view>

namespace ens_mcp {

// Strip leading and trailing ASCII whitespace.
std::string Trim(std::string_view s);

// ASCII-only lowercase; bytes >= 0x80 pass through untouched.
std::string ToLowerAscii(std::string_view s);

bool IEquals(std::string_view lhs, std::string_view rhs);

// Well-formed UTF-8: no overlong forms, surrogates or code points past
// U+10FFFF.
bool IsValidUtf8(std::string_view s);

} // namespace ens_mcp
