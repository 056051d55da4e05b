#include <ens_mcp/ens/address.hpp>

#include <ens_mcp/core/strings.hpp>
#include <ens_mcp/ens/hex.hpp>
#include <ens_mcp/ens/keccak.hpp>

#include <algorithm>

namespace ens_mcp {

namespace {

constexpr size_t kAddressHexLength = 40;

// Apply EIP-55 to 40 lowercase hex digits using the digest of those digits.
std::string ApplyChecksum(const std::string& lower_hex, const Hash256& digest) {
    std::string out = "0x";
    out.reserve(2 + lower_hex.size());
    for (size_t i = 0; i < lower_hex.size(); ++i) {
        const auto nibble = (i % 2 == 0) ? (digest[i / 2] >> 4)
                                         : (digest[i / 2] & 0x0f);
        const char c = lower_hex[i];
        out.push_back((c >= 'a' && c <= 'f' && nibble >= 8)
                          ? static_cast<char>(c - 'a' + 'A')
                          : c);
    }
    return out;
}

} // anonymous namespace

bool IsValidAddressFormat(std::string_view s) {
    auto hex = StripHexPrefix(s);
    if (hex.size() != kAddressHexLength ||
        !std::all_of(hex.begin(), hex.end(), IsHexDigit)) {
        return false;
    }

    const bool has_lower = std::any_of(hex.begin(), hex.end(),
                                       [](char c) { return c >= 'a' && c <= 'f'; });
    const bool has_upper = std::any_of(hex.begin(), hex.end(),
                                       [](char c) { return c >= 'A' && c <= 'F'; });
    if (!(has_lower && has_upper)) {
        return true;
    }

    auto lower = ToLowerAscii(hex);
    auto digest = Keccak256(lower);
    if (digest.IsErr()) {
        return true;
    }
    return ApplyChecksum(lower, digest.Value()).substr(2) == hex;
}

Result<std::string, Error> ToChecksumAddress(std::string_view s) {
    if (!IsValidAddressFormat(s)) {
        return Result<std::string, Error>::Err(
            Error{"ToChecksumAddress", "",
                  "Invalid Ethereum address format: " + std::string(s),
                  ErrorCategory::InvalidInput, std::nullopt});
    }
    auto lower = ToLowerAscii(StripHexPrefix(s));
    return Keccak256(lower).Map([&lower](const Hash256& digest) {
        return ApplyChecksum(lower, digest);
    });
}

bool IsZeroAddress(std::string_view s) {
    auto hex = StripHexPrefix(s);
    return hex.size() == kAddressHexLength &&
           std::all_of(hex.begin(), hex.end(), [](char c) { return c == '0'; });
}

} // namespace ens_mcp
