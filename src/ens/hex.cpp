#include <ens_mcp/ens/hex.hpp>

namespace ens_mcp {

namespace {

constexpr const char* kHexDigits = "0123456789abcdef";

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string ToHex(const uint8_t* data, size_t size) {
    std::string out;
    out.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        out.push_back(kHexDigits[data[i] >> 4]);
        out.push_back(kHexDigits[data[i] & 0x0f]);
    }
    return out;
}

std::string ToHex(const Bytes& bytes) {
    return ToHex(bytes.data(), bytes.size());
}

Result<Bytes, std::string> FromHex(std::string_view hex) {
    hex = StripHexPrefix(hex);
    if (hex.size() % 2 != 0) {
        return Result<Bytes, std::string>::Err("Odd-length hex string");
    }
    Bytes out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        auto hi = HexValue(hex[i]);
        auto lo = HexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return Result<Bytes, std::string>::Err(
                "Invalid hex digit at offset " + std::to_string(i));
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return Result<Bytes, std::string>::Ok(std::move(out));
}

bool IsHexDigit(char c) {
    return HexValue(c) >= 0;
}

std::string_view StripHexPrefix(std::string_view s) {
    if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        return s.substr(2);
    }
    return s;
}

} // namespace ens_mcp
