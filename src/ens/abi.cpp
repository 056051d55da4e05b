#include <ens_mcp/ens/abi.hpp>

#include <ens_mcp/core/strings.hpp>
#include <ens_mcp/ens/address.hpp>

#include <algorithm>
#include <cstddef>

namespace ens_mcp {
namespace abi {

namespace {

constexpr size_t kWordSize = 32;

std::string UintWord(uint64_t value) {
    uint8_t word[kWordSize] = {};
    for (size_t i = 0; i < 8; ++i) {
        word[kWordSize - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
    }
    return ToHex(word, kWordSize);
}

// Read a 32-byte big-endian word at `offset` as a size. Fails if the value
// does not fit in 64 bits or the word runs past the end of the data.
Result<uint64_t, std::string> ReadSize(const Bytes& data, size_t offset) {
    if (offset > data.size() || data.size() - offset < kWordSize) {
        return Result<uint64_t, std::string>::Err(
            "Return data truncated at offset " + std::to_string(offset));
    }
    for (size_t i = 0; i < kWordSize - 8; ++i) {
        if (data[offset + i] != 0) {
            return Result<uint64_t, std::string>::Err(
                "Word at offset " + std::to_string(offset) + " is out of range");
        }
    }
    uint64_t value = 0;
    for (size_t i = kWordSize - 8; i < kWordSize; ++i) {
        value = (value << 8) | data[offset + i];
    }
    return Result<uint64_t, std::string>::Ok(value);
}

Result<Bytes, std::string> DecodeHex(std::string_view return_data) {
    auto bytes = FromHex(return_data);
    if (bytes.IsErr()) {
        return Result<Bytes, std::string>::Err(
            "Malformed return data: " + bytes.Error());
    }
    if (bytes.Value().empty()) {
        return Result<Bytes, std::string>::Err(
            "Empty return data (no contract at the target address?)");
    }
    return bytes;
}

} // anonymous namespace

std::string EncodeCall(std::string_view selector, const Hash256& node) {
    return "0x" + std::string(selector) + ToHex(node.data(), node.size());
}

std::string EncodeCall(std::string_view selector, const Hash256& node,
                       uint64_t value) {
    return EncodeCall(selector, node) + UintWord(value);
}

std::string EncodeCall(std::string_view selector, const Hash256& node,
                       std::string_view text) {
    // Head: node, offset of the string (two words in). Tail: length, data
    // right-padded to a whole number of words.
    auto call = EncodeCall(selector, node) + UintWord(2 * kWordSize) +
                UintWord(text.size());
    call += ToHex(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    const auto padding = (kWordSize - text.size() % kWordSize) % kWordSize;
    call.append(padding * 2, '0');
    return call;
}

Result<std::optional<std::string>, std::string> DecodeAddress(
    std::string_view return_data) {
    using R = Result<std::optional<std::string>, std::string>;
    auto bytes = DecodeHex(return_data);
    if (bytes.IsErr()) {
        return R::Err(bytes.Error());
    }
    const auto& data = bytes.Value();
    if (data.size() < kWordSize) {
        return R::Err("Address return value shorter than one word");
    }
    if (std::any_of(data.begin(), data.begin() + 12,
                    [](uint8_t b) { return b != 0; })) {
        return R::Err("Address return value has non-zero high bytes");
    }
    auto address = "0x" + ToHex(data.data() + 12, 20);
    if (IsZeroAddress(address)) {
        return R::Ok(std::nullopt);
    }
    return R::Ok(std::move(address));
}

Result<Bytes, std::string> DecodeBytes(std::string_view return_data) {
    auto bytes = DecodeHex(return_data);
    if (bytes.IsErr()) {
        return bytes;
    }
    const auto& data = bytes.Value();

    auto offset = ReadSize(data, 0);
    if (offset.IsErr()) {
        return Result<Bytes, std::string>::Err(offset.Error());
    }
    auto length = ReadSize(data, static_cast<size_t>(offset.Value()));
    if (length.IsErr()) {
        return Result<Bytes, std::string>::Err(length.Error());
    }

    const auto start = static_cast<size_t>(offset.Value()) + kWordSize;
    if (length.Value() > data.size() - start) {
        return Result<Bytes, std::string>::Err(
            "Dynamic value length " + std::to_string(length.Value()) +
            " exceeds return data");
    }
    return Result<Bytes, std::string>::Ok(
        Bytes(data.begin() + static_cast<std::ptrdiff_t>(start),
              data.begin() + static_cast<std::ptrdiff_t>(start + length.Value())));
}

Result<std::string, std::string> DecodeString(std::string_view return_data) {
    auto bytes = DecodeBytes(return_data);
    if (bytes.IsErr()) {
        return Result<std::string, std::string>::Err(bytes.Error());
    }
    std::string text(bytes.Value().begin(), bytes.Value().end());
    if (!IsValidUtf8(text)) {
        return Result<std::string, std::string>::Err("Return data is not valid UTF-8");
    }
    return Result<std::string, std::string>::Ok(std::move(text));
}

} // namespace abi
} // namespace ens_mcp
