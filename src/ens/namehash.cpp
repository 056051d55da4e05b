#include <ens_mcp/ens/namehash.hpp>

#include <ens_mcp/core/strings.hpp>
#include <ens_mcp/ens/hex.hpp>

#include <algorithm>
#include <cctype>

namespace ens_mcp {

Result<std::string, std::string> NormalizeEnsName(std::string_view raw) {
    auto name = ToLowerAscii(Trim(raw));
    if (name.empty()) {
        return Result<std::string, std::string>::Err("ENS name must not be empty");
    }
    if (name.front() == '.' || name.back() == '.' ||
        name.find("..") != std::string::npos) {
        return Result<std::string, std::string>::Err(
            "Invalid ENS name '" + name + "': empty label");
    }
    if (std::any_of(name.begin(), name.end(), [](char c) {
            return std::isspace(static_cast<unsigned char>(c)) != 0;
        })) {
        return Result<std::string, std::string>::Err(
            "Invalid ENS name '" + name + "': contains whitespace");
    }
    return Result<std::string, std::string>::Ok(std::move(name));
}

Result<Hash256, Error> Namehash(std::string_view name) {
    Hash256 node{};
    // Labels are folded right to left: node = keccak(node ++ keccak(label)).
    while (!name.empty()) {
        auto dot = name.rfind('.');
        auto label = dot == std::string_view::npos ? name : name.substr(dot + 1);
        name = dot == std::string_view::npos ? std::string_view{} : name.substr(0, dot);

        auto label_hash = Keccak256(label);
        if (label_hash.IsErr()) {
            return Result<Hash256, Error>::Err(label_hash.Error());
        }

        std::string buffer;
        buffer.reserve(64);
        buffer.append(reinterpret_cast<const char*>(node.data()), node.size());
        buffer.append(reinterpret_cast<const char*>(label_hash.Value().data()),
                      label_hash.Value().size());

        auto next = Keccak256(buffer);
        if (next.IsErr()) {
            return next;
        }
        node = next.Value();
    }
    return Result<Hash256, Error>::Ok(node);
}

std::string ReverseNodeName(std::string_view address) {
    return ToLowerAscii(StripHexPrefix(address)) + ".addr.reverse";
}

} // namespace ens_mcp
