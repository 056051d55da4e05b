#pragma once

#include <ens_mcp/core/result.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ens_mcp {

// A lookup that may find nothing. nullopt means "the name has no such
// record"; Err means the lookup itself failed.
using Lookup = Result<std::optional<std::string>, Error>;

// Coin type of Ethereum mainnet addresses (SLIP-44).
constexpr int64_t kEthCoinType = 60;

// ---------------------------------------------------------------------------
// IEnsResolver — the naming-protocol capability the MCP operations need.
//
// Names passed in are already normalized (trimmed, lowercased). Addresses
// returned by Resolve/GetOwner/GetResolverAddress are EIP-55 checksummed
// when coin_type is 60; other coin types return the raw address bytes as
// "0x"-prefixed hex.
// ---------------------------------------------------------------------------
class IEnsResolver {
public:
    virtual ~IEnsResolver() = default;

    IEnsResolver(const IEnsResolver&) = delete;
    IEnsResolver& operator=(const IEnsResolver&) = delete;
    IEnsResolver(IEnsResolver&&) = delete;
    IEnsResolver& operator=(IEnsResolver&&) = delete;

    // -- Lookups -------------------------------------------------------------

    [[nodiscard]] virtual Lookup Resolve(std::string_view name,
                                         int64_t coin_type) = 0;

    [[nodiscard]] virtual Lookup ReverseResolve(std::string_view address) = 0;

    [[nodiscard]] virtual Lookup GetText(std::string_view name,
                                         std::string_view key) = 0;

    [[nodiscard]] virtual Lookup GetOwner(std::string_view name) = 0;

    [[nodiscard]] virtual Lookup GetResolverAddress(std::string_view name) = 0;

    // -- Address format ------------------------------------------------------

    [[nodiscard]] virtual bool IsValidAddressFormat(std::string_view s) const = 0;

    [[nodiscard]] virtual Result<std::string, Error> ToChecksumAddress(
        std::string_view s) const = 0;

    // -- Connectivity --------------------------------------------------------

    [[nodiscard]] virtual bool IsConnected() = 0;

protected:
    IEnsResolver() = default;
};

} // namespace ens_mcp
