#pragma once

#include <ens_mcp/ens/i_ens_resolver.hpp>
#include <ens_mcp/ens/i_rpc_session.hpp>
#include <ens_mcp/ens/keccak.hpp>

#include <string>

namespace ens_mcp {

// ENS registry, same address on mainnet and the public testnets.
constexpr const char* kEnsRegistryAddress =
    "0x00000000000C2E074eC69A0dFb2997BA6C7d2e1e";

struct EnsResolverOptions {
    std::string registry_address = kEnsRegistryAddress;
    std::string block_tag = "latest";
};

// ---------------------------------------------------------------------------
// EnsResolver — IEnsResolver backed by eth_call against the ENS registry and
// the per-name resolver contracts.
//
//   Resolve(name, 60)      registry.resolver(node) -> resolver.addr(node)
//   Resolve(name, coin)    registry.resolver(node) -> resolver.addr(node, coin)
//   GetText(name, key)     registry.resolver(node) -> resolver.text(node, key)
//   GetOwner(name)         registry.owner(node)
//   ReverseResolve(addr)   resolver.name(<addr>.addr.reverse), then checks
//                          that the name resolves forward to the same address
//
// A zero resolver, zero address, empty bytes, or empty string all read as
// "no record". No wildcard (ENSIP-10) or offchain (CCIP-read) support.
// ---------------------------------------------------------------------------
class EnsResolver : public IEnsResolver {
public:
    explicit EnsResolver(IRpcSession& session, EnsResolverOptions options = {});

    [[nodiscard]] Lookup Resolve(std::string_view name, int64_t coin_type) override;
    [[nodiscard]] Lookup ReverseResolve(std::string_view address) override;
    [[nodiscard]] Lookup GetText(std::string_view name, std::string_view key) override;
    [[nodiscard]] Lookup GetOwner(std::string_view name) override;
    [[nodiscard]] Lookup GetResolverAddress(std::string_view name) override;

    [[nodiscard]] bool IsValidAddressFormat(std::string_view s) const override;
    [[nodiscard]] Result<std::string, Error> ToChecksumAddress(
        std::string_view s) const override;

    [[nodiscard]] bool IsConnected() override;

private:
    // eth_call `data` against `to`, returning the raw hex return data.
    Result<std::string, Error> EthCall(const std::string& to,
                                       const std::string& data,
                                       const std::string& operation);

    // registry.resolver(node), nullopt when unset.
    Lookup FindResolver(const Hash256& node, const std::string& operation);

    IRpcSession& session_;
    EnsResolverOptions options_;
};

} // namespace ens_mcp
