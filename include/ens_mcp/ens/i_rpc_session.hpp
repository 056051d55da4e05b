#pragma once

#include <ens_mcp/core/result.hpp>

#include <string_view>

#include <nlohmann/json.hpp>

namespace ens_mcp {

// ---------------------------------------------------------------------------
// IRpcSession — abstract Ethereum JSON-RPC session.
//
// EnsResolver depends on this interface rather than on an HTTP client so it
// can be tested offline against MockRpcSession.
//
// Call() returns the JSON-RPC "result" member. Transport failures are
// reported as Connection/Timeout errors; a JSON-RPC "error" object from the
// node is reported as ErrorCategory::Ens with rpc_code set. Never throws on
// expected failures.
// ---------------------------------------------------------------------------
class IRpcSession {
public:
    virtual ~IRpcSession() = default;

    // Non-copyable, non-movable (polymorphic base).
    IRpcSession(const IRpcSession&) = delete;
    IRpcSession& operator=(const IRpcSession&) = delete;
    IRpcSession(IRpcSession&&) = delete;
    IRpcSession& operator=(IRpcSession&&) = delete;

    [[nodiscard]] virtual Result<nlohmann::json, Error> Call(
        std::string_view method,
        const nlohmann::json& params) = 0;

protected:
    IRpcSession() = default;
};

} // namespace ens_mcp
