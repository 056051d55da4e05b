#pragma once

#include <ens_mcp/core/url.hpp>
#include <ens_mcp/ens/i_rpc_session.hpp>

#include <chrono>
#include <memory>

namespace ens_mcp {

// ---------------------------------------------------------------------------
// RpcSessionOptions — configuration for the JSON-RPC HTTP session.
// ---------------------------------------------------------------------------
struct RpcSessionOptions {
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds read_timeout{30};
};

// ---------------------------------------------------------------------------
// HttpRpcSession — IRpcSession over HTTP(S) using cpp-httplib.
//
// Uses pimpl to keep httplib out of the public header. One keep-alive
// client is created at construction and reused for every call; the session
// is not safe for concurrent use.
// ---------------------------------------------------------------------------
class HttpRpcSession : public IRpcSession {
public:
    explicit HttpRpcSession(const HttpUrl& endpoint,
                            const RpcSessionOptions& options = {});

    ~HttpRpcSession() override;

    HttpRpcSession(const HttpRpcSession&) = delete;
    HttpRpcSession& operator=(const HttpRpcSession&) = delete;
    HttpRpcSession(HttpRpcSession&&) = delete;
    HttpRpcSession& operator=(HttpRpcSession&&) = delete;

    [[nodiscard]] Result<nlohmann::json, Error> Call(
        std::string_view method,
        const nlohmann::json& params) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ens_mcp
