#include <ens_mcp/ens/rpc_session.hpp>

#include <ens_mcp/core/log.hpp>

#include <httplib.h>

#include <cstdint>
#include <string>

namespace ens_mcp {

namespace {

Error MakeRpcError(const std::string& method,
                   const std::string& message,
                   ErrorCategory category,
                   std::optional<int> rpc_code = std::nullopt) {
    return Error{"RpcCall", method, message, category, rpc_code};
}

ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Read:
        case httplib::Error::ConnectionTimeout:
            return ErrorCategory::Timeout;
        default:
            return ErrorCategory::Connection;
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl — pimpl body holding the httplib::Client.
// ---------------------------------------------------------------------------
struct HttpRpcSession::Impl {
    std::unique_ptr<httplib::Client> client;
    std::string path;
    uint64_t next_id = 1;

    Impl(const HttpUrl& endpoint, const RpcSessionOptions& opts)
        : client(std::make_unique<httplib::Client>(endpoint.Origin())),
          path(endpoint.path) {
        client->set_connection_timeout(opts.connect_timeout);
        client->set_read_timeout(opts.read_timeout);
        client->set_keep_alive(true);
    }

    Result<nlohmann::json, Error> DoCall(const std::string& method,
                                         const nlohmann::json& params) {
        const auto id = next_id++;
        nlohmann::json request = {
            {"jsonrpc", "2.0"},
            {"id", id},
            {"method", method},
            {"params", params},
        };

        LogDebug("rpc", "> " + method + " #" + std::to_string(id));
        auto res = client->Post(path, request.dump(), "application/json");
        if (!res) {
            const auto http_error = res.error();
            return Result<nlohmann::json, Error>::Err(MakeRpcError(
                method, "HTTP request failed: " + httplib::to_string(http_error),
                CategoryFromHttpTransportError(http_error)));
        }
        LogDebug("rpc", "< " + std::to_string(res->status) + " #" +
                            std::to_string(id));

        if (res->status >= 400) {
            constexpr size_t kMaxBodyLog = 500;
            LogDebug("rpc", "  < body: " + res->body.substr(0, kMaxBodyLog));
            return Result<nlohmann::json, Error>::Err(MakeRpcError(
                method, "HTTP " + std::to_string(res->status) + " from node",
                ErrorCategory::Connection));
        }

        nlohmann::json body;
        try {
            body = nlohmann::json::parse(res->body);
        } catch (const nlohmann::json::exception& e) {
            return Result<nlohmann::json, Error>::Err(MakeRpcError(
                method, std::string("Malformed JSON-RPC response: ") + e.what(),
                ErrorCategory::Ens));
        }
        if (!body.is_object()) {
            return Result<nlohmann::json, Error>::Err(MakeRpcError(
                method, "JSON-RPC response is not an object", ErrorCategory::Ens));
        }

        if (auto err = body.find("error"); err != body.end() && !err->is_null()) {
            std::optional<int> code;
            std::string message = "JSON-RPC error";
            if (err->is_object()) {
                if (err->contains("code") && (*err)["code"].is_number_integer()) {
                    code = (*err)["code"].get<int>();
                }
                if (err->contains("message") && (*err)["message"].is_string()) {
                    message = (*err)["message"].get<std::string>();
                }
            }
            return Result<nlohmann::json, Error>::Err(
                MakeRpcError(method, message, ErrorCategory::Ens, code));
        }

        if (!body.contains("result")) {
            return Result<nlohmann::json, Error>::Err(MakeRpcError(
                method, "JSON-RPC response has neither result nor error",
                ErrorCategory::Ens));
        }
        return Result<nlohmann::json, Error>::Ok(std::move(body["result"]));
    }
};

HttpRpcSession::HttpRpcSession(const HttpUrl& endpoint,
                               const RpcSessionOptions& options)
    : impl_(std::make_unique<Impl>(endpoint, options)) {}

HttpRpcSession::~HttpRpcSession() = default;

Result<nlohmann::json, Error> HttpRpcSession::Call(
    std::string_view method, const nlohmann::json& params) {
    return impl_->DoCall(std::string(method), params);
}

} // namespace ens_mcp
