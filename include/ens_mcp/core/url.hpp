#pragma once

#include <ens_mcp/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace ens_mcp {

// ---------------------------------------------------------------------------
// HttpUrl — an http(s) endpoint split into the parts cpp-httplib wants:
// scheme://host[:port] for the client and the path for each request.
// ---------------------------------------------------------------------------
struct HttpUrl {
    std::string scheme;   // "http" or "https"
    std::string host;
    uint16_t port = 0;    // explicit or scheme default
    std::string path;     // always starts with '/', includes any query

    [[nodiscard]] bool IsHttps() const { return scheme == "https"; }

    // scheme://host:port, suitable for httplib::Client.
    [[nodiscard]] std::string Origin() const;
};

Result<HttpUrl, std::string> ParseHttpUrl(std::string_view url);

// Replace everything after the host with "/..." so API keys embedded in
// RPC paths (e.g. /v2/<key>) do not end up in logs.
std::string RedactUrl(std::string_view url);

} // namespace ens_mcp
