#include <ens_mcp/core/url.hpp>

#include <ens_mcp/core/strings.hpp>

#include <algorithm>
#include <cctype>

namespace ens_mcp {

std::string HttpUrl::Origin() const {
    return scheme + "://" + host + ":" + std::to_string(port);
}

Result<HttpUrl, std::string> ParseHttpUrl(std::string_view url) {
    HttpUrl parsed;
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return Result<HttpUrl, std::string>::Err(
            "URL must start with http:// or https://");
    }
    parsed.scheme = ToLowerAscii(url.substr(0, scheme_end));
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        return Result<HttpUrl, std::string>::Err(
            "Unsupported URL scheme '" + parsed.scheme + "'");
    }

    auto rest = url.substr(scheme_end + 3);
    auto path_start = rest.find_first_of("/?");
    auto authority = rest.substr(0, path_start);
    if (path_start == std::string_view::npos) {
        parsed.path = "/";
    } else if (rest[path_start] == '?') {
        parsed.path = "/" + std::string(rest.substr(path_start));
    } else {
        parsed.path = std::string(rest.substr(path_start));
    }

    if (authority.find('@') != std::string_view::npos) {
        return Result<HttpUrl, std::string>::Err(
            "Credentials in URL are not supported");
    }

    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        auto port_str = authority.substr(colon + 1);
        if (port_str.empty() || port_str.size() > 5 ||
            !std::all_of(port_str.begin(), port_str.end(),
                         [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
            return Result<HttpUrl, std::string>::Err(
                "Invalid port '" + std::string(port_str) + "'");
        }
        auto port = std::stoi(std::string(port_str));
        if (port <= 0 || port > 65535) {
            return Result<HttpUrl, std::string>::Err(
                "Port out of range: " + std::string(port_str));
        }
        parsed.port = static_cast<uint16_t>(port);
        authority = authority.substr(0, colon);
    } else {
        parsed.port = parsed.IsHttps() ? 443 : 80;
    }

    if (authority.empty()) {
        return Result<HttpUrl, std::string>::Err("URL has no host");
    }
    parsed.host = std::string(authority);
    return Result<HttpUrl, std::string>::Ok(std::move(parsed));
}

std::string RedactUrl(std::string_view url) {
    auto scheme_end = url.find("://");
    auto host_start = scheme_end == std::string_view::npos ? 0 : scheme_end + 3;
    auto path_start = url.find_first_of("/?", host_start);
    if (path_start == std::string_view::npos ||
        path_start + 1 >= url.size()) {
        return std::string(url);
    }
    return std::string(url.substr(0, path_start)) + "/...";
}

} // namespace ens_mcp
