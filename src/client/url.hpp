//===----------------------------------------------------------------------===//
//                         Surreal Client
//
// client/url.hpp
//
// Endpoint URL parsing
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"

namespace surreal_client {

enum class UrlScheme : uint8_t {
    HTTP,
    HTTPS,
    WS,
    WSS
};

const char* UrlSchemeToString(UrlScheme scheme);

// scheme://host[:port][/path]. Immutable once parsed.
class Url {
public:
    // Throws ConfigError on an unsupported scheme, missing host or bad port
    static Url Parse(const std::string& text);

    UrlScheme GetScheme() const { return scheme_; }
    const std::string& GetHost() const { return host_; }
    uint16_t GetPort() const { return port_; }

    // Path prefix without trailing slash ("" for the server root)
    const std::string& GetPath() const { return path_; }

    // Original text with any trailing '/' removed
    const std::string& GetRawUrl() const { return raw_url_; }

    bool IsHttp() const { return scheme_ == UrlScheme::HTTP || scheme_ == UrlScheme::HTTPS; }
    bool IsSecure() const { return scheme_ == UrlScheme::HTTPS || scheme_ == UrlScheme::WSS; }

    // Path of an endpoint below this URL, e.g. "/rpc" or "/prefix/rpc"
    std::string ResolvePath(const std::string& endpoint_path) const;

private:
    Url() = default;

    UrlScheme scheme_ = UrlScheme::HTTP;
    std::string host_;
    uint16_t port_ = 0;
    std::string path_;
    std::string raw_url_;
};

} // namespace surreal_client
