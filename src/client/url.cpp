//===----------------------------------------------------------------------===//
//                         Surreal Client
//
// client/url.cpp
//
// Endpoint URL parsing
//===----------------------------------------------------------------------===//

#include "client/url.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>

namespace surreal_client {

const char* UrlSchemeToString(UrlScheme scheme) {
    switch (scheme) {
        case UrlScheme::HTTP:  return "http";
        case UrlScheme::HTTPS: return "https";
        case UrlScheme::WS:    return "ws";
        case UrlScheme::WSS:   return "wss";
        default:               return "unknown";
    }
}

Url Url::Parse(const std::string& text) {
    Url url;

    url.raw_url_ = text;
    while (!url.raw_url_.empty() && url.raw_url_.back() == '/') {
        url.raw_url_.pop_back();
    }

    auto scheme_end = url.raw_url_.find("://");
    if (scheme_end == std::string::npos) {
        throw ConfigError("URL '" + text + "' has no scheme");
    }

    std::string scheme = url.raw_url_.substr(0, scheme_end);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    uint16_t default_port;
    if (scheme == "http") {
        url.scheme_ = UrlScheme::HTTP;
        default_port = 80;
    } else if (scheme == "https") {
        url.scheme_ = UrlScheme::HTTPS;
        default_port = 443;
    } else if (scheme == "ws") {
        url.scheme_ = UrlScheme::WS;
        default_port = 80;
    } else if (scheme == "wss") {
        url.scheme_ = UrlScheme::WSS;
        default_port = 443;
    } else {
        throw ConfigError("Unsupported URL scheme '" + scheme + "'");
    }

    std::string rest = url.raw_url_.substr(scheme_end + 3);
    auto path_start = rest.find('/');
    std::string authority = rest.substr(0, path_start);
    if (path_start != std::string::npos) {
        url.path_ = rest.substr(path_start);
    }

    // Credentials in the authority are not supported; drop them
    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    std::string port_text;
    if (!authority.empty() && authority.front() == '[') {
        // [::1]:8000
        auto close = authority.find(']');
        if (close == std::string::npos) {
            throw ConfigError("URL '" + text + "' has an unterminated IPv6 address");
        }
        url.host_ = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                throw ConfigError("URL '" + text + "' has garbage after the host");
            }
            port_text = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        url.host_ = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_text = authority.substr(colon + 1);
        }
    }

    if (url.host_.empty()) {
        throw ConfigError("URL '" + text + "' has no host");
    }

    if (port_text.empty()) {
        url.port_ = default_port;
    } else {
        if (port_text.size() > 5 || !std::all_of(port_text.begin(), port_text.end(),
                                                           [](unsigned char c) { return std::isdigit(c) != 0; })) {
            throw ConfigError("URL '" + text + "' has an invalid port");
        }
        int port = std::stoi(port_text);
        if (port <= 0 || port > 65535) {
            throw ConfigError("URL '" + text + "' has an invalid port");
        }
        url.port_ = static_cast<uint16_t>(port);
    }

    return url;
}

std::string Url::ResolvePath(const std::string& endpoint_path) const {
    return path_ + endpoint_path;
}

} // namespace surreal_client
