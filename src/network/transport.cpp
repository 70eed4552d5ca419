//===----------------------------------------------------------------------===//
//                         Surreal Client
//
// network/transport.cpp
//
// HTTP request/response helpers
//===----------------------------------------------------------------------===//

#include "network/transport.hpp"
#include <cctype>

namespace surreal_client {

bool HeaderNameEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

static const std::string* FindHeader(const HttpHeaders& headers, const std::string& name) {
    for (const auto& header : headers) {
        if (HeaderNameEquals(header.first, name)) {
            return &header.second;
        }
    }
    return nullptr;
}

std::string HttpRequest::GetHeader(const std::string& name) const {
    const std::string* value = FindHeader(headers, name);
    return value ? *value : std::string();
}

bool HttpRequest::HasHeader(const std::string& name) const {
    return FindHeader(headers, name) != nullptr;
}

std::string HttpResponse::GetHeader(const std::string& name) const {
    const std::string* value = FindHeader(headers, name);
    return value ? *value : std::string();
}

bool HttpResponse::HasHeader(const std::string& name) const {
    return FindHeader(headers, name) != nullptr;
}

} // namespace surreal_client
