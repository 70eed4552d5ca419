//===----------------------------------------------------------------------===//
//                         Surreal Client
//
// network/transport.hpp
//
// Blocking request/response channel used by the dispatcher
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <utility>

namespace surreal_client {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string method = "POST";
    std::string path;
    HttpHeaders headers;
    Bytes body;

    // Case-insensitive lookup; empty when absent
    std::string GetHeader(const std::string& name) const;
    bool HasHeader(const std::string& name) const;
};

struct HttpResponse {
    int status_code = 0;
    std::string status_text;
    HttpHeaders headers;
    Bytes body;

    std::string GetHeader(const std::string& name) const;
    bool HasHeader(const std::string& name) const;
    bool IsSuccess() const { return status_code >= 200 && status_code < 300; }
};

// Case-insensitive ASCII comparison used for header names
bool HeaderNameEquals(const std::string& a, const std::string& b);

//===----------------------------------------------------------------------===//
// Transport
//
// One call is one blocking round trip. Implementations are not thread-safe;
// a connection issues at most one request at a time.
//===----------------------------------------------------------------------===//
class Transport {
public:
    virtual ~Transport() = default;

    // Acquire the underlying network handle. Idempotent.
    virtual void Open() = 0;

    // Release the underlying network handle. Idempotent, never throws.
    virtual void Close() noexcept = 0;

    virtual bool IsOpen() const = 0;

    // Send one request and wait for its response. Throws TransportError on
    // network failure or timeout; HTTP error statuses are returned as-is.
    virtual HttpResponse Send(const HttpRequest& request) = 0;
};

} // namespace surreal_client
