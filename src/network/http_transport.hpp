//===----------------------------------------------------------------------===//
//                         Surreal Client
//
// network/http_transport.hpp
//
// HTTP/1.1 transport over a blocking asio TCP socket
//===----------------------------------------------------------------------===//

#pragma once

#include "network/transport.hpp"

namespace surreal_client {

class HttpTransport : public Transport {
public:
    HttpTransport(std::string host, uint16_t port,
                  std::chrono::milliseconds timeout = std::chrono::milliseconds(DEFAULT_REQUEST_TIMEOUT_MS));
    ~HttpTransport() override;

    // Non-copyable
    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    void Open() override;
    void Close() noexcept override;
    bool IsOpen() const override { return open_; }

    // Reuses the kept-alive socket; after the server closes it the next call
    // reconnects.
    // The timeout bounds the whole exchange (connect, write, read).
    HttpResponse Send(const HttpRequest& request) override;

    const std::string& GetHost() const { return host_; }
    uint16_t GetPort() const { return port_; }
    std::chrono::milliseconds GetTimeout() const { return timeout_; }

    // Exposed for tests
    static std::string BuildRequestHead(const HttpRequest& request, const std::string& host_header);
    static bool ParseResponseHead(const std::string& head, HttpResponse& response, std::string& error);
    static bool ParseChunkSize(const std::string& line, size_t& size);
    static bool ParseContentLength(const std::string& text, size_t& length);

private:
    class SocketImpl;

    void Connect(TimePoint deadline);
    void ReadBody(HttpResponse& response, TimePoint deadline);
    void Disconnect() noexcept;

    std::string host_;
    uint16_t port_;
    std::chrono::milliseconds timeout_;
    std::unique_ptr<SocketImpl> socket_impl_;
    bool open_ = false;
    bool connected_ = false;
};

} // namespace surreal_client
