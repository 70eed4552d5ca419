//===----------------------------------------------------------------------===//
//                         Surreal Client
//
// network/http_transport.cpp
//
// HTTP/1.1 client implementation using ASIO
//===----------------------------------------------------------------------===//

#include "network/http_transport.hpp"
#include "errors.hpp"
#include "logging/logger.hpp"

#include <asio.hpp>
#include <algorithm>
#include <cctype>
#include <functional>
#include <sstream>

namespace surreal_client {

using asio::ip::tcp;

static std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

static bool IsDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

//===----------------------------------------------------------------------===//
// Socket Implementation (PIMPL)
//===----------------------------------------------------------------------===//

class HttpTransport::SocketImpl {
public:
    asio::io_context io_context;
    tcp::socket socket;
    asio::streambuf read_buffer;

    SocketImpl()
        : socket(io_context)
        , read_buffer(MAX_RESPONSE_HEADER_SIZE + MAX_RESPONSE_BODY_SIZE) {}

    // Non-blocking check of an idle kept-alive socket. True when the server
    // has closed it (or sent bytes nobody asked for), so it must not be
    // reused for the next request.
    bool IsStale() {
        if (read_buffer.size() > 0) {
            return true;
        }
        asio::error_code ec;
        socket.non_blocking(true, ec);
        if (ec) {
            return true;
        }
        uint8_t byte;
        socket.read_some(asio::buffer(&byte, 1), ec);
        asio::error_code ignored;
        socket.non_blocking(false, ignored);
        return ec != asio::error::would_block && ec != asio::error::try_again;
    }

    // Drive the io_context until the pending operation flags completion or
    // the deadline passes. On timeout the operation is cancelled and its
    // handler drained before throwing, so handlers never outlive the caller's
    // stack.
    void RunUntilComplete(const bool& done, TimePoint deadline, const std::string& what,
                          const std::function<void()>& cancel = nullptr) {
        io_context.restart();
        while (!done) {
            if (io_context.run_one_until(deadline) == 0) {
                break;
            }
        }
        if (done) {
            return;
        }

        if (cancel) {
            cancel();
        }
        asio::error_code ignored;
        socket.close(ignored);
        io_context.restart();
        io_context.run();
        throw TransportError("Timed out " + what);
    }
};

//===----------------------------------------------------------------------===//
// HttpTransport
//===----------------------------------------------------------------------===//

HttpTransport::HttpTransport(std::string host, uint16_t port, std::chrono::milliseconds timeout)
    : host_(std::move(host))
    , port_(port)
    , timeout_(timeout) {}

HttpTransport::~HttpTransport() {
    Close();
}

void HttpTransport::Open() {
    if (open_) {
        return;
    }
    socket_impl_ = std::make_unique<SocketImpl>();
    open_ = true;
    connected_ = false;
    SLOG_DEBUG("http", "Transport opened for {}:{}", host_, port_);
}

void HttpTransport::Close() noexcept {
    if (!open_) {
        return;
    }
    Disconnect();
    socket_impl_.reset();
    open_ = false;
    LOG_DEBUG("http", "Transport closed");
}

void HttpTransport::Disconnect() noexcept {
    if (socket_impl_ && connected_) {
        asio::error_code ec;
        socket_impl_->socket.shutdown(tcp::socket::shutdown_both, ec);
        socket_impl_->socket.close(ec);
        socket_impl_->read_buffer.consume(socket_impl_->read_buffer.size());
    }
    connected_ = false;
}

void HttpTransport::Connect(TimePoint deadline) {
    auto& impl = *socket_impl_;

    tcp::resolver resolver(impl.io_context);
    tcp::resolver::results_type endpoints;
    asio::error_code resolve_ec;
    bool resolved = false;
    resolver.async_resolve(host_, std::to_string(port_),
        [&](const asio::error_code& ec, tcp::resolver::results_type results) {
            resolve_ec = ec;
            endpoints = std::move(results);
            resolved = true;
        });
    impl.RunUntilComplete(resolved, deadline, "resolving " + host_,
                          [&resolver]() { resolver.cancel(); });
    if (resolve_ec) {
        throw TransportError("Failed to resolve " + host_ + ": " + resolve_ec.message());
    }

    asio::error_code connect_ec;
    bool connected = false;
    asio::async_connect(impl.socket, endpoints,
        [&](const asio::error_code& ec, const tcp::endpoint&) {
            connect_ec = ec;
            connected = true;
        });
    impl.RunUntilComplete(connected, deadline,
                          "connecting to " + host_ + ":" + std::to_string(port_));
    if (connect_ec) {
        asio::error_code ignored;
        impl.socket.close(ignored);
        throw TransportError("Connection to " + host_ + ":" + std::to_string(port_) +
                             " failed: " + connect_ec.message());
    }

    asio::error_code ignored;
    impl.socket.set_option(tcp::no_delay(true), ignored);
    impl.read_buffer.consume(impl.read_buffer.size());
    connected_ = true;
    SLOG_DEBUG("http", "Connected to {}:{}", host_, port_);
}

std::string HttpTransport::BuildRequestHead(const HttpRequest& request, const std::string& host_header) {
    std::ostringstream oss;
    oss << request.method << " " << (request.path.empty() ? "/" : request.path) << " HTTP/1.1\r\n"
        << "Host: " << host_header << "\r\n";
    for (const auto& header : request.headers) {
        oss << header.first << ": " << header.second << "\r\n";
    }
    oss << "Content-Length: " << request.body.size() << "\r\n"
        << "Connection: keep-alive\r\n"
        << "\r\n";
    return oss.str();
}

bool HttpTransport::ParseResponseHead(const std::string& head, HttpResponse& response, std::string& error) {
    std::istringstream iss(head);
    std::string status_line;
    if (!std::getline(iss, status_line)) {
        error = "Empty response";
        return false;
    }
    if (!status_line.empty() && status_line.back() == '\r') {
        status_line.pop_back();
    }

    // HTTP/1.1 200 OK
    if (status_line.compare(0, 5, "HTTP/") != 0) {
        error = "Malformed status line: " + status_line;
        return false;
    }
    auto first_space = status_line.find(' ');
    if (first_space == std::string::npos || first_space + 4 > status_line.size()) {
        error = "Malformed status line: " + status_line;
        return false;
    }
    std::string code = status_line.substr(first_space + 1, 3);
    if (!std::all_of(code.begin(), code.end(), IsDigit)) {
        error = "Malformed status code: " + code;
        return false;
    }
    response.status_code = std::stoi(code);
    response.status_text = first_space + 5 <= status_line.size() ? status_line.substr(first_space + 5) : "";

    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            break;
        }
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            error = "Malformed header line: " + line;
            return false;
        }
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t") + 1);
        response.headers.emplace_back(std::move(name), std::move(value));
    }
    return true;
}

bool HttpTransport::ParseChunkSize(const std::string& line, size_t& size) {
    // Chunk extensions after ';' are ignored
    std::string digits = line.substr(0, line.find(';'));
    digits.erase(digits.find_last_not_of(" \t\r\n") + 1);
    if (digits.empty() || digits.size() > 15) {
        return false;
    }
    size = 0;
    for (char c : digits) {
        int nibble;
        if (c >= '0' && c <= '9') nibble = c - '0';
        else if (c >= 'a' && c <= 'f') nibble = c - 'a' + 10;
        else if (c >= 'A' && c <= 'F') nibble = c - 'A' + 10;
        else return false;
        size = (size << 4) | static_cast<size_t>(nibble);
    }
    return true;
}

bool HttpTransport::ParseContentLength(const std::string& text, size_t& length) {
    // Digits only: no sign, no suffix, no list of values
    if (text.empty() || text.size() > 19 || !std::all_of(text.begin(), text.end(), IsDigit)) {
        return false;
    }
    length = static_cast<size_t>(std::stoull(text));
    return true;
}

HttpResponse HttpTransport::Send(const HttpRequest& request) {
    if (!open_) {
        Open();
    }

    auto& impl = *socket_impl_;
    auto deadline = Clock::now() + timeout_;

    if (connected_ && impl.IsStale()) {
        LOG_DEBUG("http", "Kept-alive connection was closed by the server, reconnecting");
        Disconnect();
    }
    if (!connected_) {
        Connect(deadline);
    }

    try {
        // Write request
        std::string head = BuildRequestHead(request, host_ + ":" + std::to_string(port_));
        std::vector<asio::const_buffer> buffers;
        buffers.push_back(asio::buffer(head));
        if (!request.body.empty()) {
            buffers.push_back(asio::buffer(request.body));
        }

        asio::error_code write_ec;
        bool written = false;
        asio::async_write(impl.socket, buffers,
            [&](const asio::error_code& ec, size_t) {
                write_ec = ec;
                written = true;
            });
        impl.RunUntilComplete(written, deadline, "sending request");
        if (write_ec) {
            throw TransportError("Failed to send request: " + write_ec.message());
        }

        // Read status line and headers
        asio::error_code read_ec;
        size_t head_size = 0;
        bool head_read = false;
        asio::async_read_until(impl.socket, impl.read_buffer, "\r\n\r\n",
            [&](const asio::error_code& ec, size_t n) {
                read_ec = ec;
                head_size = n;
                head_read = true;
            });
        impl.RunUntilComplete(head_read, deadline, "waiting for response");
        if (read_ec) {
            throw TransportError("Failed to read response: " + read_ec.message());
        }
        if (head_size > MAX_RESPONSE_HEADER_SIZE) {
            throw TransportError("Response header too large");
        }

        auto data = impl.read_buffer.data();
        std::string response_head(asio::buffers_begin(data), asio::buffers_begin(data) + head_size);
        impl.read_buffer.consume(head_size);

        HttpResponse response;
        std::string error;
        if (!ParseResponseHead(response_head, response, error)) {
            throw TransportError(error);
        }

        ReadBody(response, deadline);

        if (ToLower(response.GetHeader("Connection")) == "close") {
            Disconnect();
        }

        return response;
    } catch (const TransportError&) {
        Disconnect();
        throw;
    }
}

void HttpTransport::ReadBody(HttpResponse& response, TimePoint deadline) {
    auto& impl = *socket_impl_;

    // Ensure at least `count` bytes are buffered
    auto fill = [&](size_t count, const char* what) {
        if (impl.read_buffer.size() >= count) {
            return;
        }
        asio::error_code ec;
        bool done = false;
        asio::async_read(impl.socket, impl.read_buffer,
                         asio::transfer_exactly(count - impl.read_buffer.size()),
            [&](const asio::error_code& e, size_t) {
                ec = e;
                done = true;
            });
        impl.RunUntilComplete(done, deadline, what);
        if (ec) {
            throw TransportError(std::string("Failed reading ") + what + ": " + ec.message());
        }
    };

    auto take = [&](size_t count) {
        auto data = impl.read_buffer.data();
        response.body.insert(response.body.end(), asio::buffers_begin(data),
                             asio::buffers_begin(data) + count);
        impl.read_buffer.consume(count);
    };

    auto read_line = [&]() {
        asio::error_code ec;
        size_t n = 0;
        bool done = false;
        asio::async_read_until(impl.socket, impl.read_buffer, "\r\n",
            [&](const asio::error_code& e, size_t count) {
                ec = e;
                n = count;
                done = true;
            });
        impl.RunUntilComplete(done, deadline, "reading chunk header");
        if (ec) {
            throw TransportError("Failed reading chunk header: " + ec.message());
        }
        auto data = impl.read_buffer.data();
        std::string line(asio::buffers_begin(data), asio::buffers_begin(data) + n);
        impl.read_buffer.consume(n);
        return line;
    };

    std::string transfer_encoding = ToLower(response.GetHeader("Transfer-Encoding"));

    if (transfer_encoding.find("chunked") != std::string::npos) {
        while (true) {
            size_t chunk_size = 0;
            std::string line = read_line();
            if (!ParseChunkSize(line, chunk_size)) {
                throw TransportError("Malformed chunk size: " + line);
            }
            if (chunk_size == 0) {
                // Trailer section ends with an empty line
                while (read_line() != "\r\n") {
                }
                return;
            }
            if (chunk_size > MAX_RESPONSE_BODY_SIZE - response.body.size()) {
                throw TransportError("Response body exceeds " + std::to_string(MAX_RESPONSE_BODY_SIZE) + " bytes");
            }
            fill(chunk_size + 2, "response body");
            take(chunk_size);
            impl.read_buffer.consume(2);  // CRLF after chunk data
        }
    }

    if (response.HasHeader("Content-Length")) {
        size_t length = 0;
        std::string header = response.GetHeader("Content-Length");
        if (!ParseContentLength(header, length)) {
            throw TransportError("Malformed Content-Length: " + header);
        }
        if (length > MAX_RESPONSE_BODY_SIZE) {
            throw TransportError("Response body of " + header + " bytes exceeds " +
                                 std::to_string(MAX_RESPONSE_BODY_SIZE));
        }
        fill(length, "response body");
        take(length);
        return;
    }

    // No framing: body runs until the server closes the connection
    asio::error_code ec;
    bool done = false;
    asio::async_read(impl.socket, impl.read_buffer, asio::transfer_all(),
        [&](const asio::error_code& e, size_t) {
            ec = e;
            done = true;
        });
    impl.RunUntilComplete(done, deadline, "reading response body");
    if (ec && ec != asio::error::eof) {
        throw TransportError("Failed reading response body: " + ec.message());
    }
    if (!ec) {
        // transfer_all only stops short of EOF when the buffer limit is hit
        throw TransportError("Response body exceeds " + std::to_string(MAX_RESPONSE_BODY_SIZE) + " bytes");
    }
    take(impl.read_buffer.size());
    Disconnect();
}

} // namespace surreal_client
