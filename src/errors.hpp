//===----------------------------------------------------------------------===//
//                         Surreal Client
//
// errors.hpp
//
// Exception types raised by the client
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace surreal_client {

class SurrealException : public std::runtime_error {
public:
    explicit SurrealException(const std::string& message)
        : std::runtime_error(message) {}
};

// Network failure, timeout or non-success HTTP status.
class TransportError : public SurrealException {
public:
    explicit TransportError(const std::string& message, int http_status = 0)
        : SurrealException(message)
        , http_status_(http_status) {}

    // 0 when the request never produced an HTTP status line
    int GetHttpStatus() const { return http_status_; }

private:
    int http_status_;
};

// Response decoded but does not have the shape the operation expects.
class ProtocolError : public SurrealException {
public:
    explicit ProtocolError(const std::string& message)
        : SurrealException(message) {}
};

// Malformed CBOR input.
class CodecError : public ProtocolError {
public:
    explicit CodecError(const std::string& message)
        : ProtocolError("CBOR: " + message) {}
};

// The server answered with an explicit error object.
class RemoteError : public SurrealException {
public:
    RemoteError(int64_t code, const std::string& message, const std::string& operation)
        : SurrealException("Error " + operation + ": " + message + " (code " + std::to_string(code) + ")")
        , code_(code)
        , remote_message_(message)
        , operation_(operation) {}

    int64_t GetCode() const { return code_; }
    const std::string& GetRemoteMessage() const { return remote_message_; }
    const std::string& GetOperation() const { return operation_; }

private:
    int64_t code_;
    std::string remote_message_;
    std::string operation_;
};

// Local precondition on the connection's session state was violated.
class SessionError : public SurrealException {
public:
    explicit SessionError(const std::string& message)
        : SurrealException(message) {}
};

// Invalid endpoint URL or client configuration.
class ConfigError : public SurrealException {
public:
    explicit ConfigError(const std::string& message)
        : SurrealException(message) {}
};

} // namespace surreal_client
