//===----------------------------------------------------------------------===//
//                         Surreal Client
//
// client/dispatcher.cpp
//
// Transport dispatcher implementation
//===----------------------------------------------------------------------===//

#include "client/dispatcher.hpp"
#include "client/response_validator.hpp"
#include "errors.hpp"
#include "logging/logger.hpp"

namespace surreal_client {

HttpRequest TransportDispatcher::BuildRequest(const RequestMessage& message) const {
    HttpRequest request;
    request.method = "POST";
    request.path = session_.endpoint.ResolvePath(RPC_PATH);
    request.headers.emplace_back("Accept", codec_.GetMediaType());
    request.headers.emplace_back("Content-Type", codec_.GetMediaType());

    if (session_.HasToken()) {
        request.headers.emplace_back("Authorization", "Bearer " + *session_.auth_token);
    }
    if (session_.HasScope()) {
        request.headers.emplace_back(NAMESPACE_HEADER, *session_.namespace_);
        request.headers.emplace_back(DATABASE_HEADER, *session_.database);
    }

    request.body = codec_.Encode(message);
    return request;
}

Value TransportDispatcher::Send(const RequestMessage& message, const std::string& operation, bool bypass) {
    HttpRequest request = BuildRequest(message);
    auto start = Clock::now();

    HttpResponse response;
    try {
        response = transport_.Send(request);
    } catch (const TransportError& e) {
        SLOG_WARN("rpc", "{} ({}) failed: {}", message.GetMethodName(), message.GetId(), e.what());
        throw;
    }

    auto elapsed_us = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start).count();
    SLOG_DEBUG("rpc", "{} ({}) -> HTTP {} in {}us, {} bytes",
               message.GetMethodName(), message.GetId(), response.status_code,
               elapsed_us, response.body.size());

    if (!response.IsSuccess()) {
        std::string error = "HTTP " + std::to_string(response.status_code);
        if (!response.status_text.empty()) {
            error += " " + response.status_text;
        }
        error += " from " + session_.endpoint.GetRawUrl() + RPC_PATH + " while " + operation;
        SLOG_WARN("rpc", "{}", error);
        throw TransportError(error, response.status_code);
    }

    Value payload = codec_.Decode(response.body);
    if (!payload.IsObject()) {
        throw ProtocolError("Response to " + operation + " is not an object: " +
                            Value::TypeToString(payload.GetType()));
    }

    if (!bypass) {
        try {
            ResponseValidator::CheckResponseForError(payload, operation);
        } catch (const RemoteError& e) {
            SLOG_WARN("rpc", "{} ({}) returned error {}: {}", message.GetMethodName(), message.GetId(),
                      e.GetCode(), e.GetRemoteMessage());
            throw;
        }
    }

    return payload;
}

} // namespace surreal_client
