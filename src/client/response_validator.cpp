//===----------------------------------------------------------------------===//
//                         Surreal Client
//
// client/response_validator.cpp
//
// Response validation implementation
//===----------------------------------------------------------------------===//

#include "client/response_validator.hpp"
#include "errors.hpp"

namespace surreal_client {

// Server error codes follow JSON-RPC; the message may be missing on older
// servers.
static constexpr int64_t UNKNOWN_ERROR_CODE = -32000;

void ResponseValidator::CheckResponseForError(const Value& payload, const std::string& operation) {
    const Value* error = payload.Find("error");
    if (!error) {
        return;
    }

    int64_t code = UNKNOWN_ERROR_CODE;
    std::string message;

    if (error->IsObject()) {
        const Value* code_value = error->Find("code");
        if (code_value && code_value->IsInt()) {
            code = code_value->GetInt();
        }
        const Value* message_value = error->Find("message");
        if (message_value && message_value->IsString()) {
            message = message_value->GetString();
        } else if (message_value) {
            message = message_value->ToString();
        }
    } else if (error->IsString()) {
        message = error->GetString();
    } else {
        message = error->ToString();
    }

    throw RemoteError(code, message, operation);
}

void ResponseValidator::CheckResponseForResult(const Value& payload, const std::string& operation) {
    if (!payload.Has("result")) {
        throw ProtocolError("No result " + operation + ": response has neither error nor result");
    }
}

const Value& ResponseValidator::ExtractResult(const Value& payload, const std::string& operation) {
    CheckResponseForResult(payload, operation);
    return payload.At("result");
}

const Value& ResponseValidator::UnwrapQueryResult(const Value& payload, const std::string& operation) {
    const Value& statements = ExtractResult(payload, operation);
    if (!statements.IsArray() || statements.Size() == 0) {
        throw ProtocolError("Malformed " + operation + " response: expected a non-empty statement array");
    }

    const Value& first = statements.At(0);
    if (!first.IsObject()) {
        throw ProtocolError("Malformed " + operation + " response: statement is not an object");
    }

    const Value* result = first.Find("result");
    if (!result) {
        throw ProtocolError("Malformed " + operation + " response: statement has no result");
    }
    return *result;
}

} // namespace surreal_client
