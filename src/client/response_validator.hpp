//===----------------------------------------------------------------------===//
//                         Surreal Client
//
// client/response_validator.hpp
//
// Interpretation of decoded RPC responses
//===----------------------------------------------------------------------===//

#pragma once

#include "types/value.hpp"

namespace surreal_client {

// `operation` is the human-readable label of the failing step ("query",
// "signing in", ...) carried into the raised error.
class ResponseValidator {
public:
    // Throws RemoteError when the payload carries an `error` object
    static void CheckResponseForError(const Value& payload, const std::string& operation);

    // Throws ProtocolError when the payload has no `result` field
    static void CheckResponseForResult(const Value& payload, const std::string& operation);

    // Returns payload.result after CheckResponseForResult
    static const Value& ExtractResult(const Value& payload, const std::string& operation);

    // Returns payload.result[0].result for a single-statement query. The
    // statement's status is not interpreted; a failed statement yields its
    // error text as the result.
    static const Value& UnwrapQueryResult(const Value& payload, const std::string& operation);
};

} // namespace surreal_client
