//===----------------------------------------------------------------------===//
//                         Surreal Client
//
// protocol/codec.cpp
//
// CBOR codec
//===----------------------------------------------------------------------===//

#include "protocol/codec.hpp"
#include "protocol/cbor.hpp"
#include "errors.hpp"

namespace surreal_client {

Bytes CborCodec::Encode(const RequestMessage& message) const {
    return cbor::Encode(message.ToValue());
}

Value CborCodec::Decode(const Bytes& body) const {
    if (body.empty()) {
        throw ProtocolError("Empty response body");
    }
    return cbor::Decode(body);
}

} // namespace surreal_client
