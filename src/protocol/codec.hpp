//===----------------------------------------------------------------------===//
//                         Surreal Client
//
// protocol/codec.hpp
//
// Envelope/payload serialization interface
//===----------------------------------------------------------------------===//

#pragma once

#include "protocol/request_message.hpp"

namespace surreal_client {

class Codec {
public:
    virtual ~Codec() = default;

    // Media type sent in Content-Type and Accept
    virtual const char* GetMediaType() const = 0;

    virtual Bytes Encode(const RequestMessage& message) const = 0;

    // Throws ProtocolError (or a subclass) on undecodable input
    virtual Value Decode(const Bytes& body) const = 0;
};

class CborCodec : public Codec {
public:
    const char* GetMediaType() const override { return CBOR_MEDIA_TYPE; }

    Bytes Encode(const RequestMessage& message) const override;
    Value Decode(const Bytes& body) const override;
};

} // namespace surreal_client
