//===----------------------------------------------------------------------===//
//                         Surreal Client
//
// client/dispatcher.hpp
//
// Sends encoded envelopes to the RPC endpoint
//===----------------------------------------------------------------------===//

#pragma once

#include "client/session_state.hpp"
#include "network/transport.hpp"
#include "protocol/codec.hpp"

namespace surreal_client {

class TransportDispatcher {
public:
    TransportDispatcher(const SessionState& session, Transport& transport, const Codec& codec)
        : session_(session)
        , transport_(transport)
        , codec_(codec) {}

    // Encode, POST to <endpoint>/rpc, decode. Unless `bypass` is set the
    // decoded payload is checked for an error object before it is returned.
    // Throws TransportError on network failure or a non-2xx status.
    Value Send(const RequestMessage& message, const std::string& operation, bool bypass = false);

    // Request with session-derived headers; reads the session, never writes it
    HttpRequest BuildRequest(const RequestMessage& message) const;

private:
    const SessionState& session_;
    Transport& transport_;
    const Codec& codec_;
};

} // namespace surreal_client
