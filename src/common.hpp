//===----------------------------------------------------------------------===//
//                         Surreal Client
//
// common.hpp
//
// Common definitions and includes for the Surreal client
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <functional>
#include <chrono>

namespace surreal_client {

// Type aliases
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;
using Bytes = std::vector<uint8_t>;

// Forward declarations
class Value;
class Codec;
class Transport;
class RequestMessage;
class BlockingHttpConnection;
struct SessionState;
struct ClientConfig;

// Constants
constexpr const char* CLIENT_VERSION = "0.3.0";
constexpr const char* RPC_PATH = "/rpc";
constexpr const char* CBOR_MEDIA_TYPE = "application/cbor";
constexpr const char* NAMESPACE_HEADER = "Surreal-NS";
constexpr const char* DATABASE_HEADER = "Surreal-DB";
constexpr const char* DEFAULT_URL = "http://localhost:8000";
constexpr uint32_t DEFAULT_REQUEST_TIMEOUT_MS = 30000;  // 30 seconds
constexpr size_t MAX_RESPONSE_BODY_SIZE = 256 * 1024 * 1024;  // 256MB
constexpr size_t MAX_RESPONSE_HEADER_SIZE = 65536;

} // namespace surreal_client
