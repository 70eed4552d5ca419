//===----------------------------------------------------------------------===//
//                         Surreal Client
//
// client/connection.hpp
//
// Blocking HTTP connection: one method per RPC verb
//===----------------------------------------------------------------------===//

#pragma once

#include "client/dispatcher.hpp"
#include "client/session_state.hpp"
#include "network/transport.hpp"
#include "protocol/codec.hpp"
#include <variant>

namespace surreal_client {

// Record-addressing argument. A string containing ':' names a single record
// ("person:tobie"); any other string names a table.
using Thing = std::variant<std::string, RecordID, Table>;

// Table argument of insert/insert_relation
using TableRef = std::variant<std::string, Table>;

// Resolve a Thing to the value placed in the envelope. Splits a string once
// on its first ':' into a RecordID; strings without ':' pass through.
Value NormalizeThing(const Thing& thing);
Value NormalizeTable(const TableRef& table);

//===----------------------------------------------------------------------===//
// BlockingHttpConnection
//
// Owns its session state and transport. The transport is acquired by Open()
// (or lazily by the first call) and released by Close() or the destructor.
// One call at a time; use separate connections for concurrency.
//===----------------------------------------------------------------------===//
class BlockingHttpConnection {
public:
    // Throws ConfigError for an invalid URL or a scheme the HTTP transport
    // cannot serve.
    explicit BlockingHttpConnection(const std::string& url,
                                    std::chrono::milliseconds timeout =
                                        std::chrono::milliseconds(DEFAULT_REQUEST_TIMEOUT_MS));

    // Custom transport/codec; codec defaults to CBOR
    BlockingHttpConnection(const std::string& url,
                           std::unique_ptr<Transport> transport,
                           std::unique_ptr<Codec> codec = nullptr);

    ~BlockingHttpConnection();

    // Non-copyable
    BlockingHttpConnection(const BlockingHttpConnection&) = delete;
    BlockingHttpConnection& operator=(const BlockingHttpConnection&) = delete;

    //===------------------------------------------------------------------===//
    // Lifecycle
    //===------------------------------------------------------------------===//
    void Open();
    void Close() noexcept;
    bool IsOpen() const;

    //===------------------------------------------------------------------===//
    // Authentication
    //===------------------------------------------------------------------===//
    // Stores a token locally without contacting the server
    void SetToken(const std::string& token);

    // Returns the accepted token
    std::string Authenticate(const std::string& token);
    void Invalidate();
    std::string Signup(const Object& vars);
    std::string Signin(const SigninParams& params);

    // Keys: username, password, access, database, namespace, variables
    std::string Signin(const Object& vars);

    //===------------------------------------------------------------------===//
    // Session scope and variables
    //===------------------------------------------------------------------===//
    void Use(const std::string& ns, const std::string& db);
    void Let(const std::string& key, Value value);

    // Throws SessionError when `key` is not bound
    void Unset(const std::string& key);

    //===------------------------------------------------------------------===//
    // Queries and record operations
    //===------------------------------------------------------------------===//
    // Result of the first statement
    Value Query(const std::string& query, const Object& vars = Object());

    // Whole decoded response; server errors are returned, not raised
    Value QueryRaw(const std::string& query, const Object& params = Object());

    Value Create(const Thing& thing, const Value& data = Value());
    Value Select(const Thing& thing);
    Value Update(const Thing& thing, const Value& data = Value());
    Value Upsert(const Thing& thing, const Value& data = Value());
    Value Merge(const Thing& thing, const Value& data = Value());
    Value Patch(const Thing& thing, const Value& patches = Value(Array{}));
    Value Delete(const Thing& thing);
    Value Insert(const TableRef& table, const Value& data);
    Value InsertRelation(const TableRef& table, const Value& data);

    Value Info();
    Value Version();

    //===------------------------------------------------------------------===//
    // Session inspection
    //===------------------------------------------------------------------===//
    const SessionState& GetSession() const { return session_; }
    const std::string& GetLastCorrelationId() const { return session_.last_correlation_id; }

private:
    // Record the id, lazily open the transport and dispatch
    Value Call(const RequestMessage& message, const std::string& operation, bool bypass = false);

    // Validated `result` of a non-query call
    Value CallForResult(const RequestMessage& message, const std::string& operation);

    static std::string TokenFromResult(const Value& result, const std::string& operation);

    SessionState session_;
    std::unique_ptr<Transport> transport_;
    std::unique_ptr<Codec> codec_;
    TransportDispatcher dispatcher_;
};

} // namespace surreal_client
