//===----------------------------------------------------------------------===//
//                         Surreal Client
//
// protocol/request_message.hpp
//
// RPC request envelope: correlation id, method and ordered parameters
//===----------------------------------------------------------------------===//

#pragma once

#include "types/value.hpp"
#include <optional>

namespace surreal_client {

//===----------------------------------------------------------------------===//
// RPC Methods
//===----------------------------------------------------------------------===//
enum class RequestMethod : uint8_t {
    USE,
    INFO,
    VERSION,
    SIGN_UP,
    SIGN_IN,
    AUTHENTICATE,
    INVALIDATE,
    LET,
    UNSET,
    QUERY,
    CREATE,
    SELECT,
    UPDATE,
    UPSERT,
    MERGE,
    PATCH,
    DELETE,
    INSERT,
    INSERT_RELATION
};

// Wire name of a method ("use", "signin", "insert_relation", ...)
const char* RequestMethodToString(RequestMethod method);

// Credentials for signin, in the order the server's access methods consume
// them. Unset fields are left out of the envelope.
struct SigninParams {
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::optional<std::string> access;
    std::optional<std::string> database;
    std::optional<std::string> namespace_;
    Object variables;
};

//===----------------------------------------------------------------------===//
// RequestMessage
//===----------------------------------------------------------------------===//
class RequestMessage {
public:
    // Generates a fresh correlation id
    RequestMessage(RequestMethod method, Array params);

    const std::string& GetId() const { return id_; }
    RequestMethod GetMethod() const { return method_; }
    const char* GetMethodName() const { return RequestMethodToString(method_); }
    const Array& GetParams() const { return params_; }

    // {"id": ..., "method": ..., "params": [...]}
    Value ToValue() const;

    //===------------------------------------------------------------------===//
    // Builders, one per method. Optional data arguments that are NONE are
    // omitted from the parameter list.
    //===------------------------------------------------------------------===//
    static RequestMessage Use(const std::string& ns, const std::string& db);
    static RequestMessage Info();
    static RequestMessage Version();
    static RequestMessage Signup(const Object& vars);
    static RequestMessage Signin(const SigninParams& params);
    static RequestMessage Authenticate(const std::string& token);
    static RequestMessage Invalidate();
    static RequestMessage Let(const std::string& key, const Value& value);
    static RequestMessage Unset(const std::string& key);
    static RequestMessage Query(const std::string& query, const Object& vars);
    static RequestMessage Create(const Value& collection, const Value& data = Value());
    static RequestMessage Select(const Value& thing);
    static RequestMessage Update(const Value& thing, const Value& data = Value());
    static RequestMessage Upsert(const Value& thing, const Value& data = Value());
    static RequestMessage Merge(const Value& thing, const Value& data = Value());
    static RequestMessage Patch(const Value& thing, const Value& patches);
    static RequestMessage Delete(const Value& thing);
    static RequestMessage Insert(const Value& table, const Value& data);
    static RequestMessage InsertRelation(const Value& table, const Value& data);

    // Random RFC 4122 version 4 UUID in canonical text form
    static std::string GenerateId();

private:
    std::string id_;
    RequestMethod method_;
    Array params_;
};

} // namespace surreal_client
