//===----------------------------------------------------------------------===//
//                         Surreal Client
//
// protocol/request_message.cpp
//
// RPC request envelope implementation
//===----------------------------------------------------------------------===//

#include "protocol/request_message.hpp"
#include <cstdio>
#include <random>

namespace surreal_client {

const char* RequestMethodToString(RequestMethod method) {
    switch (method) {
        case RequestMethod::USE:             return "use";
        case RequestMethod::INFO:            return "info";
        case RequestMethod::VERSION:         return "version";
        case RequestMethod::SIGN_UP:         return "signup";
        case RequestMethod::SIGN_IN:         return "signin";
        case RequestMethod::AUTHENTICATE:    return "authenticate";
        case RequestMethod::INVALIDATE:      return "invalidate";
        case RequestMethod::LET:             return "let";
        case RequestMethod::UNSET:           return "unset";
        case RequestMethod::QUERY:           return "query";
        case RequestMethod::CREATE:          return "create";
        case RequestMethod::SELECT:          return "select";
        case RequestMethod::UPDATE:          return "update";
        case RequestMethod::UPSERT:          return "upsert";
        case RequestMethod::MERGE:           return "merge";
        case RequestMethod::PATCH:           return "patch";
        case RequestMethod::DELETE:          return "delete";
        case RequestMethod::INSERT:          return "insert";
        case RequestMethod::INSERT_RELATION: return "insert_relation";
        default:                             return "unknown";
    }
}

//===----------------------------------------------------------------------===//
// RequestMessage
//===----------------------------------------------------------------------===//
RequestMessage::RequestMessage(RequestMethod method, Array params)
    : id_(GenerateId())
    , method_(method)
    , params_(std::move(params)) {}

std::string RequestMessage::GenerateId() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t hi = rng();
    uint64_t lo = rng();

    // Version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return std::string(buf);
}

Value RequestMessage::ToValue() const {
    Object envelope;
    envelope.Set("id", Value(id_));
    envelope.Set("method", Value(GetMethodName()));
    envelope.Set("params", Value(params_));
    return Value(std::move(envelope));
}

static Array WithOptionalData(const Value& thing, const Value& data) {
    Array params{thing};
    if (!data.IsNone()) {
        params.push_back(data);
    }
    return params;
}

RequestMessage RequestMessage::Use(const std::string& ns, const std::string& db) {
    return RequestMessage(RequestMethod::USE, Array{Value(ns), Value(db)});
}

RequestMessage RequestMessage::Info() {
    return RequestMessage(RequestMethod::INFO, Array{});
}

RequestMessage RequestMessage::Version() {
    return RequestMessage(RequestMethod::VERSION, Array{});
}

RequestMessage RequestMessage::Signup(const Object& vars) {
    return RequestMessage(RequestMethod::SIGN_UP, Array{Value(vars)});
}

RequestMessage RequestMessage::Signin(const SigninParams& params) {
    Object credentials;
    if (params.namespace_) credentials.Set("NS", Value(*params.namespace_));
    if (params.database) credentials.Set("DB", Value(*params.database));
    if (params.access) credentials.Set("AC", Value(*params.access));
    if (params.username) credentials.Set("user", Value(*params.username));
    if (params.password) credentials.Set("pass", Value(*params.password));
    for (const auto& entry : params.variables) {
        credentials.Set(entry.first, entry.second);
    }
    return RequestMessage(RequestMethod::SIGN_IN, Array{Value(std::move(credentials))});
}

RequestMessage RequestMessage::Authenticate(const std::string& token) {
    return RequestMessage(RequestMethod::AUTHENTICATE, Array{Value(token)});
}

RequestMessage RequestMessage::Invalidate() {
    return RequestMessage(RequestMethod::INVALIDATE, Array{});
}

RequestMessage RequestMessage::Let(const std::string& key, const Value& value) {
    return RequestMessage(RequestMethod::LET, Array{Value(key), value});
}

RequestMessage RequestMessage::Unset(const std::string& key) {
    return RequestMessage(RequestMethod::UNSET, Array{Value(key)});
}

RequestMessage RequestMessage::Query(const std::string& query, const Object& vars) {
    return RequestMessage(RequestMethod::QUERY, Array{Value(query), Value(vars)});
}

RequestMessage RequestMessage::Create(const Value& collection, const Value& data) {
    return RequestMessage(RequestMethod::CREATE, WithOptionalData(collection, data));
}

RequestMessage RequestMessage::Select(const Value& thing) {
    return RequestMessage(RequestMethod::SELECT, Array{thing});
}

RequestMessage RequestMessage::Update(const Value& thing, const Value& data) {
    return RequestMessage(RequestMethod::UPDATE, WithOptionalData(thing, data));
}

RequestMessage RequestMessage::Upsert(const Value& thing, const Value& data) {
    return RequestMessage(RequestMethod::UPSERT, WithOptionalData(thing, data));
}

RequestMessage RequestMessage::Merge(const Value& thing, const Value& data) {
    return RequestMessage(RequestMethod::MERGE, WithOptionalData(thing, data));
}

RequestMessage RequestMessage::Patch(const Value& thing, const Value& patches) {
    return RequestMessage(RequestMethod::PATCH, Array{thing, patches});
}

RequestMessage RequestMessage::Delete(const Value& thing) {
    return RequestMessage(RequestMethod::DELETE, Array{thing});
}

RequestMessage RequestMessage::Insert(const Value& table, const Value& data) {
    return RequestMessage(RequestMethod::INSERT, Array{table, data});
}

RequestMessage RequestMessage::InsertRelation(const Value& table, const Value& data) {
    return RequestMessage(RequestMethod::INSERT_RELATION, Array{table, data});
}

} // namespace surreal_client
