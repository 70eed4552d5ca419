//===----------------------------------------------------------------------===//
//                         Surreal Client
//
// client/connection.cpp
//
// Blocking HTTP connection implementation
//===----------------------------------------------------------------------===//

#include "client/connection.hpp"
#include "client/response_validator.hpp"
#include "errors.hpp"
#include "logging/logger.hpp"
#include "network/http_transport.hpp"

namespace surreal_client {

//===----------------------------------------------------------------------===//
// Thing normalization
//===----------------------------------------------------------------------===//

Value NormalizeThing(const Thing& thing) {
    if (auto text = std::get_if<std::string>(&thing)) {
        if (text->find(':') != std::string::npos) {
            return Value(RecordID::Parse(*text));
        }
        return Value(*text);
    }
    if (auto record = std::get_if<RecordID>(&thing)) {
        return Value(*record);
    }
    return Value(std::get<Table>(thing));
}

Value NormalizeTable(const TableRef& table) {
    if (auto text = std::get_if<std::string>(&table)) {
        return Value(*text);
    }
    return Value(std::get<Table>(table));
}

//===----------------------------------------------------------------------===//
// Construction
//===----------------------------------------------------------------------===//

static Url ParseHttpEndpoint(const std::string& url) {
    Url endpoint = Url::Parse(url);
    if (endpoint.GetScheme() != UrlScheme::HTTP) {
        throw ConfigError("Unsupported scheme for blocking HTTP connection: " + url +
                          " (only http:// is supported)");
    }
    return endpoint;
}

static std::unique_ptr<Transport> RequireTransport(std::unique_ptr<Transport> transport) {
    if (!transport) {
        throw ConfigError("Connection requires a transport");
    }
    return transport;
}

BlockingHttpConnection::BlockingHttpConnection(const std::string& url, std::chrono::milliseconds timeout)
    : session_(ParseHttpEndpoint(url))
    , transport_(std::make_unique<HttpTransport>(session_.endpoint.GetHost(), session_.endpoint.GetPort(), timeout))
    , codec_(std::make_unique<CborCodec>())
    , dispatcher_(session_, *transport_, *codec_) {
    LOG_DEBUG("connection", "Created connection to " + session_.endpoint.GetRawUrl());
}

BlockingHttpConnection::BlockingHttpConnection(const std::string& url,
                                               std::unique_ptr<Transport> transport,
                                               std::unique_ptr<Codec> codec)
    : session_(ParseHttpEndpoint(url))
    , transport_(RequireTransport(std::move(transport)))
    , codec_(codec ? std::move(codec) : std::make_unique<CborCodec>())
    , dispatcher_(session_, *transport_, *codec_) {}

BlockingHttpConnection::~BlockingHttpConnection() {
    Close();
}

//===----------------------------------------------------------------------===//
// Lifecycle
//===----------------------------------------------------------------------===//

void BlockingHttpConnection::Open() {
    if (!transport_->IsOpen()) {
        transport_->Open();
        LOG_DEBUG("connection", "Opened " + session_.endpoint.GetRawUrl());
    }
}

void BlockingHttpConnection::Close() noexcept {
    if (transport_ && transport_->IsOpen()) {
        transport_->Close();
    }
}

bool BlockingHttpConnection::IsOpen() const {
    return transport_->IsOpen();
}

//===----------------------------------------------------------------------===//
// Dispatch helpers
//===----------------------------------------------------------------------===//

Value BlockingHttpConnection::Call(const RequestMessage& message, const std::string& operation, bool bypass) {
    session_.last_correlation_id = message.GetId();
    Open();
    return dispatcher_.Send(message, operation, bypass);
}

Value BlockingHttpConnection::CallForResult(const RequestMessage& message, const std::string& operation) {
    Value payload = Call(message, operation);
    return ResponseValidator::ExtractResult(payload, operation);
}

std::string BlockingHttpConnection::TokenFromResult(const Value& result, const std::string& operation) {
    if (result.IsString()) {
        return result.GetString();
    }
    // Newer servers answer with {token, refresh}
    if (result.IsObject()) {
        const Value* token = result.Find("token");
        if (token && token->IsString()) {
            return token->GetString();
        }
    }
    throw ProtocolError("Unexpected " + operation + " result: expected a token, got " +
                        Value::TypeToString(result.GetType()));
}

//===----------------------------------------------------------------------===//
// Authentication
//===----------------------------------------------------------------------===//

void BlockingHttpConnection::SetToken(const std::string& token) {
    session_.auth_token = token;
}

std::string BlockingHttpConnection::Authenticate(const std::string& token) {
    CallForResult(RequestMessage::Authenticate(token), "authenticating");
    session_.auth_token = token;
    return token;
}

void BlockingHttpConnection::Invalidate() {
    CallForResult(RequestMessage::Invalidate(), "invalidating");
    session_.auth_token.reset();
}

std::string BlockingHttpConnection::Signup(const Object& vars) {
    Value result = CallForResult(RequestMessage::Signup(vars), "signup");
    std::string token = TokenFromResult(result, "signup");
    session_.auth_token = token;
    return token;
}

std::string BlockingHttpConnection::Signin(const SigninParams& params) {
    Value result = CallForResult(RequestMessage::Signin(params), "signing in");
    std::string token = TokenFromResult(result, "signing in");
    session_.auth_token = token;
    LOG_DEBUG("connection", "Signed in to " + session_.endpoint.GetRawUrl());
    return token;
}

std::string BlockingHttpConnection::Signin(const Object& vars) {
    auto text_field = [&vars](const char* key) -> std::optional<std::string> {
        const Value* value = vars.Find(key);
        if (!value || value->IsNone() || value->IsNull()) {
            return std::nullopt;
        }
        if (!value->IsString()) {
            throw SessionError(std::string("Signin field '") + key + "' must be a string");
        }
        return value->GetString();
    };

    SigninParams params;
    params.username = text_field("username");
    params.password = text_field("password");
    params.access = text_field("access");
    params.database = text_field("database");
    params.namespace_ = text_field("namespace");
    if (const Value* variables = vars.Find("variables")) {
        if (!variables->IsObject()) {
            throw SessionError("Signin field 'variables' must be an object");
        }
        params.variables = variables->GetObject();
    }
    return Signin(params);
}

//===----------------------------------------------------------------------===//
// Session scope and variables
//===----------------------------------------------------------------------===//

void BlockingHttpConnection::Use(const std::string& ns, const std::string& db) {
    CallForResult(RequestMessage::Use(ns, db), "use");
    session_.SetScope(ns, db);
    LOG_DEBUG("connection", "Using " + ns + "/" + db);
}

void BlockingHttpConnection::Let(const std::string& key, Value value) {
    session_.bound_variables[key] = std::move(value);
}

void BlockingHttpConnection::Unset(const std::string& key) {
    if (session_.bound_variables.erase(key) == 0) {
        throw SessionError("Variable '" + key + "' is not set");
    }
}

//===----------------------------------------------------------------------===//
// Queries and record operations
//===----------------------------------------------------------------------===//

Value BlockingHttpConnection::Query(const std::string& query, const Object& vars) {
    Value payload = Call(RequestMessage::Query(query, session_.MergeVariables(vars)), "query");
    return ResponseValidator::UnwrapQueryResult(payload, "query");
}

Value BlockingHttpConnection::QueryRaw(const std::string& query, const Object& params) {
    return Call(RequestMessage::Query(query, session_.MergeVariables(params)), "query", true);
}

Value BlockingHttpConnection::Create(const Thing& thing, const Value& data) {
    return CallForResult(RequestMessage::Create(NormalizeThing(thing), data), "create");
}

Value BlockingHttpConnection::Select(const Thing& thing) {
    return CallForResult(RequestMessage::Select(NormalizeThing(thing)), "select");
}

Value BlockingHttpConnection::Update(const Thing& thing, const Value& data) {
    return CallForResult(RequestMessage::Update(NormalizeThing(thing), data), "update");
}

Value BlockingHttpConnection::Upsert(const Thing& thing, const Value& data) {
    return CallForResult(RequestMessage::Upsert(NormalizeThing(thing), data), "upsert");
}

Value BlockingHttpConnection::Merge(const Thing& thing, const Value& data) {
    return CallForResult(RequestMessage::Merge(NormalizeThing(thing), data), "merge");
}

Value BlockingHttpConnection::Patch(const Thing& thing, const Value& patches) {
    return CallForResult(RequestMessage::Patch(NormalizeThing(thing), patches), "patch");
}

Value BlockingHttpConnection::Delete(const Thing& thing) {
    return CallForResult(RequestMessage::Delete(NormalizeThing(thing)), "delete");
}

Value BlockingHttpConnection::Insert(const TableRef& table, const Value& data) {
    return CallForResult(RequestMessage::Insert(NormalizeTable(table), data), "insert");
}

Value BlockingHttpConnection::InsertRelation(const TableRef& table, const Value& data) {
    return CallForResult(RequestMessage::InsertRelation(NormalizeTable(table), data), "insert_relation");
}

Value BlockingHttpConnection::Info() {
    return CallForResult(RequestMessage::Info(), "getting database information");
}

Value BlockingHttpConnection::Version() {
    return CallForResult(RequestMessage::Version(), "getting database version");
}

} // namespace surreal_client
