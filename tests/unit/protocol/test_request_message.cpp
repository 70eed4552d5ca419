//===----------------------------------------------------------------------===//
//                         Surreal Client - Unit Tests
//
// tests/unit/protocol/test_request_message.cpp
//
// Unit tests for RPC request envelopes
//===----------------------------------------------------------------------===//

#include "protocol/request_message.hpp"
#include "protocol/codec.hpp"
#include "protocol/cbor.hpp"
#include "errors.hpp"
#include <cassert>
#include <iostream>
#include <cctype>
#include <set>

using namespace surreal_client;

//===----------------------------------------------------------------------===//
// Id Tests
//===----------------------------------------------------------------------===//

void TestGenerateIdFormat() {
    std::cout << "  Testing UUID v4 format..." << std::endl;

    std::string id = RequestMessage::GenerateId();
    assert(id.size() == 36);
    assert(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-');
    assert(id[14] == '4');
    assert(id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b');
    for (size_t i = 0; i < id.size(); i++) {
        if (i == 8 || i == 13 || i == 18 || i == 23) continue;
        assert(std::isxdigit(static_cast<unsigned char>(id[i])) && !std::isupper(static_cast<unsigned char>(id[i])));
    }

    std::cout << "    PASSED" << std::endl;
}

void TestIdsAreUnique() {
    std::cout << "  Testing id uniqueness..." << std::endl;

    std::set<std::string> ids;
    for (int i = 0; i < 10000; i++) {
        ids.insert(RequestMessage::Select(Value("person")).GetId());
    }
    assert(ids.size() == 10000);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Parameter Layout Tests
//===----------------------------------------------------------------------===//

void TestMethodNames() {
    std::cout << "  Testing wire method names..." << std::endl;

    assert(std::string(RequestMethodToString(RequestMethod::SIGN_IN)) == "signin");
    assert(std::string(RequestMethodToString(RequestMethod::SIGN_UP)) == "signup");
    assert(std::string(RequestMethodToString(RequestMethod::INSERT_RELATION)) == "insert_relation");
    assert(std::string(RequestMessage::Info().GetMethodName()) == "info");
    assert(RequestMessage::Version().GetMethod() == RequestMethod::VERSION);

    std::cout << "    PASSED" << std::endl;
}

void TestSimpleLayouts() {
    std::cout << "  Testing simple parameter layouts..." << std::endl;

    auto use = RequestMessage::Use("test", "shop");
    assert(use.GetParams() == (Array{"test", "shop"}));

    assert(RequestMessage::Info().GetParams().empty());
    assert(RequestMessage::Invalidate().GetParams().empty());
    assert(RequestMessage::Authenticate("jwt").GetParams() == (Array{"jwt"}));
    assert(RequestMessage::Let("x", 5).GetParams() == (Array{"x", 5}));
    assert(RequestMessage::Unset("x").GetParams() == (Array{"x"}));

    auto query = RequestMessage::Query("SELECT * FROM $tb", Object{{"tb", "person"}});
    assert(query.GetParams().size() == 2);
    assert(query.GetParams()[0].GetString() == "SELECT * FROM $tb");
    assert(query.GetParams()[1].At("tb").GetString() == "person");

    Value patches(Array{Object{{"op", "replace"}, {"path", "/age"}, {"value", 30}}});
    auto patch = RequestMessage::Patch(Value("person"), patches);
    assert(patch.GetParams() == (Array{"person", patches}));

    auto insert = RequestMessage::Insert(Value("person"), Value(Array{Object{{"name", "a"}}}));
    assert(insert.GetParams().size() == 2);

    std::cout << "    PASSED" << std::endl;
}

void TestOptionalData() {
    std::cout << "  Testing optional data arguments..." << std::endl;

    Value record(RecordID("person", "tobie"));

    // NONE data is omitted entirely
    assert(RequestMessage::Create(record).GetParams().size() == 1);
    assert(RequestMessage::Update(record).GetParams().size() == 1);
    assert(RequestMessage::Upsert(record).GetParams().size() == 1);
    assert(RequestMessage::Merge(record).GetParams().size() == 1);

    // null data is a real argument
    assert(RequestMessage::Update(record, Value::Null()).GetParams().size() == 2);

    Value data(Object{{"name", "Tobie"}});
    auto create = RequestMessage::Create(record, data);
    assert(create.GetParams() == (Array{record, data}));

    std::cout << "    PASSED" << std::endl;
}

void TestSigninCredentials() {
    std::cout << "  Testing signin credentials..." << std::endl;

    // Root user: user/pass only
    SigninParams root;
    root.username = "root";
    root.password = "root";
    auto root_signin = RequestMessage::Signin(root);
    assert(root_signin.GetParams().size() == 1);
    const Value& root_creds = root_signin.GetParams()[0];
    assert(root_creds.Size() == 2);
    assert(root_creds.At("user").GetString() == "root");
    assert(root_creds.At("pass").GetString() == "root");
    assert(!root_creds.Has("NS"));

    // Record access with variables merged into the same object
    SigninParams record;
    record.namespace_ = "test";
    record.database = "shop";
    record.access = "account";
    record.variables = Object{{"email", "a@b.c"}, {"password", "pw"}};
    auto record_signin = RequestMessage::Signin(record);
    const Value& creds = record_signin.GetParams()[0];
    assert(creds.At("NS").GetString() == "test");
    assert(creds.At("DB").GetString() == "shop");
    assert(creds.At("AC").GetString() == "account");
    assert(creds.At("email").GetString() == "a@b.c");
    assert(!creds.Has("user"));
    assert(creds.Size() == 5);

    auto signup = RequestMessage::Signup(Object{{"NS", "test"}});
    assert(signup.GetParams()[0].At("NS").GetString() == "test");

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Envelope Tests
//===----------------------------------------------------------------------===//

void TestEnvelope() {
    std::cout << "  Testing envelope encoding..." << std::endl;

    auto message = RequestMessage::Select(Value(Table("person")));
    Value envelope = message.ToValue();
    assert(envelope.Size() == 3);
    assert(envelope.At("id").GetString() == message.GetId());
    assert(envelope.At("method").GetString() == "select");
    assert(envelope.At("params").At(0).IsTable());

    CborCodec codec;
    assert(std::string(codec.GetMediaType()) == "application/cbor");
    Bytes body = codec.Encode(message);
    assert(cbor::Decode(body) == envelope);

    bool threw = false;
    try {
        codec.Decode(Bytes{});
    } catch (const ProtocolError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== RequestMessage Unit Tests ===" << std::endl;

    std::cout << "\n1. Correlation Ids:" << std::endl;
    TestGenerateIdFormat();
    TestIdsAreUnique();

    std::cout << "\n2. Parameter Layouts:" << std::endl;
    TestMethodNames();
    TestSimpleLayouts();
    TestOptionalData();
    TestSigninCredentials();

    std::cout << "\n3. Envelope:" << std::endl;
    TestEnvelope();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
