//===----------------------------------------------------------------------===//
//                         Surreal Client - Unit Tests
//
// tests/unit/client/test_response_validator.cpp
//
// Unit tests for ResponseValidator
//===----------------------------------------------------------------------===//

#include "client/response_validator.hpp"
#include "errors.hpp"
#include <cassert>
#include <iostream>

using namespace surreal_client;

//===----------------------------------------------------------------------===//
// Error Checks
//===----------------------------------------------------------------------===//

void TestNoError() {
    std::cout << "  Testing payload without error..." << std::endl;

    Value payload(Object{{"id", "1"}, {"result", "ok"}});
    ResponseValidator::CheckResponseForError(payload, "select");
    ResponseValidator::CheckResponseForResult(payload, "select");

    std::cout << "    PASSED" << std::endl;
}

void TestErrorObject() {
    std::cout << "  Testing error object..." << std::endl;

    Value payload(Object{
        {"id", "1"},
        {"error", Object{{"code", 100}, {"message", "There was a problem with authentication"}}}
    });

    bool threw = false;
    try {
        ResponseValidator::CheckResponseForError(payload, "signing in");
    } catch (const RemoteError& e) {
        threw = true;
        assert(e.GetCode() == 100);
        assert(e.GetRemoteMessage() == "There was a problem with authentication");
        assert(e.GetOperation() == "signing in");
        assert(std::string(e.what()) ==
               "Error signing in: There was a problem with authentication (code 100)");
    }
    assert(threw);

    std::cout << "    PASSED" << std::endl;
}

void TestErrorShapes() {
    std::cout << "  Testing unusual error shapes..." << std::endl;

    // Bare string error, default code
    Value text(Object{{"error", "boom"}});
    bool threw = false;
    try {
        ResponseValidator::CheckResponseForError(text, "query");
    } catch (const RemoteError& e) {
        threw = true;
        assert(e.GetCode() == -32000);
        assert(e.GetRemoteMessage() == "boom");
    }
    assert(threw);

    // Error object without a message
    Value coded(Object{{"error", Object{{"code", -32602}}}});
    threw = false;
    try {
        ResponseValidator::CheckResponseForError(coded, "query");
    } catch (const RemoteError& e) {
        threw = true;
        assert(e.GetCode() == -32602);
        assert(e.GetRemoteMessage().empty());
    }
    assert(threw);

    // A remote error is also a SurrealException
    threw = false;
    try {
        ResponseValidator::CheckResponseForError(text, "query");
    } catch (const SurrealException&) {
        threw = true;
    }
    assert(threw);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Result Extraction
//===----------------------------------------------------------------------===//

void TestExtractResult() {
    std::cout << "  Testing ExtractResult..." << std::endl;

    Value payload(Object{{"result", Array{1, 2}}});
    assert(ResponseValidator::ExtractResult(payload, "select") == Value(Array{1, 2}));

    // An explicit null result still counts as present
    Value null_result(Object{{"result", nullptr}});
    assert(ResponseValidator::ExtractResult(null_result, "delete").IsNull());

    Value empty(Object{{"id", "1"}});
    bool threw = false;
    try {
        ResponseValidator::ExtractResult(empty, "create");
    } catch (const ProtocolError& e) {
        threw = true;
        assert(std::string(e.what()).find("No result create") == 0);
    }
    assert(threw);

    std::cout << "    PASSED" << std::endl;
}

void TestUnwrapQueryResult() {
    std::cout << "  Testing UnwrapQueryResult..." << std::endl;

    Value rows(Array{Object{{"name", "Tobie"}}});
    Value payload(Object{{"result", Array{
        Object{{"status", "OK"}, {"time", "1ms"}, {"result", rows}},
        Object{{"status", "OK"}, {"time", "1ms"}, {"result", Array{}}},
    }}});

    // Only the first statement is returned
    assert(ResponseValidator::UnwrapQueryResult(payload, "query") == rows);

    std::cout << "    PASSED" << std::endl;
}

void TestUnwrapQueryErrors() {
    std::cout << "  Testing UnwrapQueryResult errors..." << std::endl;

    auto expect_protocol_error = [](const Value& payload) {
        bool threw = false;
        try {
            ResponseValidator::UnwrapQueryResult(payload, "query");
        } catch (const ProtocolError&) {
            threw = true;
        }
        assert(threw);
    };

    expect_protocol_error(Value(Object{{"id", "1"}}));
    expect_protocol_error(Value(Object{{"result", Array{}}}));
    expect_protocol_error(Value(Object{{"result", "not a list"}}));
    expect_protocol_error(Value(Object{{"result", Array{5}}}));
    expect_protocol_error(Value(Object{{"result", Array{Object{{"status", "OK"}}}}}));

    // A failed statement is unwrapped like any other; its text is the result
    Value failed(Object{{"result", Array{
        Object{{"status", "ERR"}, {"result", "There was a problem"}}
    }}});
    const Value& unwrapped = ResponseValidator::UnwrapQueryResult(failed, "query");
    assert(unwrapped.IsString());
    assert(unwrapped.GetString() == "There was a problem");

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== ResponseValidator Unit Tests ===" << std::endl;

    std::cout << "\n1. Error Checks:" << std::endl;
    TestNoError();
    TestErrorObject();
    TestErrorShapes();

    std::cout << "\n2. Result Extraction:" << std::endl;
    TestExtractResult();
    TestUnwrapQueryResult();
    TestUnwrapQueryErrors();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
