//===----------------------------------------------------------------------===//
//                         Surreal Client - Unit Tests
//
// tests/unit/protocol/test_cbor.cpp
//
// Unit tests for the CBOR writer and reader
//===----------------------------------------------------------------------===//

#include "protocol/cbor.hpp"
#include "errors.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using namespace surreal_client;
using namespace surreal_client::cbor;

static bool ThrowsCodecError(const std::vector<uint8_t>& data) {
    try {
        Decode(data);
    } catch (const CodecError&) {
        return true;
    }
    return false;
}

//===----------------------------------------------------------------------===//
// Writer Tests
//===----------------------------------------------------------------------===//

void TestWriteIntegers() {
    std::cout << "  Testing integer encoding..." << std::endl;

    assert(Encode(Value(0)) == (std::vector<uint8_t>{0x00}));
    assert(Encode(Value(23)) == (std::vector<uint8_t>{0x17}));
    assert(Encode(Value(24)) == (std::vector<uint8_t>{0x18, 0x18}));
    assert(Encode(Value(1000)) == (std::vector<uint8_t>{0x19, 0x03, 0xe8}));
    assert(Encode(Value(1000000)) == (std::vector<uint8_t>{0x1a, 0x00, 0x0f, 0x42, 0x40}));
    assert(Encode(Value(-1)) == (std::vector<uint8_t>{0x20}));
    assert(Encode(Value(-100)) == (std::vector<uint8_t>{0x38, 0x63}));

    int64_t min = std::numeric_limits<int64_t>::min();
    assert(Encode(Value(min)) ==
           (std::vector<uint8_t>{0x3b, 0x7f, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff}));

    std::cout << "    PASSED" << std::endl;
}

void TestWriteScalars() {
    std::cout << "  Testing scalar encoding..." << std::endl;

    assert(Encode(Value(false)) == (std::vector<uint8_t>{0xf4}));
    assert(Encode(Value(true)) == (std::vector<uint8_t>{0xf5}));
    assert(Encode(Value::Null()) == (std::vector<uint8_t>{0xf6}));
    assert(Encode(Value("IETF")) == (std::vector<uint8_t>{0x64, 'I', 'E', 'T', 'F'}));
    assert(Encode(Value(Bytes{0x01, 0x02})) == (std::vector<uint8_t>{0x42, 0x01, 0x02}));
    assert(Encode(Value(1.1)) ==
           (std::vector<uint8_t>{0xfb, 0x3f, 0xf1, 0x99, 0x99, 0x99, 0x99, 0x99, 0x9a}));

    std::cout << "    PASSED" << std::endl;
}

void TestWriteContainers() {
    std::cout << "  Testing container encoding..." << std::endl;

    assert(Encode(Value(Array{})) == (std::vector<uint8_t>{0x80}));
    assert(Encode(Value(Array{1, 2, 3})) == (std::vector<uint8_t>{0x83, 0x01, 0x02, 0x03}));

    // Keys are written in insertion order
    Value obj(Object{{"b", 1}, {"a", 2}});
    assert(Encode(obj) == (std::vector<uint8_t>{0xa2, 0x61, 'b', 0x01, 0x61, 'a', 0x02}));

    std::cout << "    PASSED" << std::endl;
}

void TestWriteSurrealTags() {
    std::cout << "  Testing Surreal tag encoding..." << std::endl;

    // NONE -> tag 6 wrapping null
    assert(Encode(Value::None()) == (std::vector<uint8_t>{0xc6, 0xf6}));

    // Table -> tag 7 wrapping the name
    assert(Encode(Value(Table("user"))) == (std::vector<uint8_t>{0xc7, 0x64, 'u', 's', 'e', 'r'}));

    // RecordID -> tag 8 wrapping [table, id]
    assert(Encode(Value(RecordID("a", 1))) == (std::vector<uint8_t>{0xc8, 0x82, 0x61, 'a', 0x01}));
    assert(Encode(Value(RecordID("a", "b"))) ==
           (std::vector<uint8_t>{0xc8, 0x82, 0x61, 'a', 0x61, 'b'}));

    // Uninterpreted tags pass through
    assert(Encode(Value(TaggedValue(37, Bytes{0xff}))) == (std::vector<uint8_t>{0xd8, 0x25, 0x41, 0xff}));

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Reader Tests
//===----------------------------------------------------------------------===//

void TestReadScalars() {
    std::cout << "  Testing scalar decoding..." << std::endl;

    assert(Decode({0x19, 0x03, 0xe8}).GetInt() == 1000);
    assert(Decode({0x38, 0x63}).GetInt() == -100);
    assert(Decode({0xf6}).IsNull());
    assert(Decode({0xf7}).IsNone());  // undefined
    assert(Decode({0xf5}).GetBool());

    // Half, single and double precision floats
    assert(Decode({0xf9, 0x3c, 0x00}).GetDouble() == 1.0);
    assert(Decode({0xf9, 0xc4, 0x00}).GetDouble() == -4.0);
    assert(Decode({0xf9, 0x00, 0x01}).GetDouble() == std::ldexp(1.0, -24));
    assert(std::isinf(Decode({0xf9, 0x7c, 0x00}).GetDouble()));
    assert(Decode({0xfa, 0x47, 0xc3, 0x50, 0x00}).GetDouble() == 100000.0);
    assert(Decode({0xfb, 0x3f, 0xf1, 0x99, 0x99, 0x99, 0x99, 0x99, 0x9a}).GetDouble() == 1.1);

    std::cout << "    PASSED" << std::endl;
}

void TestReadIndefinite() {
    std::cout << "  Testing indefinite-length items..." << std::endl;

    // (_ "strea", "ming")
    Value text = Decode({0x7f, 0x65, 's', 't', 'r', 'e', 'a', 0x64, 'm', 'i', 'n', 'g', 0xff});
    assert(text.GetString() == "streaming");

    // [_ 1, [2, 3]]
    Value array = Decode({0x9f, 0x01, 0x82, 0x02, 0x03, 0xff});
    assert(array.Size() == 2);
    assert(array.At(1).At(1).GetInt() == 3);

    // {_ "a": 1}
    Value map = Decode({0xbf, 0x61, 'a', 0x01, 0xff});
    assert(map.At("a").GetInt() == 1);

    std::cout << "    PASSED" << std::endl;
}

void TestReadSurrealTags() {
    std::cout << "  Testing Surreal tag decoding..." << std::endl;

    assert(Decode({0xc6, 0xf6}).IsNone());

    Value table = Decode({0xc7, 0x64, 'u', 's', 'e', 'r'});
    assert(table.IsTable());
    assert(table.GetTable().GetName() == "user");

    Value record = Decode({0xc8, 0x82, 0x66, 'p', 'e', 'r', 's', 'o', 'n', 0x18, 0x2a});
    assert(record.IsRecordID());
    assert(record.GetRecordID().GetTableName() == "person");
    assert(record.GetRecordID().GetIdentifier().GetInt() == 42);

    // Older servers send the record id as "table:id" text
    Value text_record = Decode({0xc8, 0x63, 'a', ':', 'b'});
    assert(text_record.GetRecordID() == RecordID("a", "b"));

    // Datetime (tag 12) is kept as a TaggedValue
    Value datetime = Decode({0xcc, 0x61, 'x'});
    assert(datetime.IsTagged());
    assert(datetime.GetTagged().GetTag() == 12);
    assert(datetime.GetTagged().GetValue().GetString() == "x");

    std::cout << "    PASSED" << std::endl;
}

void TestRoundTripPayload() {
    std::cout << "  Testing response-shaped round trip..." << std::endl;

    Value payload(Object{
        {"id", "5b5a0d35-2c4a-4b8e-9c57-1f2c3d4e5f60"},
        {"result", Array{Object{
            {"id", RecordID("person", "tobie")},
            {"name", "Tobie"},
            {"tags", Array{"admin", Value::Null(), Value::None()}},
            {"score", 9.5},
        }}},
    });

    assert(Decode(Encode(payload)) == payload);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Error Tests
//===----------------------------------------------------------------------===//

void TestMalformedInput() {
    std::cout << "  Testing malformed input..." << std::endl;

    assert(ThrowsCodecError({}));                             // empty
    assert(ThrowsCodecError({0x19, 0x03}));                   // truncated argument
    assert(ThrowsCodecError({0x64, 'a', 'b'}));               // truncated text
    assert(ThrowsCodecError({0x83, 0x01, 0x02}));             // short array
    assert(ThrowsCodecError({0xa1, 0x01, 0x02}));             // integer map key
    assert(ThrowsCodecError({0xff}));                         // stray break
    assert(ThrowsCodecError({0x01, 0x02}));                   // trailing bytes
    assert(ThrowsCodecError({0x1b, 0x80, 0, 0, 0, 0, 0, 0, 0}));  // > INT64_MAX
    assert(ThrowsCodecError({0xc7, 0x01}));                   // table tag on integer
    assert(ThrowsCodecError({0xc8, 0x81, 0x61, 'a'}));        // record id with one element
    assert(ThrowsCodecError({0xc8, 0x61, 'a'}));              // record id text without ':'
    assert(ThrowsCodecError({0x9f, 0x01}));                   // unterminated array
    assert(ThrowsCodecError({0x7f, 0x01, 0xff}));             // bad text chunk

    // Nesting beyond the limit
    std::vector<uint8_t> deep(MAX_NESTING_DEPTH + 2, 0x81);
    deep.push_back(0x00);
    assert(ThrowsCodecError(deep));

    // A codec error is a protocol error
    bool caught = false;
    try {
        Decode({0x19});
    } catch (const ProtocolError& e) {
        caught = true;
        assert(std::string(e.what()).find("CBOR: ") == 0);
    }
    assert(caught);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== CBOR Unit Tests ===" << std::endl;

    std::cout << "\n1. Writer:" << std::endl;
    TestWriteIntegers();
    TestWriteScalars();
    TestWriteContainers();
    TestWriteSurrealTags();

    std::cout << "\n2. Reader:" << std::endl;
    TestReadScalars();
    TestReadIndefinite();
    TestReadSurrealTags();
    TestRoundTripPayload();

    std::cout << "\n3. Errors:" << std::endl;
    TestMalformedInput();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
