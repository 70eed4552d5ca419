//===----------------------------------------------------------------------===//
//                         Surreal Client - Unit Tests
//
// tests/unit/types/test_value.cpp
//
// Unit tests for Value, Object and RecordID
//===----------------------------------------------------------------------===//

#include "types/value.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace surreal_client;

//===----------------------------------------------------------------------===//
// Scalar Tests
//===----------------------------------------------------------------------===//

void TestNoneAndNull() {
    std::cout << "  Testing NONE vs null..." << std::endl;

    Value none;
    Value null(nullptr);

    assert(none.IsNone());
    assert(!none.IsNull());
    assert(null.IsNull());
    assert(none != null);
    assert(Value::None() == none);
    assert(Value::Null() == null);
    assert(none.ToString() == "NONE");
    assert(null.ToString() == "null");

    std::cout << "    PASSED" << std::endl;
}

void TestScalars() {
    std::cout << "  Testing scalar accessors..." << std::endl;

    assert(Value(true).GetBool());
    assert(Value(42).GetInt() == 42);
    assert(Value(-7LL).GetInt() == -7);
    assert(Value(2.5).GetDouble() == 2.5);
    assert(Value(3).GetDouble() == 3.0);  // widened
    assert(Value("tobie").GetString() == "tobie");
    assert(Value(std::string("x")).IsString());

    // Integers and floats are different values
    assert(Value(1) != Value(1.0));
    assert(Value(1).IsNumber() && Value(1.0).IsNumber());

    std::cout << "    PASSED" << std::endl;
}

void TestTypeMismatch() {
    std::cout << "  Testing type mismatch errors..." << std::endl;

    bool threw = false;
    try {
        Value("text").GetInt();
    } catch (const std::runtime_error& e) {
        threw = true;
        assert(std::string(e.what()).find("STRING") != std::string::npos);
    }
    assert(threw);

    threw = false;
    try {
        Value(1.5).GetInt();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Container Tests
//===----------------------------------------------------------------------===//

void TestObject() {
    std::cout << "  Testing Object..." << std::endl;

    Object obj{{"name", "Tobie"}, {"age", 33}};
    assert(obj.Size() == 2);
    assert(!obj.Empty());
    assert(obj.Has("name"));
    assert(obj.Find("missing") == nullptr);

    // Set replaces in place and keeps order
    obj.Set("name", "Jaime");
    obj.Set("admin", true);
    assert(obj.Size() == 3);
    assert(obj.begin()->first == "name");
    assert(obj.Find("name")->GetString() == "Jaime");

    assert(obj.Erase("age"));
    assert(!obj.Erase("age"));
    assert(obj.Size() == 2);

    // Equality ignores key order
    Object a{{"x", 1}, {"y", 2}};
    Object b{{"y", 2}, {"x", 1}};
    assert(a == b);
    b.Set("x", 3);
    assert(a != b);

    std::cout << "    PASSED" << std::endl;
}

void TestValueAccess() {
    std::cout << "  Testing Value element access..." << std::endl;

    Value payload(Object{
        {"id", "abc"},
        {"result", Array{Object{{"status", "OK"}, {"result", Array{1, 2}}}}}
    });

    assert(payload.IsObject());
    assert(payload.Has("result"));
    assert(!payload.Has("error"));
    assert(payload.Size() == 2);

    const Value& statements = payload.At("result");
    assert(statements.IsArray());
    assert(statements.Size() == 1);
    assert(statements.At(0).At("status").GetString() == "OK");
    assert(statements.At(0).At("result").At(1).GetInt() == 2);

    // Find on a non-object is a miss, not an error
    assert(Value(5).Find("x") == nullptr);

    bool threw = false;
    try {
        statements.At(3);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        payload.At("error");
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Record Tests
//===----------------------------------------------------------------------===//

void TestRecordIdParse() {
    std::cout << "  Testing RecordID::Parse..." << std::endl;

    RecordID simple = RecordID::Parse("person:tobie");
    assert(simple.GetTableName() == "person");
    assert(simple.GetIdentifier().GetString() == "tobie");
    assert(simple.ToString() == "person:tobie");

    // Only the first ':' separates
    RecordID nested = RecordID::Parse("event:2024-01-01T10:00");
    assert(nested.GetTableName() == "event");
    assert(nested.GetIdentifier().GetString() == "2024-01-01T10:00");

    bool threw = false;
    try {
        RecordID::Parse("person");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "    PASSED" << std::endl;
}

void TestRecordIdEquality() {
    std::cout << "  Testing RecordID equality..." << std::endl;

    assert(RecordID("person", 1) == RecordID("person", 1));
    assert(RecordID("person", 1) != RecordID("person", "1"));
    assert(RecordID("person", 1) != RecordID("user", 1));
    assert(Value(RecordID("person", 1)).ToString() == "person:1");

    // Copies share the identifier and compare equal
    RecordID original("thing", Array{1, "a"});
    RecordID copy = original;
    assert(copy == original);

    std::cout << "    PASSED" << std::endl;
}

void TestTableAndTagged() {
    std::cout << "  Testing Table and TaggedValue..." << std::endl;

    Value table(Table("person"));
    assert(table.IsTable());
    assert(table.GetTable().GetName() == "person");
    assert(table != Value("person"));
    assert(table.ToString() == "person");

    Value tagged(TaggedValue(12, "2024-01-01T00:00:00Z"));
    assert(tagged.IsTagged());
    assert(tagged.GetTagged().GetTag() == 12);
    assert(tagged == Value(TaggedValue(12, "2024-01-01T00:00:00Z")));
    assert(tagged != Value(TaggedValue(13, "2024-01-01T00:00:00Z")));

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Rendering Tests
//===----------------------------------------------------------------------===//

void TestToString() {
    std::cout << "  Testing ToString..." << std::endl;

    assert(Value(2.0).ToString() == "2.0");
    assert(Value(1.5).ToString() == "1.5");
    assert(Value("a\"b").ToString() == "\"a\\\"b\"");
    assert(Value(Bytes{0x01, 0xab}).ToString() == "b\"01ab\"");
    assert(Value(Array{1, "x", Value()}).ToString() == "[1, \"x\", NONE]");

    Value obj(Object{{"id", RecordID("person", "tobie")}, {"ok", true}});
    assert(obj.ToString() == "{\"id\": person:tobie, \"ok\": true}");

    assert(std::string(Value::TypeToString(Value::Type::RECORD_ID)).size() > 0);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== Value Unit Tests ===" << std::endl;

    std::cout << "\n1. Scalars:" << std::endl;
    TestNoneAndNull();
    TestScalars();
    TestTypeMismatch();

    std::cout << "\n2. Containers:" << std::endl;
    TestObject();
    TestValueAccess();

    std::cout << "\n3. Records:" << std::endl;
    TestRecordIdParse();
    TestRecordIdEquality();
    TestTableAndTagged();

    std::cout << "\n4. Rendering:" << std::endl;
    TestToString();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
