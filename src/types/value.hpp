//===----------------------------------------------------------------------===//
//                         Surreal Client
//
// types/value.hpp
//
// Dynamic value tree exchanged with the server
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <initializer_list>
#include <utility>
#include <variant>

namespace surreal_client {

class Value;

//===----------------------------------------------------------------------===//
// Marker types
//===----------------------------------------------------------------------===//
struct NoneValue {
    bool operator==(const NoneValue&) const { return true; }
    bool operator!=(const NoneValue&) const { return false; }
};

struct NullValue {
    bool operator==(const NullValue&) const { return true; }
    bool operator!=(const NullValue&) const { return false; }
};

//===----------------------------------------------------------------------===//
// Table - bare table reference (CBOR tag 7)
//===----------------------------------------------------------------------===//
class Table {
public:
    Table() = default;
    explicit Table(std::string name) : name_(std::move(name)) {}

    const std::string& GetName() const { return name_; }

    bool operator==(const Table& other) const { return name_ == other.name_; }
    bool operator!=(const Table& other) const { return !(*this == other); }

private:
    std::string name_;
};

//===----------------------------------------------------------------------===//
// RecordID - table plus identifier (CBOR tag 8)
//
// The identifier can be any value (string, integer, array, object), so it is
// held behind a shared pointer; RecordID is immutable after construction.
//===----------------------------------------------------------------------===//
class RecordID {
public:
    RecordID();
    RecordID(std::string table_name, Value identifier);

    // "person:tobie" -> RecordID("person", "tobie"). Splits once on the first
    // ':'; throws std::invalid_argument when no separator is present.
    static RecordID Parse(const std::string& text);

    const std::string& GetTableName() const { return table_name_; }
    const Value& GetIdentifier() const;

    std::string ToString() const;

    bool operator==(const RecordID& other) const;
    bool operator!=(const RecordID& other) const { return !(*this == other); }

private:
    std::string table_name_;
    std::shared_ptr<const Value> identifier_;
};

//===----------------------------------------------------------------------===//
// TaggedValue - CBOR tag the client does not interpret (datetime, uuid,
// decimal, duration, geometry, ...). Round-trips unchanged.
//===----------------------------------------------------------------------===//
class TaggedValue {
public:
    TaggedValue();
    TaggedValue(uint64_t tag, Value value);

    uint64_t GetTag() const { return tag_; }
    const Value& GetValue() const;

    bool operator==(const TaggedValue& other) const;
    bool operator!=(const TaggedValue& other) const { return !(*this == other); }

private:
    uint64_t tag_;
    std::shared_ptr<const Value> value_;
};

//===----------------------------------------------------------------------===//
// Array / Object
//===----------------------------------------------------------------------===//
using Array = std::vector<Value>;

// String-keyed map that keeps insertion order, matching the order the server
// writes fields in. Keys are unique; Set() on an existing key replaces it.
class Object {
public:
    using Entry = std::pair<std::string, Value>;
    using const_iterator = std::vector<Entry>::const_iterator;
    using iterator = std::vector<Entry>::iterator;

    Object();
    Object(std::initializer_list<Entry> entries);

    void Set(const std::string& key, Value value);
    bool Erase(const std::string& key);
    bool Has(const std::string& key) const;
    const Value* Find(const std::string& key) const;
    Value* Find(const std::string& key);

    size_t Size() const;
    bool Empty() const;

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }
    iterator begin() { return entries_.begin(); }
    iterator end() { return entries_.end(); }

    bool operator==(const Object& other) const;
    bool operator!=(const Object& other) const { return !(*this == other); }

private:
    std::vector<Entry> entries_;
};

//===----------------------------------------------------------------------===//
// Value
//===----------------------------------------------------------------------===//
class Value {
public:
    enum class Type : uint8_t {
        NONE,
        NULL_VALUE,
        BOOLEAN,
        INTEGER,
        FLOAT,
        STRING,
        BYTES,
        ARRAY,
        OBJECT,
        RECORD_ID,
        TABLE,
        TAGGED
    };

    // Default-constructed value is NONE (absent), distinct from NULL.
    Value() : data_(NoneValue{}) {}
    Value(std::nullptr_t) : data_(NullValue{}) {}
    Value(bool b) : data_(b) {}
    Value(int i) : data_(static_cast<int64_t>(i)) {}
    Value(long i) : data_(static_cast<int64_t>(i)) {}
    Value(long long i) : data_(static_cast<int64_t>(i)) {}
    Value(unsigned int i) : data_(static_cast<int64_t>(i)) {}
    Value(double d) : data_(d) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(Bytes b) : data_(std::move(b)) {}
    Value(Array a) : data_(std::move(a)) {}
    Value(Object o) : data_(std::move(o)) {}
    Value(RecordID r) : data_(std::move(r)) {}
    Value(Table t) : data_(std::move(t)) {}
    Value(TaggedValue t) : data_(std::move(t)) {}

    static Value None() { return Value(); }
    static Value Null() { return Value(nullptr); }

    Type GetType() const { return static_cast<Type>(data_.index()); }
    static const char* TypeToString(Type type);

    bool IsNone() const { return GetType() == Type::NONE; }
    bool IsNull() const { return GetType() == Type::NULL_VALUE; }
    bool IsBool() const { return GetType() == Type::BOOLEAN; }
    bool IsInt() const { return GetType() == Type::INTEGER; }
    bool IsFloat() const { return GetType() == Type::FLOAT; }
    bool IsNumber() const { return IsInt() || IsFloat(); }
    bool IsString() const { return GetType() == Type::STRING; }
    bool IsBytes() const { return GetType() == Type::BYTES; }
    bool IsArray() const { return GetType() == Type::ARRAY; }
    bool IsObject() const { return GetType() == Type::OBJECT; }
    bool IsRecordID() const { return GetType() == Type::RECORD_ID; }
    bool IsTable() const { return GetType() == Type::TABLE; }
    bool IsTagged() const { return GetType() == Type::TAGGED; }

    // Typed accessors; throw std::runtime_error on a type mismatch
    bool GetBool() const;
    int64_t GetInt() const;
    double GetDouble() const;  // integers are widened
    const std::string& GetString() const;
    const Bytes& GetBytes() const;
    const Array& GetArray() const;
    Array& GetArray();
    const Object& GetObject() const;
    Object& GetObject();
    const RecordID& GetRecordID() const;
    const Table& GetTable() const;
    const TaggedValue& GetTagged() const;

    // Object member lookup; nullptr when this is not an object or the key is
    // missing.
    const Value* Find(const std::string& key) const;
    bool Has(const std::string& key) const { return Find(key) != nullptr; }

    // Checked element access; throw std::out_of_range.
    const Value& At(const std::string& key) const;
    const Value& At(size_t index) const;

    // Element count for arrays, objects, strings and bytes; 0 otherwise.
    size_t Size() const;

    // JSON-like rendering; record ids render as table:id, NONE as NONE.
    std::string ToString() const;

    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    [[noreturn]] void ThrowTypeMismatch(Type expected) const;

    // Alternative order must match Type
    std::variant<NoneValue, NullValue, bool, int64_t, double, std::string, Bytes,
                 Array, Object, RecordID, Table, TaggedValue> data_;
};

} // namespace surreal_client
