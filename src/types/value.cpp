//===----------------------------------------------------------------------===//
//                         Surreal Client
//
// types/value.cpp
//
// Value, RecordID and Object implementation
//===----------------------------------------------------------------------===//

#include "types/value.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace surreal_client {

//===----------------------------------------------------------------------===//
// RecordID
//===----------------------------------------------------------------------===//
RecordID::RecordID()
    : identifier_(std::make_shared<const Value>()) {}

RecordID::RecordID(std::string table_name, Value identifier)
    : table_name_(std::move(table_name))
    , identifier_(std::make_shared<const Value>(std::move(identifier))) {}

RecordID RecordID::Parse(const std::string& text) {
    auto pos = text.find(':');
    if (pos == std::string::npos) {
        throw std::invalid_argument("Record id '" + text + "' has no ':' separator");
    }
    return RecordID(text.substr(0, pos), Value(text.substr(pos + 1)));
}

const Value& RecordID::GetIdentifier() const {
    return *identifier_;
}

std::string RecordID::ToString() const {
    if (identifier_->IsString()) {
        return table_name_ + ":" + identifier_->GetString();
    }
    return table_name_ + ":" + identifier_->ToString();
}

bool RecordID::operator==(const RecordID& other) const {
    return table_name_ == other.table_name_ && *identifier_ == *other.identifier_;
}

//===----------------------------------------------------------------------===//
// TaggedValue
//===----------------------------------------------------------------------===//
TaggedValue::TaggedValue()
    : tag_(0)
    , value_(std::make_shared<const Value>()) {}

TaggedValue::TaggedValue(uint64_t tag, Value value)
    : tag_(tag)
    , value_(std::make_shared<const Value>(std::move(value))) {}

const Value& TaggedValue::GetValue() const {
    return *value_;
}

bool TaggedValue::operator==(const TaggedValue& other) const {
    return tag_ == other.tag_ && *value_ == *other.value_;
}

//===----------------------------------------------------------------------===//
// Object
//===----------------------------------------------------------------------===//
Object::Object() = default;

Object::Object(std::initializer_list<Entry> entries) {
    for (const auto& entry : entries) {
        Set(entry.first, entry.second);
    }
}

void Object::Set(const std::string& key, Value value) {
    for (auto& entry : entries_) {
        if (entry.first == key) {
            entry.second = std::move(value);
            return;
        }
    }
    entries_.emplace_back(key, std::move(value));
}

bool Object::Erase(const std::string& key) {
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        if (it->first == key) {
            entries_.erase(it);
            return true;
        }
    }
    return false;
}

size_t Object::Size() const {
    return entries_.size();
}

bool Object::Empty() const {
    return entries_.empty();
}

bool Object::Has(const std::string& key) const {
    return Find(key) != nullptr;
}

const Value* Object::Find(const std::string& key) const {
    for (const auto& entry : entries_) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

Value* Object::Find(const std::string& key) {
    for (auto& entry : entries_) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

// Field order does not take part in equality
bool Object::operator==(const Object& other) const {
    if (entries_.size() != other.entries_.size()) {
        return false;
    }
    for (const auto& entry : entries_) {
        const Value* rhs = other.Find(entry.first);
        if (!rhs || !(entry.second == *rhs)) {
            return false;
        }
    }
    return true;
}

//===----------------------------------------------------------------------===//
// Value
//===----------------------------------------------------------------------===//
const char* Value::TypeToString(Type type) {
    switch (type) {
        case Type::NONE:       return "NONE";
        case Type::NULL_VALUE: return "NULL";
        case Type::BOOLEAN:    return "BOOLEAN";
        case Type::INTEGER:    return "INTEGER";
        case Type::FLOAT:      return "FLOAT";
        case Type::STRING:     return "STRING";
        case Type::BYTES:      return "BYTES";
        case Type::ARRAY:      return "ARRAY";
        case Type::OBJECT:     return "OBJECT";
        case Type::RECORD_ID:  return "RECORD_ID";
        case Type::TABLE:      return "TABLE";
        case Type::TAGGED:     return "TAGGED";
        default:               return "UNKNOWN";
    }
}

void Value::ThrowTypeMismatch(Type expected) const {
    throw std::runtime_error(std::string("Value type mismatch: expected ") +
                             TypeToString(expected) + ", got " + TypeToString(GetType()));
}

bool Value::GetBool() const {
    if (!IsBool()) ThrowTypeMismatch(Type::BOOLEAN);
    return std::get<bool>(data_);
}

int64_t Value::GetInt() const {
    if (!IsInt()) ThrowTypeMismatch(Type::INTEGER);
    return std::get<int64_t>(data_);
}

double Value::GetDouble() const {
    if (IsInt()) {
        return static_cast<double>(std::get<int64_t>(data_));
    }
    if (!IsFloat()) ThrowTypeMismatch(Type::FLOAT);
    return std::get<double>(data_);
}

const std::string& Value::GetString() const {
    if (!IsString()) ThrowTypeMismatch(Type::STRING);
    return std::get<std::string>(data_);
}

const Bytes& Value::GetBytes() const {
    if (!IsBytes()) ThrowTypeMismatch(Type::BYTES);
    return std::get<Bytes>(data_);
}

const Array& Value::GetArray() const {
    if (!IsArray()) ThrowTypeMismatch(Type::ARRAY);
    return std::get<Array>(data_);
}

Array& Value::GetArray() {
    if (!IsArray()) ThrowTypeMismatch(Type::ARRAY);
    return std::get<Array>(data_);
}

const Object& Value::GetObject() const {
    if (!IsObject()) ThrowTypeMismatch(Type::OBJECT);
    return std::get<Object>(data_);
}

Object& Value::GetObject() {
    if (!IsObject()) ThrowTypeMismatch(Type::OBJECT);
    return std::get<Object>(data_);
}

const RecordID& Value::GetRecordID() const {
    if (!IsRecordID()) ThrowTypeMismatch(Type::RECORD_ID);
    return std::get<RecordID>(data_);
}

const Table& Value::GetTable() const {
    if (!IsTable()) ThrowTypeMismatch(Type::TABLE);
    return std::get<Table>(data_);
}

const TaggedValue& Value::GetTagged() const {
    if (!IsTagged()) ThrowTypeMismatch(Type::TAGGED);
    return std::get<TaggedValue>(data_);
}

const Value* Value::Find(const std::string& key) const {
    if (!IsObject()) {
        return nullptr;
    }
    return std::get<Object>(data_).Find(key);
}

const Value& Value::At(const std::string& key) const {
    const Value* found = Find(key);
    if (!found) {
        throw std::out_of_range("Missing field '" + key + "'");
    }
    return *found;
}

const Value& Value::At(size_t index) const {
    const auto& array = GetArray();
    if (index >= array.size()) {
        throw std::out_of_range("Array index " + std::to_string(index) +
                                " out of range (size " + std::to_string(array.size()) + ")");
    }
    return array[index];
}

size_t Value::Size() const {
    switch (GetType()) {
        case Type::STRING: return std::get<std::string>(data_).size();
        case Type::BYTES:  return std::get<Bytes>(data_).size();
        case Type::ARRAY:  return std::get<Array>(data_).size();
        case Type::OBJECT: return std::get<Object>(data_).Size();
        default:           return 0;
    }
}

static void AppendQuoted(std::ostringstream& oss, const std::string& s) {
    oss << '"';
    for (char c : s) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec << std::setfill(' ');
                } else {
                    oss << c;
                }
        }
    }
    oss << '"';
}

static void AppendValue(std::ostringstream& oss, const Value& value) {
    switch (value.GetType()) {
        case Value::Type::NONE:
            oss << "NONE";
            break;
        case Value::Type::NULL_VALUE:
            oss << "null";
            break;
        case Value::Type::BOOLEAN:
            oss << (value.GetBool() ? "true" : "false");
            break;
        case Value::Type::INTEGER:
            oss << value.GetInt();
            break;
        case Value::Type::FLOAT: {
            double d = value.GetDouble();
            if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 1e15) {
                oss << static_cast<int64_t>(d) << ".0";
            } else {
                oss << std::setprecision(17) << d;
            }
            break;
        }
        case Value::Type::STRING:
            AppendQuoted(oss, value.GetString());
            break;
        case Value::Type::BYTES: {
            oss << "b\"";
            for (uint8_t byte : value.GetBytes()) {
                oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
            }
            oss << std::dec << std::setfill(' ') << '"';
            break;
        }
        case Value::Type::ARRAY: {
            oss << '[';
            bool first = true;
            for (const auto& element : value.GetArray()) {
                if (!first) oss << ", ";
                first = false;
                AppendValue(oss, element);
            }
            oss << ']';
            break;
        }
        case Value::Type::OBJECT: {
            oss << '{';
            bool first = true;
            for (const auto& entry : value.GetObject()) {
                if (!first) oss << ", ";
                first = false;
                AppendQuoted(oss, entry.first);
                oss << ": ";
                AppendValue(oss, entry.second);
            }
            oss << '}';
            break;
        }
        case Value::Type::RECORD_ID:
            oss << value.GetRecordID().ToString();
            break;
        case Value::Type::TABLE:
            oss << value.GetTable().GetName();
            break;
        case Value::Type::TAGGED:
            oss << value.GetTagged().GetTag() << '(';
            AppendValue(oss, value.GetTagged().GetValue());
            oss << ')';
            break;
    }
}

std::string Value::ToString() const {
    std::ostringstream oss;
    AppendValue(oss, *this);
    return oss.str();
}

} // namespace surreal_client
