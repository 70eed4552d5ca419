//===----------------------------------------------------------------------===//
//                         Surreal Client
//
// protocol/cbor.cpp
//
// CBOR writer and reader implementation
//===----------------------------------------------------------------------===//

#include "protocol/cbor.hpp"
#include "errors.hpp"
#include <cmath>
#include <cstring>
#include <limits>

namespace surreal_client {
namespace cbor {

//===----------------------------------------------------------------------===//
// CborWriter
//===----------------------------------------------------------------------===//
void CborWriter::WriteHead(uint8_t major, uint64_t argument) {
    uint8_t initial = static_cast<uint8_t>(major << 5);
    if (argument < 24) {
        buffer.push_back(initial | static_cast<uint8_t>(argument));
    } else if (argument <= 0xFF) {
        buffer.push_back(initial | 24);
        buffer.push_back(static_cast<uint8_t>(argument));
    } else if (argument <= 0xFFFF) {
        buffer.push_back(initial | 25);
        WriteBigEndian(argument, 2);
    } else if (argument <= 0xFFFFFFFFULL) {
        buffer.push_back(initial | 26);
        WriteBigEndian(argument, 4);
    } else {
        buffer.push_back(initial | 27);
        WriteBigEndian(argument, 8);
    }
}

void CborWriter::WriteBigEndian(uint64_t value, size_t width) {
    for (size_t i = width; i > 0; --i) {
        buffer.push_back(static_cast<uint8_t>((value >> ((i - 1) * 8)) & 0xFF));
    }
}

void CborWriter::WriteInteger(int64_t value) {
    if (value >= 0) {
        WriteHead(MajorType::UnsignedInt, static_cast<uint64_t>(value));
    } else {
        // -1 - n without overflowing on INT64_MIN
        WriteHead(MajorType::NegativeInt, static_cast<uint64_t>(-(value + 1)));
    }
}

void CborWriter::WriteDouble(double value) {
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    buffer.push_back(static_cast<uint8_t>((MajorType::Simple << 5) | SimpleValue::Double));
    WriteBigEndian(bits, 8);
}

void CborWriter::WriteBool(bool value) {
    buffer.push_back(static_cast<uint8_t>((MajorType::Simple << 5) |
                                          (value ? SimpleValue::True : SimpleValue::False)));
}

void CborWriter::WriteNull() {
    buffer.push_back(static_cast<uint8_t>((MajorType::Simple << 5) | SimpleValue::Null));
}

void CborWriter::WriteText(const std::string& text) {
    WriteHead(MajorType::TextString, text.size());
    buffer.insert(buffer.end(), text.begin(), text.end());
}

void CborWriter::WriteBytes(const uint8_t* bytes, size_t count) {
    WriteHead(MajorType::ByteString, count);
    buffer.insert(buffer.end(), bytes, bytes + count);
}

void CborWriter::WriteValue(const Value& value) {
    switch (value.GetType()) {
        case Value::Type::NONE:
            WriteTag(Tags::None);
            WriteNull();
            break;
        case Value::Type::NULL_VALUE:
            WriteNull();
            break;
        case Value::Type::BOOLEAN:
            WriteBool(value.GetBool());
            break;
        case Value::Type::INTEGER:
            WriteInteger(value.GetInt());
            break;
        case Value::Type::FLOAT:
            WriteDouble(value.GetDouble());
            break;
        case Value::Type::STRING:
            WriteText(value.GetString());
            break;
        case Value::Type::BYTES: {
            const auto& bytes = value.GetBytes();
            WriteBytes(bytes.data(), bytes.size());
            break;
        }
        case Value::Type::ARRAY: {
            const auto& array = value.GetArray();
            WriteArrayHeader(array.size());
            for (const auto& element : array) {
                WriteValue(element);
            }
            break;
        }
        case Value::Type::OBJECT: {
            const auto& object = value.GetObject();
            WriteMapHeader(object.Size());
            for (const auto& entry : object) {
                WriteText(entry.first);
                WriteValue(entry.second);
            }
            break;
        }
        case Value::Type::RECORD_ID: {
            const auto& record = value.GetRecordID();
            WriteTag(Tags::RecordId);
            WriteArrayHeader(2);
            WriteText(record.GetTableName());
            WriteValue(record.GetIdentifier());
            break;
        }
        case Value::Type::TABLE:
            WriteTag(Tags::Table);
            WriteText(value.GetTable().GetName());
            break;
        case Value::Type::TAGGED:
            WriteTag(value.GetTagged().GetTag());
            WriteValue(value.GetTagged().GetValue());
            break;
    }
}

//===----------------------------------------------------------------------===//
// CborReader
//===----------------------------------------------------------------------===//
uint8_t CborReader::ReadByte() {
    if (!HasRemaining()) {
        throw CodecError("unexpected end of input at offset " + std::to_string(pos));
    }
    return data[pos++];
}

uint64_t CborReader::ReadBigEndian(size_t width) {
    if (!HasRemaining(width)) {
        throw CodecError("truncated integer at offset " + std::to_string(pos));
    }
    uint64_t value = 0;
    for (size_t i = 0; i < width; ++i) {
        value = (value << 8) | data[pos++];
    }
    return value;
}

uint64_t CborReader::ReadArgument(uint8_t info) {
    if (info < 24) return info;
    switch (info) {
        case 24: return ReadBigEndian(1);
        case 25: return ReadBigEndian(2);
        case 26: return ReadBigEndian(4);
        case 27: return ReadBigEndian(8);
        default:
            throw CodecError("invalid additional information " + std::to_string(info));
    }
}

bool CborReader::PeekBreak() const {
    return HasRemaining() && data[pos] == 0xFF;
}

double CborReader::ReadHalf() {
    uint16_t half = static_cast<uint16_t>(ReadBigEndian(2));
    int exponent = (half >> 10) & 0x1F;
    int mantissa = half & 0x3FF;
    double value;
    if (exponent == 0) {
        value = std::ldexp(mantissa, -24);
    } else if (exponent != 31) {
        value = std::ldexp(mantissa + 1024, exponent - 25);
    } else {
        value = mantissa == 0 ? std::numeric_limits<double>::infinity()
                              : std::numeric_limits<double>::quiet_NaN();
    }
    return (half & 0x8000) ? -value : value;
}

std::string CborReader::ReadTextChunks(uint8_t info) {
    if (info != INDEFINITE_LENGTH) {
        uint64_t length = ReadArgument(info);
        if (length > Remaining()) {
            throw CodecError("truncated text string at offset " + std::to_string(pos));
        }
        std::string text(reinterpret_cast<const char*>(data + pos), length);
        pos += length;
        return text;
    }

    std::string text;
    while (!PeekBreak()) {
        uint8_t initial = ReadByte();
        if ((initial >> 5) != MajorType::TextString || (initial & 0x1F) == INDEFINITE_LENGTH) {
            throw CodecError("invalid chunk in indefinite-length text string");
        }
        text += ReadTextChunks(initial & 0x1F);
    }
    pos++;  // Skip break
    return text;
}

Bytes CborReader::ReadByteChunks(uint8_t info) {
    if (info != INDEFINITE_LENGTH) {
        uint64_t length = ReadArgument(info);
        if (length > Remaining()) {
            throw CodecError("truncated byte string at offset " + std::to_string(pos));
        }
        Bytes bytes(data + pos, data + pos + length);
        pos += length;
        return bytes;
    }

    Bytes bytes;
    while (!PeekBreak()) {
        uint8_t initial = ReadByte();
        if ((initial >> 5) != MajorType::ByteString || (initial & 0x1F) == INDEFINITE_LENGTH) {
            throw CodecError("invalid chunk in indefinite-length byte string");
        }
        Bytes chunk = ReadByteChunks(initial & 0x1F);
        bytes.insert(bytes.end(), chunk.begin(), chunk.end());
    }
    pos++;
    return bytes;
}

Value CborReader::ReadTagged(uint64_t tag, size_t depth) {
    Value inner = ReadItem(depth + 1);

    switch (tag) {
        case Tags::None:
            return Value::None();

        case Tags::Table:
            if (!inner.IsString()) {
                throw CodecError("table tag must wrap a text string");
            }
            return Value(Table(inner.GetString()));

        case Tags::RecordId:
            if (inner.IsString()) {
                try {
                    return Value(RecordID::Parse(inner.GetString()));
                } catch (const std::invalid_argument& e) {
                    throw CodecError(e.what());
                }
            }
            if (!inner.IsArray() || inner.Size() != 2 || !inner.At(0).IsString()) {
                throw CodecError("record id tag must wrap [table, id]");
            }
            return Value(RecordID(inner.At(0).GetString(), inner.At(1)));

        default:
            return Value(TaggedValue(tag, std::move(inner)));
    }
}

Value CborReader::ReadItem(size_t depth) {
    if (depth > MAX_NESTING_DEPTH) {
        throw CodecError("nesting deeper than " + std::to_string(MAX_NESTING_DEPTH));
    }

    uint8_t initial = ReadByte();
    uint8_t major = initial >> 5;
    uint8_t info = initial & 0x1F;

    switch (major) {
        case MajorType::UnsignedInt: {
            uint64_t value = ReadArgument(info);
            if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                throw CodecError("unsigned integer out of range");
            }
            return Value(static_cast<int64_t>(value));
        }

        case MajorType::NegativeInt: {
            uint64_t value = ReadArgument(info);
            if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                throw CodecError("negative integer out of range");
            }
            return Value(-1 - static_cast<int64_t>(value));
        }

        case MajorType::ByteString:
            return Value(ReadByteChunks(info));

        case MajorType::TextString:
            return Value(ReadTextChunks(info));

        case MajorType::Array: {
            Array array;
            if (info == INDEFINITE_LENGTH) {
                while (!PeekBreak()) {
                    array.push_back(ReadItem(depth + 1));
                }
                pos++;
            } else {
                uint64_t count = ReadArgument(info);
                if (count > Remaining()) {
                    throw CodecError("array length exceeds input");
                }
                array.reserve(count);
                for (uint64_t i = 0; i < count; ++i) {
                    array.push_back(ReadItem(depth + 1));
                }
            }
            return Value(std::move(array));
        }

        case MajorType::Map: {
            Object object;
            bool indefinite = info == INDEFINITE_LENGTH;
            uint64_t count = indefinite ? 0 : ReadArgument(info);
            if (!indefinite && count > Remaining()) {
                throw CodecError("map length exceeds input");
            }
            for (uint64_t i = 0; indefinite ? !PeekBreak() : i < count; ++i) {
                Value key = ReadItem(depth + 1);
                if (!key.IsString()) {
                    throw CodecError("map key must be a text string, got " +
                                     std::string(Value::TypeToString(key.GetType())));
                }
                object.Set(key.GetString(), ReadItem(depth + 1));
            }
            if (indefinite) {
                pos++;
            }
            return Value(std::move(object));
        }

        case MajorType::Tag:
            return ReadTagged(ReadArgument(info), depth);

        case MajorType::Simple:
        default:
            switch (info) {
                case SimpleValue::False:     return Value(false);
                case SimpleValue::True:      return Value(true);
                case SimpleValue::Null:      return Value::Null();
                case SimpleValue::Undefined: return Value::None();
                case SimpleValue::Half:      return Value(ReadHalf());
                case SimpleValue::Single: {
                    uint32_t bits = static_cast<uint32_t>(ReadBigEndian(4));
                    float f;
                    std::memcpy(&f, &bits, sizeof(f));
                    return Value(static_cast<double>(f));
                }
                case SimpleValue::Double: {
                    uint64_t bits = ReadBigEndian(8);
                    double d;
                    std::memcpy(&d, &bits, sizeof(d));
                    return Value(d);
                }
                case SimpleValue::Break:
                    throw CodecError("unexpected break at offset " + std::to_string(pos - 1));
                default:
                    throw CodecError("unsupported simple value " + std::to_string(info));
            }
    }
}

Value CborReader::ReadValue() {
    return ReadItem(0);
}

//===----------------------------------------------------------------------===//
// Convenience
//===----------------------------------------------------------------------===//
std::vector<uint8_t> Encode(const Value& value) {
    CborWriter writer;
    writer.WriteValue(value);
    return writer.TakeBuffer();
}

Value Decode(const uint8_t* data, size_t len) {
    CborReader reader(data, len);
    Value value = reader.ReadValue();
    if (reader.HasRemaining()) {
        throw CodecError(std::to_string(reader.Remaining()) + " trailing bytes after item");
    }
    return value;
}

Value Decode(const std::vector<uint8_t>& data) {
    return Decode(data.data(), data.size());
}

} // namespace cbor
} // namespace surreal_client
