//===----------------------------------------------------------------------===//
//                         Surreal Client
//
// protocol/cbor.hpp
//
// CBOR (RFC 8949) writer and reader for the Value tree
//===----------------------------------------------------------------------===//

#pragma once

#include "types/value.hpp"
#include <string>
#include <vector>

namespace surreal_client {
namespace cbor {

//===----------------------------------------------------------------------===//
// Major types and tags
//===----------------------------------------------------------------------===//
namespace MajorType {
    constexpr uint8_t UnsignedInt = 0;
    constexpr uint8_t NegativeInt = 1;
    constexpr uint8_t ByteString = 2;
    constexpr uint8_t TextString = 3;
    constexpr uint8_t Array = 4;
    constexpr uint8_t Map = 5;
    constexpr uint8_t Tag = 6;
    constexpr uint8_t Simple = 7;
}

namespace SimpleValue {
    constexpr uint8_t False = 20;
    constexpr uint8_t True = 21;
    constexpr uint8_t Null = 22;
    constexpr uint8_t Undefined = 23;
    constexpr uint8_t Half = 25;
    constexpr uint8_t Single = 26;
    constexpr uint8_t Double = 27;
    constexpr uint8_t Break = 31;
}

// SurrealDB custom tags interpreted by the client. Every other tag is kept
// as a TaggedValue.
namespace Tags {
    constexpr uint64_t None = 6;
    constexpr uint64_t Table = 7;
    constexpr uint64_t RecordId = 8;
}

constexpr uint8_t INDEFINITE_LENGTH = 31;
constexpr size_t MAX_NESTING_DEPTH = 256;

//===----------------------------------------------------------------------===//
// Writer
//===----------------------------------------------------------------------===//
class CborWriter {
public:
    CborWriter() {
        buffer.reserve(256);
    }

    const std::vector<uint8_t>& GetBuffer() const { return buffer; }
    std::vector<uint8_t> TakeBuffer() {
        std::vector<uint8_t> out = std::move(buffer);
        buffer.clear();
        return out;
    }

    void Clear() { buffer.clear(); }

    void WriteValue(const Value& value);

    void WriteUnsigned(uint64_t value) { WriteHead(MajorType::UnsignedInt, value); }
    void WriteInteger(int64_t value);
    void WriteDouble(double value);
    void WriteBool(bool value);
    void WriteNull();
    void WriteText(const std::string& text);
    void WriteBytes(const uint8_t* data, size_t len);
    void WriteArrayHeader(uint64_t count) { WriteHead(MajorType::Array, count); }
    void WriteMapHeader(uint64_t count) { WriteHead(MajorType::Map, count); }
    void WriteTag(uint64_t tag) { WriteHead(MajorType::Tag, tag); }

private:
    // Shortest encoding of the argument, as required for preferred serialization
    void WriteHead(uint8_t major, uint64_t argument);
    void WriteBigEndian(uint64_t value, size_t width);

    std::vector<uint8_t> buffer;
};

//===----------------------------------------------------------------------===//
// Reader
//===----------------------------------------------------------------------===//
class CborReader {
public:
    CborReader(const uint8_t* data_p, size_t len_p)
        : data(data_p), len(len_p), pos(0) {}

    bool HasRemaining(size_t bytes = 1) const {
        return pos + bytes <= len;
    }

    size_t Remaining() const {
        return len - pos;
    }

    size_t Position() const { return pos; }

    // Reads one complete data item; throws CodecError on malformed input.
    Value ReadValue();

private:
    Value ReadItem(size_t depth);
    Value ReadTagged(uint64_t tag, size_t depth);
    uint64_t ReadArgument(uint8_t info);
    std::string ReadTextChunks(uint8_t info);
    Bytes ReadByteChunks(uint8_t info);
    double ReadHalf();
    uint8_t ReadByte();
    uint64_t ReadBigEndian(size_t width);
    bool PeekBreak() const;

    const uint8_t* data;
    size_t len;
    size_t pos;
};

//===----------------------------------------------------------------------===//
// Convenience
//===----------------------------------------------------------------------===//
std::vector<uint8_t> Encode(const Value& value);

// Decodes exactly one item; trailing bytes are an error.
Value Decode(const uint8_t* data, size_t len);
Value Decode(const std::vector<uint8_t>& data);

} // namespace cbor
} // namespace surreal_client
