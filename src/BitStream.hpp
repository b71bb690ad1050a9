#ifndef BIT_STREAM_HPP
#define BIT_STREAM_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

// Growable bit vector packed LSB-first into bytes.
class BitStream {
private:
    std::vector<uint8_t> bytes;
    size_t bitCount = 0;

public:
    void pushBit(bool b);
    bool getBit(size_t pos) const;

    size_t size() const { return bitCount; }
    size_t byteSize() const { return bytes.size(); }    // ceil(size() / 8)
    const std::vector<uint8_t>& getBytes() const { return bytes; }
};

// Sequential bit cursor over a byte range. Throws FormatError when read past the end.
class BitReader {
private:
    const uint8_t* data;
    size_t limitBits;
    size_t pos = 0;

public:
    BitReader(const uint8_t* data, size_t byteCount);

    bool readBit();
    size_t bitsRead() const { return pos; }
    size_t bytesTouched() const { return (pos + 7) / 8; }
};

// Sequential byte cursor over a byte range. Throws FormatError when read past the end.
class ByteReader {
private:
    const uint8_t* data;
    size_t count;
    size_t pos = 0;

public:
    ByteReader(const uint8_t* data, size_t count) : data(data), count(count) {}

    uint8_t readByte();
    size_t bytesRead() const { return pos; }
    size_t remaining() const { return count - pos; }
};

#endif
