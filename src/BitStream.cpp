#include "BitStream.hpp"
#include "CodecError.hpp"

#include <string>

using namespace std;

void BitStream::pushBit(bool b) {
    const size_t byte = bitCount >> 3;       // / 8
    const size_t bit = bitCount & 7;         // % 8

    if (byte >= bytes.size()) {
        bytes.push_back(0);
    }
    if (b) {
        bytes[byte] |= static_cast<uint8_t>(1u << bit);
    }
    bitCount++;
}

bool BitStream::getBit(size_t pos) const {
    if (pos >= bitCount) {
        throw FormatError("Bit " + to_string(pos) + " past end of " + to_string(bitCount) + "-bit stream");
    }
    return (bytes[pos >> 3] >> (pos & 7)) & 1u;
}

BitReader::BitReader(const uint8_t* data, size_t byteCount)
    : data(data), limitBits(byteCount * 8) {}

bool BitReader::readBit() {
    if (pos >= limitBits) {
        throw FormatError("Structure stream ended after " + to_string(pos) + " bits");
    }
    bool b = (data[pos >> 3] >> (pos & 7)) & 1u;
    pos++;
    return b;
}

uint8_t ByteReader::readByte() {
    if (pos >= count) {
        throw FormatError("Leaf-data stream ended after " + to_string(pos) + " bytes");
    }
    return data[pos++];
}
