#include <gtest/gtest.h>

#include "BitStream.hpp"
#include "CodecError.hpp"

TEST(BitStreamTest, PacksLeastSignificantBitFirst) {
    BitStream bits;
    bits.pushBit(true);
    bits.pushBit(false);
    bits.pushBit(true);
    bits.pushBit(true);

    EXPECT_EQ(bits.size(), 4u);
    ASSERT_EQ(bits.byteSize(), 1u);
    EXPECT_EQ(bits.getBytes()[0], 0x0D);

    EXPECT_TRUE(bits.getBit(0));
    EXPECT_FALSE(bits.getBit(1));
    EXPECT_TRUE(bits.getBit(3));
}

TEST(BitStreamTest, ByteSizeRoundsUp) {
    BitStream bits;
    EXPECT_EQ(bits.byteSize(), 0u);

    for (int i = 0; i < 8; i++) bits.pushBit(false);
    EXPECT_EQ(bits.byteSize(), 1u);

    bits.pushBit(true);
    EXPECT_EQ(bits.size(), 9u);
    ASSERT_EQ(bits.byteSize(), 2u);
    EXPECT_EQ(bits.getBytes()[1], 0x01);
}

TEST(BitStreamTest, GetBitPastEndThrows) {
    BitStream bits;
    bits.pushBit(true);

    EXPECT_THROW(bits.getBit(1), FormatError);
}

TEST(BitReaderTest, ReadsInOrderThenThrows) {
    const uint8_t data[] = {0x05};
    BitReader reader(data, 1);

    EXPECT_TRUE(reader.readBit());
    EXPECT_FALSE(reader.readBit());
    EXPECT_TRUE(reader.readBit());
    EXPECT_EQ(reader.bytesTouched(), 1u);

    for (int i = 3; i < 8; i++) {
        EXPECT_FALSE(reader.readBit());
    }
    EXPECT_EQ(reader.bitsRead(), 8u);
    EXPECT_THROW(reader.readBit(), FormatError);
}

TEST(BitReaderTest, EmptyRangeThrowsImmediately) {
    BitReader reader(nullptr, 0);
    EXPECT_THROW(reader.readBit(), FormatError);
}

TEST(ByteReaderTest, TracksRemainingBytes) {
    const uint8_t data[] = {7, 8, 9};
    ByteReader reader(data, 3);

    EXPECT_EQ(reader.readByte(), 7);
    EXPECT_EQ(reader.remaining(), 2u);
    EXPECT_EQ(reader.readByte(), 8);
    EXPECT_EQ(reader.readByte(), 9);
    EXPECT_EQ(reader.bytesRead(), 3u);
    EXPECT_THROW(reader.readByte(), FormatError);
}
