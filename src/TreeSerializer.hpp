#ifndef TREE_SERIALIZER_HPP
#define TREE_SERIALIZER_HPP

#include <cstddef>
#include <cstdint>
#include <vector>
#include <opencv2/core.hpp>

#include "BitStream.hpp"
#include "RegionTree.hpp"

// Structure bits and leaf-data bytes of one channel walked at one cutoff.
struct ChannelStreams {
    BitStream structure;
    std::vector<uint8_t> leafData;

    size_t byteSize() const { return structure.byteSize() + leafData.size(); }
};

struct StreamExtent {
    size_t structureBits = 0;
    size_t leafDataBytes = 0;

    size_t structureBytes() const { return (structureBits + 7) / 8; }
};

/*
 * Wire format of one channel, produced by a pre-order walk:
 *   structure: 0 = leaf or collapsed branch, 1 = expanded branch followed by its four children
 *   leaf data: leaf -> tl,tr,bl,br; collapsed branch -> average; expanded branch -> nothing
 *
 * The reader tracks the side of the current region starting from rank, so a 0 at
 * side 2 is a leaf (4 bytes) and a 0 at any larger side is a collapsed branch (1 byte).
 */
class TreeSerializer {
private:
    static void encodeNode(const RegionNode& node, uint8_t cutoff, ChannelStreams& out);
    static void measureRegion(BitReader& structure, int size, StreamExtent& extent);
    static void decodeRegion(BitReader& structure, ByteReader& leafData, cv::Mat& channel,
                             int x, int y, int size);

public:
    static ChannelStreams encode(const RegionTree& tree, uint8_t cutoff);

    // Walks the structure bits alone, reporting how many bits and leaf-data bytes they describe.
    static StreamExtent measure(BitReader& structure, int rank);

    // Reads one channel from both cursors and returns it as an 8-bit single-channel image.
    static cv::Mat decode(BitReader& structure, ByteReader& leafData, int rank);

    // As above, but also rejects streams with trailing bytes.
    static cv::Mat decode(const ChannelStreams& streams, int rank);
};

#endif
