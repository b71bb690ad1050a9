#include "TreeSerializer.hpp"
#include "CodecError.hpp"

#include <string>
#include <opencv2/imgproc.hpp>

using namespace cv;
using namespace std;

namespace {

void checkRank(int rank) {
    if (rank < 2 || !isPowerOfTwo(rank)) {
        throw InvalidDimensions("Rank must be a power of two >= 2, got " + to_string(rank));
    }
}

}

void TreeSerializer::encodeNode(const RegionNode& node, uint8_t cutoff, ChannelStreams& out) {
    if (node.isLeaf) {
        out.structure.pushBit(false);
        out.leafData.push_back(node.tl);
        out.leafData.push_back(node.tr);
        out.leafData.push_back(node.bl);
        out.leafData.push_back(node.br);
        return;
    }

    if (node.contrast() < cutoff) {
        out.structure.pushBit(false);
        out.leafData.push_back(node.average);
        return;
    }

    out.structure.pushBit(true);
    for (int i = 0; i < 4; i++) {
        encodeNode(*node.children[i], cutoff, out);
    }
}

ChannelStreams TreeSerializer::encode(const RegionTree& tree, uint8_t cutoff) {
    ChannelStreams streams;
    encodeNode(tree.getRoot(), cutoff, streams);
    return streams;
}

void TreeSerializer::measureRegion(BitReader& structure, int size, StreamExtent& extent) {
    bool expanded = structure.readBit();
    extent.structureBits++;

    if (size == 2) {
        if (expanded) {
            throw FormatError("Expanded marker at leaf size (bit " + to_string(structure.bitsRead() - 1) + ")");
        }
        extent.leafDataBytes += 4;
        return;
    }

    if (!expanded) {
        extent.leafDataBytes += 1;
        return;
    }

    for (int i = 0; i < 4; i++) {
        measureRegion(structure, size / 2, extent);
    }
}

StreamExtent TreeSerializer::measure(BitReader& structure, int rank) {
    checkRank(rank);

    StreamExtent extent;
    measureRegion(structure, rank, extent);
    return extent;
}

void TreeSerializer::decodeRegion(BitReader& structure, ByteReader& leafData, Mat& channel,
                                  int x, int y, int size) {
    bool expanded = structure.readBit();

    if (size == 2) {
        if (expanded) {
            throw FormatError("Expanded marker at leaf size (bit " + to_string(structure.bitsRead() - 1) + ")");
        }
        channel.at<uchar>(y, x) = leafData.readByte();
        channel.at<uchar>(y, x + 1) = leafData.readByte();
        channel.at<uchar>(y + 1, x) = leafData.readByte();
        channel.at<uchar>(y + 1, x + 1) = leafData.readByte();
        return;
    }

    if (!expanded) {
        uint8_t average = leafData.readByte();
        rectangle(channel, Rect(x, y, size, size), Scalar(average), FILLED);
        return;
    }

    int half = size / 2;
    decodeRegion(structure, leafData, channel, x, y, half);
    decodeRegion(structure, leafData, channel, x + half, y, half);
    decodeRegion(structure, leafData, channel, x, y + half, half);
    decodeRegion(structure, leafData, channel, x + half, y + half, half);
}

Mat TreeSerializer::decode(BitReader& structure, ByteReader& leafData, int rank) {
    checkRank(rank);

    Mat channel(rank, rank, CV_8UC1, Scalar(0));
    decodeRegion(structure, leafData, channel, 0, 0, rank);
    return channel;
}

Mat TreeSerializer::decode(const ChannelStreams& streams, int rank) {
    const vector<uint8_t>& structureBytes = streams.structure.getBytes();
    BitReader structure(structureBytes.data(), structureBytes.size());
    ByteReader leafData(streams.leafData.data(), streams.leafData.size());

    Mat channel = decode(structure, leafData, rank);

    if (structure.bytesTouched() != structureBytes.size()) {
        throw FormatError("Structure stream has " + to_string(structureBytes.size() - structure.bytesTouched()) +
                          " trailing bytes");
    }
    if (leafData.remaining() != 0) {
        throw FormatError("Leaf-data stream has " + to_string(leafData.remaining()) + " trailing bytes");
    }
    return channel;
}
