#include "QueryEngine.hpp"
#include "CodecError.hpp"

#include <algorithm>
#include <string>

using namespace cv;
using namespace std;

uint8_t lerp(uint8_t a, uint8_t b, float k) {
    return static_cast<uint8_t>(static_cast<float>(a) * (1.0f - k) + static_cast<float>(b) * k);
}

uint8_t approxValue(const RegionNode& node, int x, int y, int xo, int yo, uint8_t cutoff) {
    if (node.isLeaf) {
        if (node.contrast() < cutoff) {
            return node.average;
        }

        bool left = (x - xo) == 0;
        bool top = (y - yo) == 0;
        if (top) return left ? node.tl : node.tr;
        return left ? node.bl : node.br;
    }

    if (node.contrast() < cutoff) {
        float fx = static_cast<float>(x - xo) / node.size;
        float fy = static_cast<float>(y - yo) / node.size;

        uint8_t top = lerp(node.tl, node.tr, fx);
        uint8_t bottom = lerp(node.bl, node.br, fx);
        uint8_t value = lerp(top, bottom, fy);

        // Points on the region's left or top edge come back at half intensity
        if (x == xo || y == yo) {
            value /= 2;
        }
        return value;
    }

    int half = node.size / 2;
    bool left = (x - xo) < half;
    bool top = (y - yo) < half;

    if (top && left) return approxValue(*node.children[0], x, y, xo, yo, cutoff);
    if (top) return approxValue(*node.children[1], x, y, xo + half, yo, cutoff);
    if (left) return approxValue(*node.children[2], x, y, xo, yo + half, cutoff);
    return approxValue(*node.children[3], x, y, xo + half, yo + half, cutoff);
}

uint8_t approx(const RegionTree& tree, int x, int y, uint8_t cutoff) {
    int rank = tree.getRank();
    if (x < 0 || y < 0 || x >= rank || y >= rank) {
        throw OutOfBounds("Point (" + to_string(x) + ", " + to_string(y) +
                          ") outside " + to_string(rank) + "x" + to_string(rank) + " region tree");
    }
    return approxValue(tree.getRoot(), x, y, 0, 0, cutoff);
}

uint8_t exact(const RegionTree& tree, int x, int y) {
    return approx(tree, x, y, 0);
}

Mat reconstructChannel(const RegionTree& tree, uint8_t cutoff) {
    int rank = tree.getRank();
    Mat channel(rank, rank, CV_8UC1);

    for (int y = 0; y < rank; y++) {
        uchar* row = channel.ptr<uchar>(y);
        for (int x = 0; x < rank; x++) {
            row[x] = approxValue(tree.getRoot(), x, y, 0, 0, cutoff);
        }
    }
    return channel;
}
