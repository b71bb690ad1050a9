#include "RegionTree.hpp"
#include "CodecError.hpp"

#include <algorithm>
#include <future>
#include <string>

using namespace std;

namespace {

// Bitmaps at least this large build their top two levels on separate tasks
const size_t PARALLEL_MIN_SAMPLES = 512 * 512;

}

bool isPowerOfTwo(int n) {
    return n > 0 && (n & (n - 1)) == 0;
}

RegionNode::RegionNode(uint8_t tl, uint8_t tr, uint8_t bl, uint8_t br)
    : isLeaf(true), size(2), tl(tl), tr(tr), bl(bl), br(br) {
    low = min(min(tl, tr), min(bl, br));
    high = max(max(tl, tr), max(bl, br));
    average = static_cast<uint8_t>((tl + tr + bl + br) / 4);
}

RegionNode::RegionNode(unique_ptr<RegionNode> a, unique_ptr<RegionNode> b,
                       unique_ptr<RegionNode> c, unique_ptr<RegionNode> d,
                       uint8_t tl, uint8_t tr, uint8_t bl, uint8_t br, int size)
    : isLeaf(false), size(size), tl(tl), tr(tr), bl(bl), br(br) {
    low = min(min(a->low, b->low), min(c->low, d->low));
    high = max(max(a->high, b->high), max(c->high, d->high));
    average = static_cast<uint8_t>((tl + tr + bl + br) / 4);

    children[0] = move(a);
    children[1] = move(b);
    children[2] = move(c);
    children[3] = move(d);
}

RegionTree::RegionTree(const vector<uint8_t>& bitmap, int rank) : rank(rank) {
    if (rank < 2 || !isPowerOfTwo(rank)) {
        throw InvalidDimensions("Rank must be a power of two >= 2, got " + to_string(rank));
    }
    if (bitmap.size() != static_cast<size_t>(rank) * static_cast<size_t>(rank)) {
        throw InvalidDimensions("Bitmap holds " + to_string(bitmap.size()) + " samples, expected " +
                                to_string(rank) + "x" + to_string(rank));
    }

    root = buildRegion(bitmap, rank, 0, 0, rank, 0);
}

unique_ptr<RegionNode> RegionTree::buildRegion(const vector<uint8_t>& bitmap, int rank,
                                               int x, int y, int size, int depth) {
    auto sample = [&bitmap, rank](int px, int py) {
        return bitmap[static_cast<size_t>(py) * rank + px];
    };

    if (size == 2) {
        return make_unique<RegionNode>(sample(x, y), sample(x + 1, y),
                                       sample(x, y + 1), sample(x + 1, y + 1));
    }

    int half = size / 2;
    const int origin[4][2] = {
        {x, y}, {x + half, y}, {x, y + half}, {x + half, y + half}
    };

    unique_ptr<RegionNode> quadrants[4];

    bool useParallel = bitmap.size() >= PARALLEL_MIN_SAMPLES && depth <= 1;

    if (useParallel) {
        vector<future<unique_ptr<RegionNode>>> futures;

        for (int i = 0; i < 4; i++) {
            futures.push_back(async(launch::async, [&bitmap, rank, &origin, i, half, depth]() {
                return buildRegion(bitmap, rank, origin[i][0], origin[i][1], half, depth + 1);
            }));
        }

        for (int i = 0; i < 4; i++) {
            quadrants[i] = futures[i].get();
        }
    } else {
        for (int i = 0; i < 4; i++) {
            quadrants[i] = buildRegion(bitmap, rank, origin[i][0], origin[i][1], half, depth + 1);
        }
    }

    int last = size - 1;
    return make_unique<RegionNode>(move(quadrants[0]), move(quadrants[1]),
                                   move(quadrants[2]), move(quadrants[3]),
                                   sample(x, y), sample(x + last, y),
                                   sample(x, y + last), sample(x + last, y + last),
                                   size);
}

int RegionTree::getTreeDepthHelper(const RegionNode* node) const {
    if (!node) return 0;
    if (node->isLeaf) return 1;

    int maxChildDepth = 0;
    for (int i = 0; i < 4; i++) {
        maxChildDepth = max(maxChildDepth, getTreeDepthHelper(node->children[i].get()));
    }
    return 1 + maxChildDepth;
}

int RegionTree::getNodeCountHelper(const RegionNode* node) const {
    if (!node) return 0;

    int count = 1;
    if (!node->isLeaf) {
        for (int i = 0; i < 4; i++) {
            count += getNodeCountHelper(node->children[i].get());
        }
    }
    return count;
}

int RegionTree::countLeafNodesHelper(const RegionNode* node) const {
    if (!node) return 0;
    if (node->isLeaf) return 1;

    int count = 0;
    for (int i = 0; i < 4; i++) {
        count += countLeafNodesHelper(node->children[i].get());
    }
    return count;
}

int RegionTree::countCollapsedHelper(const RegionNode* node, uint8_t cutoff) const {
    if (!node || node->isLeaf) return 0;
    if (node->contrast() < cutoff) return 1;

    int count = 0;
    for (int i = 0; i < 4; i++) {
        count += countCollapsedHelper(node->children[i].get(), cutoff);
    }
    return count;
}

int RegionTree::getTreeDepth() const {
    return getTreeDepthHelper(root.get());
}

int RegionTree::getNodeCount() const {
    return getNodeCountHelper(root.get());
}

int RegionTree::countLeafNodes() const {
    return countLeafNodesHelper(root.get());
}

int RegionTree::countCollapsed(uint8_t cutoff) const {
    return countCollapsedHelper(root.get(), cutoff);
}
