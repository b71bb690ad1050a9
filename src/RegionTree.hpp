#ifndef REGION_TREE_HPP
#define REGION_TREE_HPP

#include <cstdint>
#include <memory>
#include <vector>

// Square region of one channel bitmap.
// Leaf: a 2x2 block, tl/tr/bl/br are its four samples.
// Branch: tl/tr/bl/br are the exact samples at the region's bounding-box corners,
// low/high span the whole subtree, average is the mean of the four corners.
class RegionNode {
public:
    bool isLeaf;
    int size;
    uint8_t tl, tr, bl, br;
    uint8_t low, high, average;
    std::unique_ptr<RegionNode> children[4];   // TL, TR, BL, BR; empty for leaves

    RegionNode(uint8_t tl, uint8_t tr, uint8_t bl, uint8_t br);
    RegionNode(std::unique_ptr<RegionNode> a, std::unique_ptr<RegionNode> b,
               std::unique_ptr<RegionNode> c, std::unique_ptr<RegionNode> d,
               uint8_t tl, uint8_t tr, uint8_t bl, uint8_t br, int size);

    uint8_t contrast() const { return high - low; }
};

class RegionTree {
private:
    std::unique_ptr<RegionNode> root;
    int rank;

    static std::unique_ptr<RegionNode> buildRegion(const std::vector<uint8_t>& bitmap, int rank,
                                                   int x, int y, int size, int depth);
    int getTreeDepthHelper(const RegionNode* node) const;
    int getNodeCountHelper(const RegionNode* node) const;
    int countLeafNodesHelper(const RegionNode* node) const;
    int countCollapsedHelper(const RegionNode* node, uint8_t cutoff) const;

public:
    // Throws InvalidDimensions unless rank is a power of two >= 2 and bitmap holds rank*rank samples.
    RegionTree(const std::vector<uint8_t>& bitmap, int rank);

    int getRank() const { return rank; }
    const RegionNode& getRoot() const { return *root; }

    int getTreeDepth() const;
    int getNodeCount() const;
    int countLeafNodes() const;

    // Regions emitted as a single averaged value when walked at this cutoff
    int countCollapsed(uint8_t cutoff) const;
};

bool isPowerOfTwo(int n);

#endif
