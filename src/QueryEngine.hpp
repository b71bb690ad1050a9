#ifndef QUERY_ENGINE_HPP
#define QUERY_ENGINE_HPP

#include <cstdint>
#include <opencv2/core.hpp>

#include "RegionTree.hpp"

uint8_t lerp(uint8_t a, uint8_t b, float k);

// Reconstructs the sample at (x, y) inside a node covering the square at (xo, yo).
// Regions whose contrast is below the cutoff are not descended: a leaf returns the
// flat average of its block, a branch interpolates its four corner samples.
uint8_t approxValue(const RegionNode& node, int x, int y, int xo, int yo, uint8_t cutoff);

// Both throw OutOfBounds for points outside [0, rank) x [0, rank).
uint8_t approx(const RegionTree& tree, int x, int y, uint8_t cutoff);
uint8_t exact(const RegionTree& tree, int x, int y);

// Single-channel 8-bit image of approx() over every pixel
cv::Mat reconstructChannel(const RegionTree& tree, uint8_t cutoff);

#endif
