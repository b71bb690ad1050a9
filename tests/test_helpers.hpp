#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include <algorithm>
#include <cstdint>
#include <vector>
#include <opencv2/core.hpp>

// 4x4 bitmap with a flat top-left block, a saturated top-right block and mixed bottom blocks
inline std::vector<uint8_t> exampleBitmap() {
    return {
        1, 1, 255, 255,
        1, 1, 255, 255,
        3, 0, 4, 4,
        0, 0, 4, 4
    };
}

// 4x4 bitmap with corners (1, 3, 5, 0) and contrast 5
inline std::vector<uint8_t> cornerBitmap() {
    return {
        1, 2, 2, 3,
        2, 2, 2, 2,
        3, 2, 2, 1,
        5, 4, 1, 0
    };
}

inline std::vector<uint8_t> noiseBitmap(int rank, uint64_t seed) {
    cv::RNG rng(seed);
    std::vector<uint8_t> bitmap(static_cast<size_t>(rank) * rank);
    for (auto& sample : bitmap) {
        sample = static_cast<uint8_t>(rng.uniform(0, 256));
    }
    return bitmap;
}

// Diagonal ramp with mild noise, so cutoffs collapse progressively more regions
inline std::vector<uint8_t> rampBitmap(int rank, uint64_t seed) {
    cv::RNG rng(seed);
    std::vector<uint8_t> bitmap(static_cast<size_t>(rank) * rank);
    for (int y = 0; y < rank; y++) {
        for (int x = 0; x < rank; x++) {
            int value = (x + y) * 255 / (2 * rank) + rng.uniform(0, 12);
            bitmap[static_cast<size_t>(y) * rank + x] = static_cast<uint8_t>(std::min(value, 255));
        }
    }
    return bitmap;
}

inline std::vector<cv::Vec3b> rampPixels(int rank, uint64_t seed) {
    cv::RNG rng(seed);
    std::vector<cv::Vec3b> pixels(static_cast<size_t>(rank) * rank);
    for (int y = 0; y < rank; y++) {
        for (int x = 0; x < rank; x++) {
            int base = (x + y) * 255 / (2 * rank);
            pixels[static_cast<size_t>(y) * rank + x] = cv::Vec3b(
                static_cast<uchar>(std::min(base + rng.uniform(0, 16), 255)),
                static_cast<uchar>(std::min(255 - base + rng.uniform(0, 8), 255)),
                static_cast<uchar>(std::min(x * 255 / rank + rng.uniform(0, 4), 255)));
        }
    }
    return pixels;
}

#endif
