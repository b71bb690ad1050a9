#ifndef COLOR_TRANSFORM_HPP
#define COLOR_TRANSFORM_HPP

#include <cstdint>
#include <vector>
#include <opencv2/core.hpp>

enum class Channel {
    LUMA = 0,
    CHROMA_BLUE = 1,
    CHROMA_RED = 2
};

// Fixed linear RGB <-> YCbCr transform. Vec3b layouts are (R, G, B) and (Y, Cb, Cr),
// every output rounded to nearest and clamped to [0, 255].
cv::Vec3b rgbToYCbCr(const cv::Vec3b& rgb);
cv::Vec3b yCbCrToRgb(const cv::Vec3b& ycc);

// Splits row-major RGB pixels into three row-major planes indexed by Channel.
void splitPlanes(const std::vector<cv::Vec3b>& rgbPixels, std::vector<uint8_t> planes[3]);

// Inverse of splitPlanes on three single-channel images of equal size; returns RGB CV_8UC3.
cv::Mat mergePlanes(const cv::Mat& luma, const cv::Mat& chromaBlue, const cv::Mat& chromaRed);

#endif
