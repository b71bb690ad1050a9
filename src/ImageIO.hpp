#ifndef IMAGE_IO_HPP
#define IMAGE_IO_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

// Reads any format OpenCV decodes; returns CV_8UC3 in RGB order. Throws DecodeFailure.
cv::Mat loadRgbImage(const std::string& path);

// Writes an RGB image, choosing encoder parameters from the extension.
bool saveRgbImage(const std::string& path, const cv::Mat& rgb);

// Raw payload bytes to and from disk. Both throw DecodeFailure on I/O errors.
void writePayload(const std::string& path, const std::vector<uint8_t>& payload);
std::vector<uint8_t> readPayload(const std::string& path);

#endif
