#ifndef QUALITY_METRICS_HPP
#define QUALITY_METRICS_HPP

#include <opencv2/core.hpp>

// Comparisons between an original and a reconstructed image of the same size and type.
double calculatePSNR(const cv::Mat& original, const cv::Mat& reconstructed);
double calculateMAD(const cv::Mat& original, const cv::Mat& reconstructed);
double calculateMaxPixelDiff(const cv::Mat& original, const cv::Mat& reconstructed);

#endif
