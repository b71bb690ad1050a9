#include <gtest/gtest.h>

#include "CodecError.hpp"
#include "QualityMetrics.hpp"

TEST(QualityMetricsTest, IdenticalImages) {
    cv::Mat image(16, 16, CV_8UC3, cv::Scalar(40, 90, 200));

    EXPECT_DOUBLE_EQ(calculateMAD(image, image), 0.0);
    EXPECT_DOUBLE_EQ(calculateMaxPixelDiff(image, image), 0.0);
    EXPECT_GT(calculatePSNR(image, image), 100.0);
}

TEST(QualityMetricsTest, ConstantOffset) {
    cv::Mat original(8, 8, CV_8UC3, cv::Scalar(0, 0, 0));
    cv::Mat shifted(8, 8, CV_8UC3, cv::Scalar(10, 10, 10));

    EXPECT_DOUBLE_EQ(calculateMAD(original, shifted), 10.0);
    EXPECT_DOUBLE_EQ(calculateMaxPixelDiff(original, shifted), 10.0);
    EXPECT_NEAR(calculatePSNR(original, shifted), 28.13, 0.01);
}

TEST(QualityMetricsTest, SingleOutlier) {
    cv::Mat original(4, 4, CV_8UC3, cv::Scalar(100, 100, 100));
    cv::Mat changed = original.clone();
    changed.at<cv::Vec3b>(2, 1)[0] = 148;

    EXPECT_DOUBLE_EQ(calculateMaxPixelDiff(original, changed), 48.0);
    EXPECT_DOUBLE_EQ(calculateMAD(original, changed), 48.0 / 48.0);
}

TEST(QualityMetricsTest, MismatchedImagesThrow) {
    cv::Mat a(8, 8, CV_8UC3, cv::Scalar(0, 0, 0));
    cv::Mat b(4, 4, CV_8UC3, cv::Scalar(0, 0, 0));
    cv::Mat grey(8, 8, CV_8UC1, cv::Scalar(0));

    EXPECT_THROW(calculatePSNR(a, b), InvalidDimensions);
    EXPECT_THROW(calculateMAD(a, grey), InvalidDimensions);
    EXPECT_THROW(calculateMaxPixelDiff(cv::Mat(), cv::Mat()), InvalidDimensions);
}
