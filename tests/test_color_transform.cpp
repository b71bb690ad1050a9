#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>

#include "ColorTransform.hpp"

namespace {

int maxChannelError(const cv::Vec3b& a, const cv::Vec3b& b) {
    int worst = 0;
    for (int c = 0; c < 3; c++) {
        worst = std::max(worst, std::abs(static_cast<int>(a[c]) - static_cast<int>(b[c])));
    }
    return worst;
}

}

TEST(ColorTransformTest, ForwardKnownValues) {
    EXPECT_EQ(rgbToYCbCr(cv::Vec3b(0, 0, 0)), cv::Vec3b(0, 128, 128));
    EXPECT_EQ(rgbToYCbCr(cv::Vec3b(255, 255, 255)), cv::Vec3b(255, 128, 128));
    EXPECT_EQ(rgbToYCbCr(cv::Vec3b(255, 0, 0)), cv::Vec3b(76, 85, 255));
    EXPECT_EQ(rgbToYCbCr(cv::Vec3b(0, 255, 0)), cv::Vec3b(150, 44, 21));
    EXPECT_EQ(rgbToYCbCr(cv::Vec3b(0, 0, 255)), cv::Vec3b(29, 255, 107));
}

TEST(ColorTransformTest, GreysPassThroughExactly) {
    for (int v = 0; v < 256; v++) {
        cv::Vec3b grey(v, v, v);
        cv::Vec3b ycc = rgbToYCbCr(grey);

        EXPECT_EQ(ycc[0], v);
        EXPECT_EQ(ycc[1], 128);
        EXPECT_EQ(ycc[2], 128);
        EXPECT_EQ(yCbCrToRgb(ycc), grey);
    }
}

TEST(ColorTransformTest, CommonColoursRoundTripWithinOne) {
    const cv::Vec3b colours[] = {
        {255, 0, 0}, {0, 255, 0}, {0, 0, 255},
        {255, 255, 0}, {0, 255, 255}, {255, 0, 255},
        {12, 200, 77}, {90, 60, 30}, {128, 128, 128}
    };

    for (const cv::Vec3b& rgb : colours) {
        cv::Vec3b back = yCbCrToRgb(rgbToYCbCr(rgb));
        EXPECT_LE(maxChannelError(rgb, back), 1) << rgb << " -> " << back;
    }
}

TEST(ColorTransformTest, WholeCubeRoundTripWithinQuantisationBound) {
    // Byte-quantised Y/Cb/Cr planes bound the round trip at two levels per channel
    for (int r = 0; r < 256; r += 3) {
        for (int g = 0; g < 256; g += 3) {
            for (int b = 0; b < 256; b += 3) {
                cv::Vec3b rgb(r, g, b);
                cv::Vec3b back = yCbCrToRgb(rgbToYCbCr(rgb));
                ASSERT_LE(maxChannelError(rgb, back), 2) << rgb << " -> " << back;
            }
        }
    }
}

TEST(ColorTransformTest, SplitAndMergePlanes) {
    std::vector<cv::Vec3b> pixels = {
        {10, 10, 10}, {200, 200, 200},
        {0, 0, 0}, {255, 255, 255}
    };

    std::vector<uint8_t> planes[3];
    splitPlanes(pixels, planes);

    EXPECT_EQ(planes[static_cast<int>(Channel::LUMA)], (std::vector<uint8_t>{10, 200, 0, 255}));
    EXPECT_EQ(planes[static_cast<int>(Channel::CHROMA_BLUE)], (std::vector<uint8_t>{128, 128, 128, 128}));
    EXPECT_EQ(planes[static_cast<int>(Channel::CHROMA_RED)], (std::vector<uint8_t>{128, 128, 128, 128}));

    cv::Mat luma(2, 2, CV_8UC1, planes[0].data());
    cv::Mat cb(2, 2, CV_8UC1, planes[1].data());
    cv::Mat cr(2, 2, CV_8UC1, planes[2].data());
    cv::Mat rgb = mergePlanes(luma, cb, cr);

    ASSERT_EQ(rgb.type(), CV_8UC3);
    EXPECT_EQ(rgb.at<cv::Vec3b>(0, 0), pixels[0]);
    EXPECT_EQ(rgb.at<cv::Vec3b>(0, 1), pixels[1]);
    EXPECT_EQ(rgb.at<cv::Vec3b>(1, 0), pixels[2]);
    EXPECT_EQ(rgb.at<cv::Vec3b>(1, 1), pixels[3]);
}
