#include "ColorTransform.hpp"

#include <algorithm>
#include <cmath>

using namespace cv;
using namespace std;

namespace {

uchar clampByte(double value) {
    long rounded = lround(value);
    return static_cast<uchar>(std::clamp<long>(rounded, 0, 255));
}

}

Vec3b rgbToYCbCr(const Vec3b& rgb) {
    double r = rgb[0];
    double g = rgb[1];
    double b = rgb[2];

    return Vec3b(
        clampByte(0.299 * r + 0.587 * g + 0.114 * b),
        clampByte(-0.169 * r - 0.331 * g + 0.501 * b + 128.0),
        clampByte(0.5 * r - 0.419 * g - 0.081 * b + 128.0)
    );
}

Vec3b yCbCrToRgb(const Vec3b& ycc) {
    double y = ycc[0];
    double cb = ycc[1] - 128.0;
    double cr = ycc[2] - 128.0;

    return Vec3b(
        clampByte(y + 1.402 * cr),
        clampByte(y - 0.344 * cb - 0.714 * cr),
        clampByte(y + 1.772 * cb)
    );
}

void splitPlanes(const vector<Vec3b>& rgbPixels, vector<uint8_t> planes[3]) {
    for (int c = 0; c < 3; c++) {
        planes[c].assign(rgbPixels.size(), 0);
    }

    for (size_t i = 0; i < rgbPixels.size(); i++) {
        Vec3b ycc = rgbToYCbCr(rgbPixels[i]);
        planes[static_cast<int>(Channel::LUMA)][i] = ycc[0];
        planes[static_cast<int>(Channel::CHROMA_BLUE)][i] = ycc[1];
        planes[static_cast<int>(Channel::CHROMA_RED)][i] = ycc[2];
    }
}

Mat mergePlanes(const Mat& luma, const Mat& chromaBlue, const Mat& chromaRed) {
    Mat rgb(luma.rows, luma.cols, CV_8UC3);

    for (int y = 0; y < luma.rows; y++) {
        for (int x = 0; x < luma.cols; x++) {
            Vec3b ycc(luma.at<uchar>(y, x), chromaBlue.at<uchar>(y, x), chromaRed.at<uchar>(y, x));
            rgb.at<Vec3b>(y, x) = yCbCrToRgb(ycc);
        }
    }
    return rgb;
}
