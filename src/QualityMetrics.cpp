#include "QualityMetrics.hpp"
#include "CodecError.hpp"

#include <string>

using namespace cv;
using namespace std;

namespace {

void checkComparable(const Mat& original, const Mat& reconstructed) {
    if (original.empty() || original.size() != reconstructed.size() ||
        original.type() != reconstructed.type()) {
        throw InvalidDimensions("Images differ in size or type: " +
                                to_string(original.cols) + "x" + to_string(original.rows) + " vs " +
                                to_string(reconstructed.cols) + "x" + to_string(reconstructed.rows));
    }
}

}

double calculatePSNR(const Mat& original, const Mat& reconstructed) {
    checkComparable(original, reconstructed);
    return cv::PSNR(original, reconstructed);
}

double calculateMAD(const Mat& original, const Mat& reconstructed) {
    checkComparable(original, reconstructed);

    double sum = cv::norm(original, reconstructed, NORM_L1);
    return sum / (static_cast<double>(original.total()) * original.channels());
}

double calculateMaxPixelDiff(const Mat& original, const Mat& reconstructed) {
    checkComparable(original, reconstructed);
    return cv::norm(original, reconstructed, NORM_INF);
}
