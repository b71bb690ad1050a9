#include "ImageIO.hpp"
#include "CodecError.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

using namespace cv;
using namespace std;
namespace fs = std::filesystem;

Mat loadRgbImage(const string& path) {
    if (!fs::exists(path)) {
        throw DecodeFailure("File not found: " + path);
    }

    Mat image;
    try {
        image = imread(path, IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        throw DecodeFailure("Cannot decode " + path + ": " + e.what());
    }

    if (image.empty()) {
        throw DecodeFailure("Cannot decode " + path + ": file is corrupt or not a supported image");
    }
    if (image.depth() != CV_8U || image.channels() != 3) {
        throw DecodeFailure("Image must have 3 colour channels of 8 bits, got " +
                            to_string(image.channels()) + " channels");
    }

    Mat rgb;
    cvtColor(image, rgb, COLOR_BGR2RGB);
    return rgb;
}

bool saveRgbImage(const string& path, const Mat& rgb) {
    string extension = fs::path(path).extension().string();
    transform(extension.begin(), extension.end(), extension.begin(), ::tolower);

    vector<int> compressionParams;
    if (extension == ".png") {
        compressionParams.push_back(IMWRITE_PNG_COMPRESSION);
        compressionParams.push_back(9);
    } else if (extension == ".jpg" || extension == ".jpeg") {
        compressionParams.push_back(IMWRITE_JPEG_QUALITY);
        compressionParams.push_back(85);
    } else if (extension == ".webp") {
        compressionParams.push_back(IMWRITE_WEBP_QUALITY);
        compressionParams.push_back(80);
    }

    Mat bgr;
    cvtColor(rgb, bgr, COLOR_RGB2BGR);

    try {
        return imwrite(path, bgr, compressionParams);
    } catch (const cv::Exception& e) {
        cout << "Warning: " << e.what() << endl;
        return false;
    }
}

void writePayload(const string& path, const vector<uint8_t>& payload) {
    ofstream out(path, ios::binary);
    if (!out) {
        throw DecodeFailure("Cannot open " + path + " for writing");
    }

    out.write(reinterpret_cast<const char*>(payload.data()), static_cast<streamsize>(payload.size()));
    if (!out) {
        throw DecodeFailure("Failed writing payload to " + path);
    }
}

vector<uint8_t> readPayload(const string& path) {
    ifstream in(path, ios::binary);
    if (!in) {
        throw DecodeFailure("Cannot open payload " + path);
    }

    vector<uint8_t> payload((istreambuf_iterator<char>(in)), istreambuf_iterator<char>());
    if (in.bad()) {
        throw DecodeFailure("Failed reading payload " + path);
    }
    return payload;
}
