#include "ChannelPipeline.hpp"
#include "CodecError.hpp"
#include "QueryEngine.hpp"
#include "TreeSerializer.hpp"

#include <chrono>
#include <future>
#include <iostream>
#include <opencv2/imgproc.hpp>

using namespace cv;
using namespace std;

namespace {

// Collapsed regions smaller than this are left unmarked in the overlay
const int OVERLAY_MIN_REGION = 8;

}

ChannelPipeline::ChannelPipeline(const vector<Vec3b>& rgbPixels, int rank, bool verbose)
    : rank(rank), verbose(verbose) {
    if (rank < 2 || !isPowerOfTwo(rank)) {
        throw InvalidDimensions("Image side must be a power of two >= 2, got " + to_string(rank));
    }
    if (rgbPixels.size() != static_cast<size_t>(rank) * static_cast<size_t>(rank)) {
        throw InvalidDimensions("Pixel buffer holds " + to_string(rgbPixels.size()) +
                                " pixels, expected " + to_string(rank) + "x" + to_string(rank));
    }

    buildTrees(rgbPixels);
}

ChannelPipeline::ChannelPipeline(const Mat& rgbImage, bool verbose)
    : ChannelPipeline(pixelsFromImage(rgbImage), rgbImage.rows, verbose) {}

vector<Vec3b> ChannelPipeline::pixelsFromImage(const Mat& rgbImage) {
    if (rgbImage.empty() || rgbImage.type() != CV_8UC3) {
        throw InvalidDimensions("Expected a non-empty 8-bit 3-channel image");
    }
    if (rgbImage.rows != rgbImage.cols) {
        throw InvalidDimensions("Image must be square, got " + to_string(rgbImage.cols) + "x" +
                                to_string(rgbImage.rows));
    }

    vector<Vec3b> pixels;
    pixels.reserve(static_cast<size_t>(rgbImage.rows) * rgbImage.cols);
    for (int y = 0; y < rgbImage.rows; y++) {
        for (int x = 0; x < rgbImage.cols; x++) {
            pixels.push_back(rgbImage.at<Vec3b>(y, x));
        }
    }
    return pixels;
}

void ChannelPipeline::log(const string& message) const {
    if (verbose) {
        cout << message << endl;
    }
}

void ChannelPipeline::buildTrees(const vector<Vec3b>& rgbPixels) {
    log("Building region trees for " + to_string(rank) + "x" + to_string(rank) + " image...");
    auto startTime = chrono::high_resolution_clock::now();

    vector<uint8_t> planes[3];
    splitPlanes(rgbPixels, planes);

    vector<future<RegionTree>> futures;
    for (int c = 0; c < 3; c++) {
        futures.push_back(async(launch::async, [&planes, c, this]() {
            return RegionTree(planes[c], rank);
        }));
    }

    trees.reserve(3);
    for (auto& f : futures) {
        trees.push_back(f.get());
    }

    auto endTime = chrono::high_resolution_clock::now();
    auto duration = chrono::duration_cast<chrono::milliseconds>(endTime - startTime);
    log("Region trees built in " + to_string(duration.count()) + " ms (depth " +
        to_string(trees[0].getTreeDepth()) + ")");
}

Mat ChannelPipeline::reconstructImage(const Cutoffs& cutoffs) const {
    Mat planes[3];
    for (int c = 0; c < 3; c++) {
        planes[c] = reconstructChannel(trees[c], cutoffs.forChannel(static_cast<Channel>(c)));
    }
    return mergePlanes(planes[0], planes[1], planes[2]);
}

size_t ChannelPipeline::compressedSize(const Cutoffs& cutoffs) const {
    size_t total = 0;
    for (int c = 0; c < 3; c++) {
        total += TreeSerializer::encode(trees[c], cutoffs.forChannel(static_cast<Channel>(c))).byteSize();
    }
    return total;
}

double ChannelPipeline::compressionPercentage(const Cutoffs& cutoffs) const {
    double rawSize = 3.0 * rank * rank;
    return (1.0 - static_cast<double>(compressedSize(cutoffs)) / rawSize) * 100.0;
}

vector<uint8_t> ChannelPipeline::serialize(const Cutoffs& cutoffs) const {
    ChannelStreams streams[3];
    for (int c = 0; c < 3; c++) {
        streams[c] = TreeSerializer::encode(trees[c], cutoffs.forChannel(static_cast<Channel>(c)));
    }

    vector<uint8_t> payload;
    for (int c = 0; c < 3; c++) {
        const vector<uint8_t>& bits = streams[c].structure.getBytes();
        payload.insert(payload.end(), bits.begin(), bits.end());
    }
    for (int c = 0; c < 3; c++) {
        payload.insert(payload.end(), streams[c].leafData.begin(), streams[c].leafData.end());
    }

    log("Serialized payload: " + to_string(payload.size()) + " bytes");
    return payload;
}

Mat ChannelPipeline::decodePayload(const vector<uint8_t>& payload, int rank) {
    if (rank < 2 || !isPowerOfTwo(rank)) {
        throw InvalidDimensions("Image side must be a power of two >= 2, got " + to_string(rank));
    }

    // Structure runs are self-delimiting for a known rank
    size_t structureOffset[3];
    StreamExtent extents[3];
    size_t offset = 0;
    for (int c = 0; c < 3; c++) {
        BitReader reader(payload.data() + offset, payload.size() - offset);
        extents[c] = TreeSerializer::measure(reader, rank);
        structureOffset[c] = offset;
        offset += extents[c].structureBytes();
    }

    size_t expected = offset;
    for (int c = 0; c < 3; c++) {
        expected += extents[c].leafDataBytes;
    }
    if (payload.size() != expected) {
        throw FormatError("Payload holds " + to_string(payload.size()) + " bytes, structure describes " +
                          to_string(expected));
    }

    Mat planes[3];
    size_t dataOffset = offset;
    for (int c = 0; c < 3; c++) {
        BitReader structure(payload.data() + structureOffset[c], extents[c].structureBytes());
        ByteReader leafData(payload.data() + dataOffset, extents[c].leafDataBytes);
        planes[c] = TreeSerializer::decode(structure, leafData, rank);
        dataOffset += extents[c].leafDataBytes;
    }

    return mergePlanes(planes[0], planes[1], planes[2]);
}

Cutoffs ChannelPipeline::cutoffsForTarget(double targetPct) const {
    int low = 0;
    int high = 255;

    Cutoffs strongest = {255, 255, 255};
    if (compressionPercentage(strongest) < targetPct) {
        log("Target compression " + to_string(targetPct) + "% not reachable, using cutoff 255");
        return strongest;
    }

    // Payload size is non-increasing in the cutoff, so the first passing cutoff is found by bisection
    while (low < high) {
        int mid = (low + high) / 2;
        uint8_t t = static_cast<uint8_t>(mid);
        Cutoffs candidate = {t, t, t};

        if (compressionPercentage(candidate) >= targetPct) {
            high = mid;
        } else {
            low = mid + 1;
        }
    }

    uint8_t t = static_cast<uint8_t>(low);
    log("Using uniform cutoff " + to_string(low) + " for target " + to_string(targetPct) + "%");
    return Cutoffs{t, t, t};
}

void ChannelPipeline::drawRegions(Mat& image, const RegionNode& node, int x, int y,
                                  int depth, uint8_t cutoff) {
    if (node.isLeaf) return;

    Rect rect(x, y, node.size, node.size);

    if (node.contrast() < cutoff) {
        if (node.size >= OVERLAY_MIN_REGION) {
            Scalar color;
            switch (depth % 3) {
                case 0: color = Scalar(0, 0, 255);   break;
                case 1: color = Scalar(255, 0, 0);   break;
                default: color = Scalar(255, 165, 0); break;
            }
            rectangle(image, rect, color, 1);
        }
        return;
    }

    int half = node.size / 2;
    drawRegions(image, *node.children[0], x, y, depth + 1, cutoff);
    drawRegions(image, *node.children[1], x + half, y, depth + 1, cutoff);
    drawRegions(image, *node.children[2], x, y + half, depth + 1, cutoff);
    drawRegions(image, *node.children[3], x + half, y + half, depth + 1, cutoff);
}

Mat ChannelPipeline::drawRegionOverlay(const Mat& image, uint8_t lumaCutoff) const {
    if (image.rows != rank || image.cols != rank) {
        throw InvalidDimensions("Overlay image must be " + to_string(rank) + "x" + to_string(rank));
    }

    Mat visImage = image.clone();
    drawRegions(visImage, getTree(Channel::LUMA).getRoot(), 0, 0, 0, lumaCutoff);
    return visImage;
}
