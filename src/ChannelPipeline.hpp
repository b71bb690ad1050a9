#ifndef CHANNEL_PIPELINE_HPP
#define CHANNEL_PIPELINE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

#include "ColorTransform.hpp"
#include "RegionTree.hpp"

struct Cutoffs {
    uint8_t luma;
    uint8_t cb;
    uint8_t cr;

    uint8_t forChannel(Channel channel) const {
        switch (channel) {
            case Channel::LUMA: return luma;
            case Channel::CHROMA_BLUE: return cb;
            case Channel::CHROMA_RED: return cr;
        }
        return luma;
    }
};

/*
 * Owns one region tree per YCbCr channel, all of the same rank, built concurrently
 * from an RGB image. Trees are never rebuilt: every reconstruction, size estimate and
 * serialization re-walks them with the caller's cutoffs.
 *
 * Payload layout: [structure Y][structure Cb][structure Cr][data Y][data Cb][data Cr],
 * each structure run padded to a whole byte.
 */
class ChannelPipeline {
private:
    std::vector<RegionTree> trees;
    int rank;
    bool verbose;

    void log(const std::string& message) const;
    void buildTrees(const std::vector<cv::Vec3b>& rgbPixels);

    static std::vector<cv::Vec3b> pixelsFromImage(const cv::Mat& rgbImage);
    static void drawRegions(cv::Mat& image, const RegionNode& node, int x, int y,
                            int depth, uint8_t cutoff);

public:
    // Throws InvalidDimensions unless rgbPixels holds rank*rank pixels and rank is a power of two >= 2.
    ChannelPipeline(const std::vector<cv::Vec3b>& rgbPixels, int rank, bool verbose = false);

    // Square CV_8UC3 image in RGB order.
    explicit ChannelPipeline(const cv::Mat& rgbImage, bool verbose = false);

    int getRank() const { return rank; }
    const RegionTree& getTree(Channel channel) const { return trees[static_cast<int>(channel)]; }

    cv::Mat reconstructImage(const Cutoffs& cutoffs) const;

    size_t compressedSize(const Cutoffs& cutoffs) const;
    double compressionPercentage(const Cutoffs& cutoffs) const;

    std::vector<uint8_t> serialize(const Cutoffs& cutoffs) const;
    static cv::Mat decodePayload(const std::vector<uint8_t>& payload, int rank);

    // Smallest uniform cutoff reaching targetPct compression, or 255 on all channels when none does.
    Cutoffs cutoffsForTarget(double targetPct) const;

    // Copy of image with the luma partition at lumaCutoff outlined, colour cycling by depth.
    cv::Mat drawRegionOverlay(const cv::Mat& image, uint8_t lumaCutoff) const;
};

#endif
