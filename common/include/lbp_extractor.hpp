#pragma once

#include "recognition_types.hpp"
#include <opencv2/core.hpp>
#include <cstdint>
#include <vector>

namespace dre {

// Local Binary Pattern texture descriptor (radius 1, 8 neighbours)
class LbpExtractor {
public:
    // Side of the square the grayscale image is resized to
    static constexpr int WORKING_SIZE = 128;

    LbpExtractor() = default;

    // Decode and extract; throws InvalidImageError / EmptyImageError
    FeatureVector extract(const std::vector<uint8_t>& image_bytes) const;

    // Extract from an already decoded BGR or grayscale image
    FeatureVector extract(const cv::Mat& image) const;

    // Decode image bytes to a BGR cv::Mat with the same error contract
    static cv::Mat decode(const std::vector<uint8_t>& image_bytes);

private:
    // Resize + blur the grayscale input
    cv::Mat prepare(const cv::Mat& image) const;

    // 256-bin histogram of LBP codes over the interior pixels
    std::vector<uint32_t> histogram(const cv::Mat& gray) const;
};

}  // namespace dre
