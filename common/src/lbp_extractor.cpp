#include "lbp_extractor.hpp"
#include "errors.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace dre {

cv::Mat LbpExtractor::decode(const std::vector<uint8_t>& image_bytes) {
    if (image_bytes.empty()) {
        throw InvalidImageError("Empty image data");
    }

    cv::Mat decoded;
    try {
        decoded = cv::imdecode(image_bytes, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        throw InvalidImageError("Failed to decode image: " + std::string(e.what()));
    }

    if (decoded.data == nullptr) {
        throw InvalidImageError("Failed to decode image");
    }

    if (decoded.cols <= 0 || decoded.rows <= 0) {
        throw EmptyImageError("Decoded image has zero width or height");
    }

    return decoded;
}

cv::Mat LbpExtractor::prepare(const cv::Mat& image) const {
    if (image.empty() || image.cols <= 0 || image.rows <= 0) {
        throw EmptyImageError("Cannot extract features from empty image");
    }

    cv::Mat gray;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = image;
    }

    cv::Mat resized;
    cv::resize(gray, resized, cv::Size(WORKING_SIZE, WORKING_SIZE), 0, 0, cv::INTER_AREA);

    cv::Mat blurred;
    cv::GaussianBlur(resized, blurred, cv::Size(3, 3), 0);

    return blurred;
}

std::vector<uint32_t> LbpExtractor::histogram(const cv::Mat& gray) const {
    std::vector<uint32_t> bins(FEATURE_DIMENSION, 0);

    // Neighbour offsets, clockwise from the top-left; bit i <- offset i
    static const int dy[8] = {-1, -1, -1, 0, 1, 1, 1, 0};
    static const int dx[8] = {-1, 0, 1, 1, 1, 0, -1, -1};

    for (int y = 1; y < gray.rows - 1; ++y) {
        for (int x = 1; x < gray.cols - 1; ++x) {
            const uint8_t center = gray.at<uint8_t>(y, x);
            uint8_t code = 0;
            for (int bit = 0; bit < 8; ++bit) {
                if (gray.at<uint8_t>(y + dy[bit], x + dx[bit]) >= center) {
                    code |= static_cast<uint8_t>(1u << bit);
                }
            }
            bins[code]++;
        }
    }

    return bins;
}

FeatureVector LbpExtractor::extract(const cv::Mat& image) const {
    cv::Mat gray = prepare(image);
    std::vector<uint32_t> bins = histogram(gray);

    uint64_t sum = 0;
    for (uint32_t count : bins) {
        sum += count;
    }

    FeatureVector features(FEATURE_DIMENSION, 0.0f);
    if (sum == 0) {
        return features;
    }

    // Accumulate in double so the vector sums to 1 within float tolerance
    const double inv = 1.0 / static_cast<double>(sum);
    for (size_t i = 0; i < FEATURE_DIMENSION; ++i) {
        features[i] = static_cast<float>(bins[i] * inv);
    }

    return features;
}

FeatureVector LbpExtractor::extract(const std::vector<uint8_t>& image_bytes) const {
    cv::Mat image = decode(image_bytes);
    return extract(image);
}

}  // namespace dre
