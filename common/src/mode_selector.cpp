#include "mode_selector.hpp"
#include "errors.hpp"
#include "lbp_extractor.hpp"
#include <opencv2/imgproc.hpp>

namespace dre {

ModeSelector::ModeSelector(const ModeSelectorConfig& config)
    : config_(config) {}

ImageStatistics ModeSelector::measure(const cv::Mat& image) const {
    if (image.empty()) {
        throw EmptyImageError("Cannot measure an empty image");
    }

    cv::Mat gray;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else if (image.channels() == 4) {
        cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
    } else {
        gray = image;
    }

    cv::Mat edges;
    cv::Canny(gray, edges, config_.canny_low, config_.canny_high);

    ImageStatistics stats;
    stats.edge_density = static_cast<double>(cv::countNonZero(edges)) /
                         static_cast<double>(edges.total());

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(edges, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    stats.contour_count = contours.size();
    for (const auto& contour : contours) {
        if (cv::contourArea(contour) < config_.small_contour_area) {
            stats.small_contour_count++;
        }
    }

    if (stats.contour_count > 0) {
        stats.text_density = static_cast<double>(stats.small_contour_count) /
                             static_cast<double>(stats.contour_count);
    }

    return stats;
}

RecognitionPath ModeSelector::decide(const ImageStatistics& stats) const {
    if (stats.text_density > config_.text_density_threshold &&
        stats.small_contour_count > config_.small_contour_threshold) {
        return RecognitionPath::OCR;
    }

    if (stats.contour_count <= config_.max_object_contours &&
        stats.edge_density < config_.edge_density_threshold) {
        return RecognitionPath::FEATURE;
    }

    // Undecided images go to the appearance path
    return RecognitionPath::FEATURE;
}

RecognitionPath ModeSelector::select(const cv::Mat& image) const {
    return decide(measure(image));
}

RecognitionPath ModeSelector::select(const std::vector<uint8_t>& image_bytes) const {
    return select(LbpExtractor::decode(image_bytes));
}

}  // namespace dre
