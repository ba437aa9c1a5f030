#pragma once

#include "recognition_types.hpp"
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace dre {

// Calibration values for the Feature/OCR rule. Product-specific; tune
// against real uploads rather than trusting the defaults.
struct ModeSelectorConfig {
    double text_density_threshold;   // OCR when text density is above this
    size_t small_contour_threshold;  // ... and small contours exceed this
    size_t max_object_contours;
    double edge_density_threshold;
    double small_contour_area;       // px^2 below which a contour is "small"
    double canny_low;
    double canny_high;

    ModeSelectorConfig()
        : text_density_threshold(0.6)
        , small_contour_threshold(50)
        , max_object_contours(9)
        , edge_density_threshold(0.10)
        , small_contour_area(500.0)
        , canny_low(50.0)
        , canny_high(150.0) {}
};

struct ImageStatistics {
    double edge_density;   // edge pixels / pixels
    double text_density;   // small contours / contours
    size_t contour_count;
    size_t small_contour_count;

    ImageStatistics()
        : edge_density(0.0), text_density(0.0), contour_count(0), small_contour_count(0) {}
};

// Deterministic, stateless choice between appearance match and OCR
class ModeSelector {
public:
    explicit ModeSelector(const ModeSelectorConfig& config = ModeSelectorConfig());

    // Throws InvalidImageError / EmptyImageError for bad bytes
    RecognitionPath select(const std::vector<uint8_t>& image_bytes) const;

    RecognitionPath select(const cv::Mat& image) const;

    ImageStatistics measure(const cv::Mat& image) const;

    // The rule itself, separated so it can be checked without images
    RecognitionPath decide(const ImageStatistics& stats) const;

    const ModeSelectorConfig& config() const {
        return config_;
    }

private:
    ModeSelectorConfig config_;
};

}  // namespace dre
