#include <gtest/gtest.h>
#include "mode_selector.hpp"
#include "errors.hpp"
#include "lbp_extractor.hpp"
#include "test_support.hpp"

using namespace dre;
using namespace dre::test;

class ModeSelectorTest : public ::testing::Test {
protected:
    ImageStatistics stats(double text_density, size_t small_contours, size_t contours,
                          double edge_density) {
        ImageStatistics s;
        s.text_density = text_density;
        s.small_contour_count = small_contours;
        s.contour_count = contours;
        s.edge_density = edge_density;
        return s;
    }

    ModeSelector selector_;
};

TEST_F(ModeSelectorTest, DenseSmallContoursChooseOcr) {
    EXPECT_EQ(selector_.decide(stats(0.7, 60, 80, 0.3)), RecognitionPath::OCR);
}

TEST_F(ModeSelectorTest, OcrThresholdsAreStrict) {
    EXPECT_EQ(selector_.decide(stats(0.7, 50, 70, 0.3)), RecognitionPath::FEATURE);
    EXPECT_EQ(selector_.decide(stats(0.6, 100, 160, 0.3)), RecognitionPath::FEATURE);
}

TEST_F(ModeSelectorTest, FewContoursLowEdgesChooseFeature) {
    EXPECT_EQ(selector_.decide(stats(0.0, 0, 3, 0.02)), RecognitionPath::FEATURE);
}

TEST_F(ModeSelectorTest, UndecidedFallsBackToFeature) {
    EXPECT_EQ(selector_.decide(stats(0.1, 5, 40, 0.5)), RecognitionPath::FEATURE);
    EXPECT_EQ(selector_.decide(stats(0.0, 0, 0, 0.0)), RecognitionPath::FEATURE);
}

TEST_F(ModeSelectorTest, OcrRuleCheckedFirst) {
    ModeSelectorConfig config;
    config.max_object_contours = 1000;
    config.edge_density_threshold = 1.0;
    ModeSelector permissive(config);

    // Satisfies both rules
    EXPECT_EQ(permissive.decide(stats(0.9, 80, 90, 0.05)), RecognitionPath::OCR);
}

TEST_F(ModeSelectorTest, CustomThresholdsApply) {
    ModeSelectorConfig config;
    config.text_density_threshold = 0.2;
    config.small_contour_threshold = 5;
    ModeSelector eager(config);

    ImageStatistics sparse = stats(0.3, 10, 33, 0.2);
    EXPECT_EQ(eager.decide(sparse), RecognitionPath::OCR);
    EXPECT_EQ(selector_.decide(sparse), RecognitionPath::FEATURE);
}

TEST_F(ModeSelectorTest, PillPhotoChoosesFeature) {
    std::vector<uint8_t> bytes = encode_png(pill_image(200));

    ImageStatistics measured = selector_.measure(LbpExtractor::decode(bytes));
    EXPECT_LT(measured.edge_density, 0.10);
    EXPECT_EQ(selector_.select(bytes), RecognitionPath::FEATURE);
}

TEST_F(ModeSelectorTest, TextLikeImageChoosesOcr) {
    cv::Mat text = text_like_image(400);

    ImageStatistics measured = selector_.measure(text);
    EXPECT_GT(measured.contour_count, 50u);
    EXPECT_GT(measured.small_contour_count, 50u);
    EXPECT_GT(measured.text_density, 0.6);

    EXPECT_EQ(selector_.select(encode_png(text)), RecognitionPath::OCR);
}

TEST_F(ModeSelectorTest, SelectionIsDeterministic) {
    std::vector<uint8_t> bytes = encode_png(noise_image(160, 120, 7));
    EXPECT_EQ(selector_.select(bytes), selector_.select(bytes));
}

TEST_F(ModeSelectorTest, BadInputRejected) {
    std::vector<uint8_t> garbage = {0x01, 0x02, 0x03, 0x04, 0x05};
    EXPECT_THROW(selector_.select(garbage), InvalidImageError);
    EXPECT_THROW(selector_.measure(cv::Mat()), EmptyImageError);
}
