#include <gtest/gtest.h>
#include "lbp_extractor.hpp"
#include "errors.hpp"
#include "similarity_search.hpp"
#include "test_support.hpp"
#include <numeric>

using namespace dre;
using namespace dre::test;

class LbpExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
        noise_ = noise_image(320, 240, 42);
    }

    LbpExtractor extractor_;
    cv::Mat noise_;
};

TEST_F(LbpExtractorTest, ProducesNormalizedHistogram) {
    FeatureVector features = extractor_.extract(noise_);

    ASSERT_EQ(features.size(), FEATURE_DIMENSION);

    double sum = 0.0;
    for (float value : features) {
        EXPECT_GE(value, 0.0f);
        sum += value;
    }
    EXPECT_NEAR(sum, 1.0, 1e-4);
}

TEST_F(LbpExtractorTest, SameInputSameOutput) {
    FeatureVector first = extractor_.extract(noise_);
    FeatureVector second = extractor_.extract(noise_.clone());

    EXPECT_EQ(first, second);
}

TEST_F(LbpExtractorTest, EncodedBytesMatchDecodedImage) {
    // PNG is lossless, so both entry points see identical pixels
    std::vector<uint8_t> bytes = encode_png(noise_);
    ASSERT_FALSE(bytes.empty());

    EXPECT_EQ(extractor_.extract(bytes), extractor_.extract(noise_));
}

TEST_F(LbpExtractorTest, FlatImageFallsInSingleBin) {
    cv::Mat flat(100, 100, CV_8UC3, cv::Scalar(128, 128, 128));

    FeatureVector features = extractor_.extract(flat);

    // Every neighbour equals the centre, so every code has all bits set
    EXPECT_FLOAT_EQ(features[255], 1.0f);
    EXPECT_FLOAT_EQ(std::accumulate(features.begin(), features.begin() + 255, 0.0f), 0.0f);
}

TEST_F(LbpExtractorTest, GrayscaleInputAccepted) {
    cv::Mat gray;
    cv::cvtColor(noise_, gray, cv::COLOR_BGR2GRAY);

    FeatureVector from_gray = extractor_.extract(gray);
    FeatureVector from_color = extractor_.extract(noise_);

    EXPECT_EQ(from_gray, from_color);
}

TEST_F(LbpExtractorTest, DifferentTexturesDiffer) {
    FeatureVector stripes = extractor_.extract(stripe_image(256, 8));
    FeatureVector noise = extractor_.extract(noise_);

    EXPECT_LT(cosine_similarity(stripes, noise), 0.99f);
    EXPECT_NEAR(cosine_similarity(noise, noise), 1.0f, 1e-5);
}

TEST_F(LbpExtractorTest, EmptyBytesRejected) {
    std::vector<uint8_t> empty;
    EXPECT_THROW(extractor_.extract(empty), InvalidImageError);
}

TEST_F(LbpExtractorTest, GarbageBytesRejected) {
    std::vector<uint8_t> garbage(512);
    for (size_t i = 0; i < garbage.size(); ++i) {
        garbage[i] = static_cast<uint8_t>((i * 37) % 251);
    }

    try {
        extractor_.extract(garbage);
        FAIL() << "Expected InvalidImageError";
    } catch (const InvalidImageError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVALID_IMAGE);
    }
}

TEST_F(LbpExtractorTest, EmptyMatRejected) {
    cv::Mat empty;
    EXPECT_THROW(extractor_.extract(empty), EmptyImageError);
}

TEST_F(LbpExtractorTest, DecodeReturnsColorImage) {
    cv::Mat gray(60, 80, CV_8UC1, cv::Scalar(10));
    cv::Mat decoded = LbpExtractor::decode(encode_png(gray));

    EXPECT_EQ(decoded.cols, 80);
    EXPECT_EQ(decoded.rows, 60);
    EXPECT_EQ(decoded.channels(), 3);
}
