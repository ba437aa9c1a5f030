#include <gtest/gtest.h>
#include "text_matching.hpp"

using namespace dre;

class TextMatchingTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::vector<DrugInfo> drugs;
        drugs.push_back(make_drug(1, "布洛芬缓释胶囊", "Ibuprofen Sustained Release Capsules"));
        drugs.push_back(make_drug(2, "阿莫西林胶囊", "Amoxicillin Capsules"));
        drugs.push_back(make_drug(3, "盐酸二甲双胍片", "Metformin Hydrochloride Tablets"));
        index_ = NameIndex(drugs);
    }

    static DrugInfo make_drug(DrugId id, const std::string& chinese_name,
                              const std::string& english_name) {
        DrugInfo drug;
        drug.id = id;
        drug.chinese_name = chinese_name;
        drug.english_name = english_name;
        return drug;
    }

    NameIndex index_;
};

TEST_F(TextMatchingTest, NormalizeFoldsCaseAndDropsSeparators) {
    EXPECT_EQ(normalize_name("Vitamin C, 100mg!"), U"vitaminc100mg");
    EXPECT_EQ(normalize_name("阿莫西林　胶囊（0.25g）"), U"阿莫西林胶囊025g");
    EXPECT_TRUE(normalize_name("  -- ").empty());
}

TEST_F(TextMatchingTest, NormalizeKeepsCjk) {
    std::u32string normalized = normalize_name("布洛芬");
    ASSERT_EQ(normalized.size(), 3u);
    EXPECT_EQ(normalized[0], U'布');
}

TEST_F(TextMatchingTest, SimilarityOfEqualNamesIsOne) {
    EXPECT_FLOAT_EQ(name_similarity(U"ibuprofen", U"ibuprofen"), 1.0f);
}

TEST_F(TextMatchingTest, SimilarityOfEmptyIsZero) {
    EXPECT_FLOAT_EQ(name_similarity(U"", U"ibuprofen"), 0.0f);
}

TEST_F(TextMatchingTest, ContainmentScoresAtLeastFloor) {
    float score = name_similarity(U"ibuprofen", U"ibuprofensustainedreleasecapsules");
    EXPECT_GE(score, 0.8f);
    EXPECT_LT(score, 1.0f);
}

TEST_F(TextMatchingTest, SimilarityUsesCommonSubsequence) {
    // lcs("abcd", "abxd") = 3 -> 2*3/8
    EXPECT_FLOAT_EQ(name_similarity(U"abcd", U"abxd"), 0.75f);
    EXPECT_FLOAT_EQ(name_similarity(U"abc", U"xyz"), 0.0f);
}

TEST_F(TextMatchingTest, IndexHoldsBothNames) {
    EXPECT_EQ(index_.size(), 6u);
}

TEST_F(TextMatchingTest, FuzzyMatchFindsDrugFromPartialText) {
    std::vector<NameMatch> matches = fuzzy_match({"Amoxicillin"}, index_);

    ASSERT_FALSE(matches.empty());
    EXPECT_EQ(matches[0].drug_id, 2);
    EXPECT_GE(matches[0].confidence, 0.8f);
}

TEST_F(TextMatchingTest, FuzzyMatchToleratesOcrNoise) {
    std::vector<NameMatch> matches = fuzzy_match({"Metf0rmin Hydrochlonde Tablets"}, index_);

    ASSERT_FALSE(matches.empty());
    EXPECT_EQ(matches[0].drug_id, 3);
}

TEST_F(TextMatchingTest, FuzzyMatchDropsLowConfidence) {
    EXPECT_TRUE(fuzzy_match({"zzzz"}, index_).empty());
    EXPECT_TRUE(fuzzy_match({}, index_).empty());
    EXPECT_TRUE(fuzzy_match({"Amoxicillin"}, NameIndex()).empty());
}

TEST_F(TextMatchingTest, FuzzyMatchSortsByConfidence) {
    std::vector<NameMatch> matches = fuzzy_match({"阿莫西林胶囊", "布洛芬"}, index_, 0.3f);

    ASSERT_GE(matches.size(), 2u);
    EXPECT_EQ(matches[0].drug_id, 2);
    EXPECT_FLOAT_EQ(matches[0].confidence, 1.0f);
    for (size_t i = 1; i < matches.size(); ++i) {
        EXPECT_GE(matches[i - 1].confidence, matches[i].confidence);
    }
}

TEST_F(TextMatchingTest, BestMatchPerLineFindsEachDrug) {
    std::vector<std::string> prescription = {
        "Rx: 布洛芬缓释胶囊 0.3g x 20",
        "盐酸二甲双胍片",
        "每日两次",
    };

    std::vector<NameMatch> matches = best_match_per_line(prescription, index_, 0.5f);

    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0].drug_id, 3);
    EXPECT_EQ(matches[1].drug_id, 1);
}
