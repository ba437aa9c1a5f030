#include <gtest/gtest.h>
#include "catalog_cache.hpp"
#include "test_support.hpp"

using namespace dre;
using namespace dre::test;

class CatalogCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_.add_drug(1, "阿莫西林胶囊", "Amoxicillin Capsules", "capsule", "red");
        source_.add_drug(2, "维生素C片", "Vitamin C Tablets", "round", "white");
        source_.add_image(1, 10, axis_vector(0), "capsule", "red");
        source_.add_image(2, 11, axis_vector(1), "round", "white");
    }

    FakeCatalogSource source_;
    CatalogCache cache_;
};

TEST_F(CatalogCacheTest, EmptyUntilFirstRefresh) {
    EXPECT_FALSE(cache_.loaded());
    EXPECT_EQ(cache_.generation(), 0u);

    SnapshotPtr snapshot = cache_.current();
    ASSERT_NE(snapshot, nullptr);
    EXPECT_TRUE(snapshot->empty());
}

TEST_F(CatalogCacheTest, RefreshLoadsEntriesAndNames) {
    ASSERT_TRUE(cache_.refresh(source_));

    EXPECT_TRUE(cache_.loaded());
    EXPECT_EQ(cache_.generation(), 1u);

    SnapshotPtr snapshot = cache_.current();
    ASSERT_EQ(snapshot->size(), 2u);
    EXPECT_EQ(snapshot->generation, 1u);
    EXPECT_EQ(snapshot->entries[0].drug_id, 1);
    EXPECT_EQ(snapshot->entries[0].image_id, 10);
    EXPECT_EQ(snapshot->entries[0].shape, "capsule");
    EXPECT_EQ(snapshot->entries[1].color, "white");

    // Chinese and English name per drug
    EXPECT_EQ(snapshot->names.size(), 4u);
}

TEST_F(CatalogCacheTest, FailedRefreshKeepsPreviousSnapshot) {
    ASSERT_TRUE(cache_.refresh(source_));
    SnapshotPtr before = cache_.current();

    source_.fail_snapshot = true;
    EXPECT_FALSE(cache_.refresh(source_));

    EXPECT_TRUE(cache_.loaded());
    EXPECT_EQ(cache_.generation(), 1u);
    EXPECT_EQ(cache_.current(), before);
    EXPECT_EQ(cache_.get_refresh_failures(), 1u);
}

TEST_F(CatalogCacheTest, FailedFirstRefreshLeavesCacheUnloaded) {
    source_.fail_snapshot = true;

    EXPECT_FALSE(cache_.refresh(source_));
    EXPECT_FALSE(cache_.loaded());
    EXPECT_TRUE(cache_.current()->empty());
}

TEST_F(CatalogCacheTest, ReadersKeepTheirSnapshotAcrossRefresh) {
    ASSERT_TRUE(cache_.refresh(source_));
    SnapshotPtr held = cache_.current();

    source_.add_image(2, 12, axis_vector(2), "round", "white");
    ASSERT_TRUE(cache_.refresh(source_));

    EXPECT_EQ(held->size(), 2u);
    EXPECT_EQ(held->generation, 1u);
    EXPECT_EQ(cache_.current()->size(), 3u);
    EXPECT_EQ(cache_.generation(), 2u);
}

TEST_F(CatalogCacheTest, SkipsRowsOfWrongDimension) {
    source_.add_image(2, 13, FeatureVector(FEATURE_DIMENSION / 2, 0.5f));

    SnapshotPtr snapshot = CatalogCache::build(source_, 7);

    EXPECT_EQ(snapshot->size(), 2u);
    EXPECT_EQ(snapshot->generation, 7u);
    for (const auto& entry : snapshot->entries) {
        EXPECT_EQ(entry.features.size(), FEATURE_DIMENSION);
    }
}

TEST(CatalogCacheSqliteTest, RefreshFromStore) {
    SqliteCatalogStore store(":memory:");
    CatalogCache cache;

    // No tables yet
    EXPECT_FALSE(cache.refresh(store));

    store.init_schema();
    DrugInfo info;
    info.license_number = "H31020001";
    info.chinese_name = "对乙酰氨基酚片";
    info.english_name = "Paracetamol Tablets";
    DrugId drug = store.add_drug(info);
    ImageId image = store.add_image(drug, "p.jpg", "/photos/p.jpg");
    store.store_feature_vector(image, axis_vector(4));

    ASSERT_TRUE(cache.refresh(store));
    ASSERT_EQ(cache.current()->size(), 1u);
    EXPECT_EQ(cache.current()->entries[0].drug_id, drug);
    EXPECT_EQ(cache.current()->names.size(), 2u);
}
