/**
 * @file test_accessory_metadata.cpp
 * @brief Unit tests for accessory TXT record interpretation
 */

#include <gtest/gtest.h>
#include <lanscope/core/accessory_metadata.hpp>

using namespace lanscope::core;

TEST(AccessoryMetadataTest, ReadsAllKnownKeys) {
    TxtRecord txt = {
        {"md", "Eve Energy"}, {"pv", "1.1"}, {"ci", "7"}, {"sf", "0"}, {"ff", "1"},
        {"id", "AA:BB:CC:DD:EE:FF"}, {"c#", "5"}, {"s#", "1"}, {"sh", "abcd"},
    };

    AccessoryMetadata meta = parseAccessoryMetadata(txt, "192.168.1.20");
    EXPECT_EQ(meta.displayName, "Eve Energy");
    EXPECT_EQ(meta.model, "Eve Energy");
    EXPECT_EQ(meta.protocolVersion, "1.1");
    EXPECT_EQ(meta.categoryId, 7);
    EXPECT_EQ(meta.categoryName, "Outlet");
    EXPECT_EQ(meta.featureFlags, "1");
    EXPECT_EQ(meta.deviceId, "AA:BB:CC:DD:EE:FF");
    EXPECT_EQ(meta.configNumber, "5");
    EXPECT_EQ(meta.stateNumber, "1");
    EXPECT_EQ(meta.setupHash, "abcd");
    EXPECT_TRUE(meta.paired);
}

TEST(AccessoryMetadataTest, DisplayNameFallsBackToAddress) {
    AccessoryMetadata meta = parseAccessoryMetadata({}, "10.0.0.5");
    EXPECT_EQ(meta.displayName, "10.0.0.5");
    EXPECT_FALSE(meta.model.has_value());
    EXPECT_EQ(meta.categoryName, "Unknown");
    EXPECT_FALSE(meta.paired);
}

TEST(AccessoryMetadataTest, EmptyValuesCountAsAbsent) {
    AccessoryMetadata meta = parseAccessoryMetadata({{"md", ""}}, "10.0.0.5");
    EXPECT_EQ(meta.displayName, "10.0.0.5");
}

TEST(AccessoryMetadataTest, StatusFlagOtherThanZeroIsUnpaired) {
    EXPECT_FALSE(parseAccessoryMetadata({{"sf", "1"}}, "a").paired);
    EXPECT_TRUE(parseAccessoryMetadata({{"sf", "0"}}, "a").paired);
}

TEST(AccessoryMetadataTest, CategoryMapping) {
    EXPECT_EQ(parseAccessoryMetadata({{"ci", "2"}}, "a").categoryName, "Bridge");
    EXPECT_EQ(parseAccessoryMetadata({{"ci", "17"}}, "a").categoryName, "IP Camera");
    EXPECT_EQ(parseAccessoryMetadata({{"ci", "32"}}, "a").categoryName, "Speaker");
    // Unassigned numbers
    EXPECT_EQ(parseAccessoryMetadata({{"ci", "25"}}, "a").categoryName, "Accessory");
    EXPECT_EQ(parseAccessoryMetadata({{"ci", "99"}}, "a").categoryName, "Accessory");
    // Non-numeric
    auto meta = parseAccessoryMetadata({{"ci", "lamp"}}, "a");
    EXPECT_FALSE(meta.categoryId.has_value());
    EXPECT_EQ(meta.categoryName, "Unknown");
}

TEST(AccessoryMetadataTest, CategoryTableEnds) {
    EXPECT_STREQ(accessoryCategoryName(1), "Other");
    EXPECT_STREQ(accessoryCategoryName(32), "Speaker");
    EXPECT_STREQ(accessoryCategoryName(0), "Accessory");
}
