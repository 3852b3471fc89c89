/**
 * @file test_bridge_record.cpp
 * @brief Unit tests for bridge records, id normalization and deduplication
 */

#include <gtest/gtest.h>
#include <huedisc/core/bridge_record.hpp>

#include <sstream>

using namespace huedisc::core;

TEST(BridgeRecordTest, NormalizeId) {
    EXPECT_EQ(normalizeBridgeId("001788fffe"), "001788FFFE");
    EXPECT_EQ(normalizeBridgeId("  ec:b5:fa:1a:2b:3c "), "ECB5FA1A2B3C");
    EXPECT_EQ(normalizeBridgeId(""), "");
}

TEST(BridgeRecordTest, NormalizationIsIdempotent) {
    std::string once = normalizeBridgeId("ec:b5:fa:ff:fe:1a:2b:3c");
    EXPECT_EQ(normalizeBridgeId(once), once);
}

TEST(BridgeRecordTest, MakeFillsDefaults) {
    auto record = BridgeRecord::make(" 001788fffe ", "192.168.1.10");
    EXPECT_EQ(record.id, "001788fffe");
    EXPECT_EQ(record.normalized_id, "001788FFFE");
    EXPECT_EQ(record.ip_address, "192.168.1.10");
    EXPECT_EQ(record.port, kDefaultBridgePort);
    EXPECT_EQ(record.name, kDefaultBridgeName);
}

TEST(BridgeRecordTest, MakeKeepsExplicitValues) {
    auto record = BridgeRecord::make("AABBCC", "10.0.0.2", 8080, "Living room");
    EXPECT_EQ(record.port, 8080);
    EXPECT_EQ(record.name, "Living room");
    EXPECT_EQ(record.endpoint(), "10.0.0.2:8080");

    auto zeroPort = BridgeRecord::make("AABBCC", "10.0.0.2", 0, "   ");
    EXPECT_EQ(zeroPort.port, kDefaultBridgePort);
    EXPECT_EQ(zeroPort.name, kDefaultBridgeName);
    EXPECT_EQ(zeroPort.endpoint(), "10.0.0.2");
}

TEST(BridgeRecordTest, NormalizedReplacesRawId) {
    auto record = BridgeRecord::make("ec:b5:fa:1a:2b:3c", "192.168.1.10").normalized();
    EXPECT_EQ(record.id, "ECB5FA1A2B3C");
    EXPECT_EQ(record.normalized_id, "ECB5FA1A2B3C");
}

TEST(BridgeRecordTest, SameBridgeByIdOrAddress) {
    auto a = BridgeRecord::make("001788fffe", "192.168.1.10");
    auto sameId = BridgeRecord::make("001788FFFE", "192.168.1.99");
    auto sameIp = BridgeRecord::make("AABBCC", "192.168.1.10");
    auto other = BridgeRecord::make("AABBCC", "192.168.1.11");

    EXPECT_TRUE(a.sameBridgeAs(sameId));
    EXPECT_TRUE(a.sameBridgeAs(sameIp));
    EXPECT_FALSE(a.sameBridgeAs(other));
}

TEST(BridgeRecordTest, DedupeCollapsesCaseVariants) {
    std::vector<BridgeRecord> records = {
        BridgeRecord::make("001788FFFE", "192.168.1.10"),
        BridgeRecord::make("001788fffe", "192.168.1.10"),
    };

    auto unique = dedupeBridges(records);
    ASSERT_EQ(unique.size(), 1u);
    EXPECT_EQ(unique[0].normalized_id, "001788FFFE");
    EXPECT_EQ(unique[0].id, "001788FFFE");
}

TEST(BridgeRecordTest, DedupeFirstSeenWins) {
    std::vector<BridgeRecord> records = {
        BridgeRecord::make("AABBCC", "192.168.1.10", 80, "First"),
        BridgeRecord::make("DDEEFF", "192.168.1.10", 80, "Same address"),
        BridgeRecord::make("aabbcc", "192.168.1.20", 80, "Same id"),
        BridgeRecord::make("112233", "192.168.1.30", 80, "Distinct"),
    };

    auto unique = dedupeBridges(records);
    ASSERT_EQ(unique.size(), 2u);
    EXPECT_EQ(unique[0].name, "First");
    EXPECT_EQ(unique[1].name, "Distinct");
}

TEST(BridgeRecordTest, DedupeIsIdempotent) {
    std::vector<BridgeRecord> records = {
        BridgeRecord::make("aabbcc", "192.168.1.10"),
        BridgeRecord::make("112233", "192.168.1.30"),
        BridgeRecord::make("AABBCC", "192.168.1.40"),
    };

    auto once = dedupeBridges(records);
    EXPECT_EQ(dedupeBridges(once), once);
}

TEST(BridgeRecordTest, StreamOutput) {
    std::ostringstream oss;
    oss << BridgeRecord::make("aabbcc", "192.168.1.10", 80, "Hue");
    EXPECT_EQ(oss.str(), "AABBCC@192.168.1.10 (Hue)");
}
