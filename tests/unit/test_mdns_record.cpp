/**
 * @file test_mdns_record.cpp
 * @brief Unit tests for turning resolved _hue._tcp instances into records
 */

#include <gtest/gtest.h>
#include <huedisc/strategies/mdns_discovery.hpp>

using namespace huedisc;
using namespace huedisc::strategies;

namespace {

MdnsServiceInfo hueService() {
    MdnsServiceInfo info;
    info.service_name = "Philips Hue - A1B2C3";
    info.host_name = "001788a1b2c3.local";
    info.address = "192.168.1.10";
    info.port = 443;
    return info;
}

}  // namespace

TEST(MdnsRecordTest, ParsesTxtRecords) {
    auto txt = parseTxtRecords({"bridgeid=001788fffea1b2c3", "ModelId=BSB002", "flag", "=orphan"});

    EXPECT_EQ(txt.at("bridgeid"), "001788fffea1b2c3");
    EXPECT_EQ(txt.at("modelid"), "BSB002");
    EXPECT_EQ(txt.at("flag"), "");
    EXPECT_EQ(txt.count(""), 0u);
}

TEST(MdnsRecordTest, PrefersBridgeIdTxt) {
    auto info = hueService();
    info.txt["bridgeid"] = "001788fffea1b2c3";

    auto record = bridgeFromMdnsService(info);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->normalized_id, "001788FFFEA1B2C3");
    EXPECT_EQ(record->ip_address, "192.168.1.10");
    EXPECT_EQ(record->port, core::kDefaultBridgePort);
    EXPECT_EQ(record->name, "Philips Hue - A1B2C3");
}

TEST(MdnsRecordTest, FallsBackToServiceNameSuffix) {
    auto record = bridgeFromMdnsService(hueService());
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->normalized_id, "A1B2C3");
}

TEST(MdnsRecordTest, FallsBackToHostLabel) {
    auto info = hueService();
    info.service_name = "Hue Bridge";

    auto record = bridgeFromMdnsService(info);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->normalized_id, "001788A1B2C3");
}

TEST(MdnsRecordTest, RequiresIpv4Address) {
    auto info = hueService();
    info.address = "fe80::217:88ff:fea1:b2c3";
    EXPECT_FALSE(bridgeFromMdnsService(info).has_value());
}

TEST(MdnsRecordTest, RequiresSomeIdentifier) {
    MdnsServiceInfo info;
    info.address = "192.168.1.10";
    EXPECT_FALSE(bridgeFromMdnsService(info).has_value());
}
