/**
 * @file test_validator.cpp
 * @brief Unit tests for Hue descriptor recognition and identity extraction
 */

#include <gtest/gtest.h>
#include <huedisc/core/validator.hpp>
#include <huedisc/core/bridge_record.hpp>

#include "support/fake_http_client.hpp"

using namespace huedisc::core;
using huedisc::testing::configBody;
using huedisc::testing::descriptionBody;

// =============================================================================
// XML descriptors
// =============================================================================

TEST(ValidatorTest, RecognizesVendorMarkers) {
    EXPECT_TRUE(isHueBridgeDescriptor("<modelDescription>Philips Hue Personal</modelDescription>", ContentKind::Xml));
    EXPECT_TRUE(isHueBridgeDescriptor("<manufacturer>Royal Philips Electronics</manufacturer>", ContentKind::Xml));
    EXPECT_TRUE(isHueBridgeDescriptor("<manufacturer>SIGNIFY</manufacturer>", ContentKind::Xml));
    EXPECT_TRUE(isHueBridgeDescriptor("<deviceType>urn:schemas-upnp-org:device:IpBridge:1</deviceType>", ContentKind::Xml));
}

TEST(ValidatorTest, RecognizesModelName) {
    EXPECT_TRUE(isHueBridgeDescriptor("<root><modelName>Hue Bridge</modelName></root>", ContentKind::Xml));
}

TEST(ValidatorTest, RejectsOtherDevices) {
    const char* sonos =
        "<root><device><manufacturer>Sonos, Inc.</manufacturer>"
        "<modelName>Sonos Play:1</modelName><serialNumber>5C-AA-FD-00</serialNumber>"
        "</device></root>";
    EXPECT_FALSE(isHueBridgeDescriptor(sonos, ContentKind::Xml));
    EXPECT_FALSE(validateDescriptor(sonos, ContentKind::Xml).has_value());
    EXPECT_FALSE(isHueBridgeDescriptor("", ContentKind::Xml));
}

TEST(ValidatorTest, ExtractsSerialAndFriendlyName) {
    auto identity = validateDescriptor(descriptionBody("001788a1b2c3", "Upstairs"), ContentKind::Xml);
    ASSERT_TRUE(identity.has_value());
    EXPECT_EQ(identity->id, "001788a1b2c3");
    EXPECT_EQ(identity->name, "Upstairs");
}

TEST(ValidatorTest, FallsBackToUdnSuffix) {
    const char* body =
        "<root><device><manufacturer>Signify</manufacturer>"
        "<modelName>Philips hue bridge 2015</modelName>"
        "<UDN>uuid:2f402f80-da50-11e1-9b23-001788a1b2c3</UDN>"
        "</device></root>";
    auto identity = validateDescriptor(body, ContentKind::Xml);
    ASSERT_TRUE(identity.has_value());
    EXPECT_EQ(identity->id, "001788a1b2c3");
    EXPECT_EQ(identity->name, kDefaultBridgeName);
}

TEST(ValidatorTest, NameFallsBackToModelDescription) {
    const char* body =
        "<root><device><serialNumber>ABC123</serialNumber>"
        "<friendlyName>   </friendlyName>"
        "<modelDescription>Philips hue Personal Wireless Lighting</modelDescription>"
        "</device></root>";
    auto identity = validateDescriptor(body, ContentKind::Xml);
    ASSERT_TRUE(identity.has_value());
    EXPECT_EQ(identity->name, "Philips hue Personal Wireless Lighting");
}

TEST(ValidatorTest, HueMarkersWithoutIdentityAreNotBridges) {
    const char* body = "<root><manufacturer>Signify</manufacturer><modelName>Hue Bridge</modelName></root>";
    EXPECT_TRUE(isHueBridgeDescriptor(body, ContentKind::Xml));
    EXPECT_FALSE(validateDescriptor(body, ContentKind::Xml).has_value());
}

TEST(ValidatorTest, XmlTagMatchingIsCaseInsensitive) {
    const char* body =
        "<root><device><SERIALNUMBER> 001788ffee00 </SERIALNUMBER>"
        "<friendlyname>Hue &amp; Co</friendlyname>"
        "<manufacturer>Philips Hue</manufacturer></device></root>";
    auto identity = validateDescriptor(body, ContentKind::Xml);
    ASSERT_TRUE(identity.has_value());
    EXPECT_EQ(identity->id, "001788ffee00");
    EXPECT_EQ(identity->name, "Hue & Co");
}

TEST(ValidatorTest, FindXmlElementText) {
    const char* body =
        "<?xml version=\"1.0\"?><root xmlns:dev=\"urn:x\">"
        "<dev:serialNumber>A1</dev:serialNumber>"
        "<empty/><blank></blank>"
        "<serialNumber>B2</serialNumber></root>";

    EXPECT_EQ(findXmlElementText(body, "serialNumber").value_or(""), "A1");
    EXPECT_FALSE(findXmlElementText(body, "blank").has_value());
    EXPECT_FALSE(findXmlElementText(body, "missing").has_value());
}

// =============================================================================
// JSON config
// =============================================================================

TEST(ValidatorTest, AcceptsBridgeConfig) {
    auto identity = validateDescriptor(configBody("001788FFFEA1B2C3", "Living room"), ContentKind::Json);
    ASSERT_TRUE(identity.has_value());
    EXPECT_EQ(identity->id, "001788FFFEA1B2C3");
    EXPECT_EQ(identity->name, "Living room");
    EXPECT_TRUE(isHueBridgeDescriptor(configBody("001788FFFEA1B2C3"), ContentKind::Json));
}

TEST(ValidatorTest, ConfigWithoutModelIdIsAccepted) {
    auto identity = extractIdentity(R"({"bridgeid":"AABBCC"})", ContentKind::Json);
    ASSERT_TRUE(identity.has_value());
    EXPECT_EQ(identity->id, "AABBCC");
    EXPECT_EQ(identity->name, kDefaultBridgeName);
}

TEST(ValidatorTest, RejectsConfigWithoutBridgeId) {
    EXPECT_FALSE(extractIdentity(R"({"name":"Philips hue","modelid":"BSB002"})", ContentKind::Json).has_value());
    EXPECT_FALSE(extractIdentity(R"({"bridgeid":"  ","modelid":"BSB002"})", ContentKind::Json).has_value());
}

TEST(ValidatorTest, RejectsForeignModelId) {
    EXPECT_FALSE(extractIdentity(configBody("AABBCC", "Gateway", "TRADFRI-GW"), ContentKind::Json).has_value());
    EXPECT_TRUE(extractIdentity(configBody("AABBCC", "Bridge", "Hue Bridge v3"), ContentKind::Json).has_value());
}

TEST(ValidatorTest, RejectsMalformedJson) {
    EXPECT_FALSE(extractIdentity("", ContentKind::Json).has_value());
    EXPECT_FALSE(extractIdentity("{not json", ContentKind::Json).has_value());
    EXPECT_FALSE(extractIdentity(R"([{"error":{"type":1}}])", ContentKind::Json).has_value());
    EXPECT_FALSE(extractIdentity("<html>Router login</html>", ContentKind::Json).has_value());
}
