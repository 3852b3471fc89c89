/**
 * @file test_cloud_discovery.cpp
 * @brief Unit tests for the cloud discovery endpoint client
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <huedisc/strategies/cloud_discovery.hpp>

#include "support/fake_http_client.hpp"

using namespace huedisc;
using namespace huedisc::strategies;
using namespace std::chrono_literals;
using huedisc::testing::MockHttpClient;
using huedisc::testing::httpFailure;
using huedisc::testing::httpOk;
using ::testing::_;
using ::testing::Return;

namespace {

core::StrategyContext contextFor(std::chrono::milliseconds budget) {
    return core::StrategyContext(utils::CancellationToken(), std::chrono::steady_clock::now() + budget);
}

}  // namespace

// =============================================================================
// Response decoding
// =============================================================================

TEST(CloudResponseTest, DecodesArray) {
    auto bridges = decodeCloudResponse(
        R"([{"id":"001788fffe100491","internalipaddress":"192.168.2.23","port":443},)"
        R"( {"id":"ecb5fafffe0a1b2c","internalipaddress":"192.168.2.24"}])");

    ASSERT_TRUE(bridges.has_value());
    ASSERT_EQ(bridges->size(), 2u);
    EXPECT_EQ((*bridges)[0].normalized_id, "001788FFFE100491");
    EXPECT_EQ((*bridges)[0].ip_address, "192.168.2.23");
    EXPECT_EQ((*bridges)[0].port, 443);
    EXPECT_EQ((*bridges)[1].port, 80);
    EXPECT_EQ((*bridges)[1].name, core::kDefaultBridgeName);
}

TEST(CloudResponseTest, EmptyArrayIsValid) {
    auto bridges = decodeCloudResponse(" [] \n");
    ASSERT_TRUE(bridges.has_value());
    EXPECT_TRUE(bridges->empty());
}

TEST(CloudResponseTest, SkipsIncompleteEntries) {
    auto bridges = decodeCloudResponse(
        R"([{"id":"AABBCC"},{"internalipaddress":"192.168.1.2"},)"
        R"( {"id":"DDEEFF","internalipaddress":"fe80::1"},)"
        R"( {"id":"112233","internalipaddress":"192.168.1.3","macaddress":"00:17:88:aa:bb:cc"}])");

    ASSERT_TRUE(bridges.has_value());
    ASSERT_EQ(bridges->size(), 1u);
    EXPECT_EQ((*bridges)[0].normalized_id, "112233");
}

TEST(CloudResponseTest, RejectsNonJson) {
    EXPECT_FALSE(decodeCloudResponse("").has_value());
    EXPECT_FALSE(decodeCloudResponse("<html>rate limited</html>").has_value());
    EXPECT_FALSE(decodeCloudResponse("[{\"id\":").has_value());
}

// =============================================================================
// Strategy
// =============================================================================

TEST(CloudDiscoveryTest, ReturnsListedBridges) {
    auto http = std::make_shared<MockHttpClient>();
    EXPECT_CALL(*http, get("https://discovery.meethue.com", _, _))
        .WillOnce(Return(httpOk(R"([{"id":"AABBCC","internalipaddress":"192.168.1.10"}])")));

    CloudDiscovery cloud(http);
    auto bridges = cloud.run(contextFor(10s));

    ASSERT_EQ(bridges.size(), 1u);
    EXPECT_EQ(bridges[0].ip_address, "192.168.1.10");
    EXPECT_EQ(cloud.name(), "cloud");
}

TEST(CloudDiscoveryTest, TransportFailureYieldsEmpty) {
    auto http = std::make_shared<MockHttpClient>();
    EXPECT_CALL(*http, get(_, _, _)).WillOnce(Return(httpFailure("Could not resolve host")));

    CloudDiscovery cloud(http);
    EXPECT_TRUE(cloud.run(contextFor(10s)).empty());
}

TEST(CloudDiscoveryTest, RetriesServerErrors) {
    auto http = std::make_shared<MockHttpClient>();
    EXPECT_CALL(*http, get(_, _, _))
        .WillOnce(Return(httpOk("", 503)))
        .WillOnce(Return(httpOk(R"([{"id":"AABBCC","internalipaddress":"192.168.1.10"}])")));

    CloudOptions options;
    options.max_attempts = 3;
    options.backoff_step = 10ms;
    CloudDiscovery cloud(http, options);

    EXPECT_EQ(cloud.run(contextFor(10s)).size(), 1u);
}

TEST(CloudDiscoveryTest, DoesNotRetryClientErrors) {
    auto http = std::make_shared<MockHttpClient>();
    EXPECT_CALL(*http, get(_, _, _)).Times(1).WillOnce(Return(httpOk("", 429)));

    CloudOptions options;
    options.max_attempts = 3;
    options.backoff_step = 10ms;
    CloudDiscovery cloud(http, options);

    EXPECT_TRUE(cloud.run(contextFor(10s)).empty());
}

TEST(CloudDiscoveryTest, CancelledBeforeStartMakesNoRequest) {
    auto http = std::make_shared<MockHttpClient>();
    EXPECT_CALL(*http, get(_, _, _)).Times(0);

    utils::CancellationSource source;
    source.cancel();
    CloudDiscovery cloud(http);

    EXPECT_TRUE(cloud.run(core::StrategyContext(source.token(),
                                                std::chrono::steady_clock::now() + 10s)).empty());
}

TEST(CloudDiscoveryTest, TimeoutClippedToDeadline) {
    auto http = std::make_shared<MockHttpClient>();
    EXPECT_CALL(*http, get(_, _, _))
        .WillOnce([](const std::string&, const net::HttpRequestOptions& options,
                     const utils::CancellationToken&) {
            EXPECT_LE(options.timeout, 1000ms);
            EXPECT_GT(options.timeout, 0ms);
            return httpOk("[]");
        });

    CloudDiscovery cloud(http);
    EXPECT_TRUE(cloud.run(contextFor(1000ms)).empty());
}

TEST(CloudDiscoveryTest, BudgetCoversRetriesAndBackoff) {
    CloudOptions options;
    options.timeout = 5000ms;
    options.max_attempts = 3;
    options.backoff_step = 1000ms;
    CloudDiscovery cloud(nullptr, options);

    EXPECT_EQ(cloud.budget(), 18000ms);
    EXPECT_TRUE(cloud.run(contextFor(1s)).empty());
}
