/**
 * @file test_strategy_factory.cpp
 * @brief Unit tests for strategy set assembly
 */

#include <gtest/gtest.h>
#include <huedisc/strategies/strategy_factory.hpp>

#include "support/fake_http_client.hpp"

using namespace huedisc;
using namespace huedisc::strategies;

namespace {

std::vector<std::string> names(const std::vector<core::DiscoveryStrategyPtr>& strategies) {
    std::vector<std::string> result;
    for (const auto& strategy : strategies) {
        result.push_back(strategy->name());
    }
    return result;
}

}  // namespace

class StrategyFactoryTest : public ::testing::Test {
protected:
    DiscoveryOptions options_;
    net::HttpClientPtr http_ = std::make_shared<huedisc::testing::FakeHttpClient>();
};

TEST_F(StrategyFactoryTest, WithoutMdnsRunsSequentially) {
    PlatformCapabilities caps;
    caps.mdns = false;

    auto set = buildStrategySet(options_, caps, http_);

    EXPECT_EQ(set.mode, core::DiscoveryMode::SequentialFallback);
    EXPECT_EQ(names(set.fast_path), std::vector<std::string>({"cloud"}));
    EXPECT_EQ(names(set.fallback), std::vector<std::string>({"smart", "ip-scan"}));
}

TEST_F(StrategyFactoryTest, SsdpJoinsFallbackWhenEnabled) {
    options_.enable_ssdp = true;

    auto set = buildStrategySet(options_, PlatformCapabilities(), http_);
    EXPECT_EQ(names(set.fallback), std::vector<std::string>({"smart", "ip-scan", "ssdp"}));
}

TEST_F(StrategyFactoryTest, DisablingMdnsIsHonoured) {
    EXPECT_FALSE(detectPlatformCapabilities(true).mdns);
}

#if defined(HUEDISC_HAVE_AVAHI)

TEST_F(StrategyFactoryTest, WithMdnsFansOut) {
    PlatformCapabilities caps;
    caps.mdns = true;

    auto set = buildStrategySet(options_, caps, http_);

    EXPECT_EQ(set.mode, core::DiscoveryMode::ConcurrentFanOut);
    EXPECT_EQ(names(set.fast_path), std::vector<std::string>({"mdns", "cloud"}));
    EXPECT_EQ(names(set.fallback), std::vector<std::string>({"smart", "ip-scan"}));
}

TEST_F(StrategyFactoryTest, AvahiBuildsReportMdns) {
    EXPECT_TRUE(detectPlatformCapabilities(false).mdns);
}

#else

TEST_F(StrategyFactoryTest, BuildsWithoutAvahiReportNoMdns) {
    EXPECT_FALSE(detectPlatformCapabilities(false).mdns);
}

#endif
