/**
 * @file fake_http_client.hpp
 * @brief Scripted HttpClient doubles shared by the unit tests
 */

#pragma once

#include <gmock/gmock.h>
#include <huedisc/net/http_client.hpp>

#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace huedisc {
namespace testing {

/**
 * @brief Returns canned responses by URL; anything else is a connection failure.
 */
class FakeHttpClient : public net::HttpClient {
public:
    void respond(const std::string& url, long status, const std::string& body) {
        std::lock_guard<std::mutex> lock(mutex_);
        net::HttpResult result;
        result.ok = true;
        result.status_code = status;
        result.body = body;
        responses_[url] = result;
    }

    void fail(const std::string& url, const std::string& error, bool timedOut = false) {
        std::lock_guard<std::mutex> lock(mutex_);
        net::HttpResult result;
        result.ok = false;
        result.error = error;
        result.timed_out = timedOut;
        responses_[url] = result;
    }

    /// Every request sleeps this long, or until cancelled.
    void setLatency(std::chrono::milliseconds latency) {
        std::lock_guard<std::mutex> lock(mutex_);
        latency_ = latency;
    }

    net::HttpResult get(const std::string& url,
                        const net::HttpRequestOptions& options,
                        const utils::CancellationToken& token) override {
        std::chrono::milliseconds latency;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(url);
            timeouts_.push_back(options.timeout);
            latency = latency_;
        }

        if (latency.count() > 0 && token.waitFor(latency)) {
            net::HttpResult cancelled;
            cancelled.cancelled = true;
            cancelled.error = "cancelled";
            return cancelled;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = responses_.find(url);
        if (it == responses_.end()) {
            net::HttpResult unreachable;
            unreachable.error = "Couldn't connect to server";
            return unreachable;
        }
        return it->second;
    }

    std::vector<std::string> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::vector<std::chrono::milliseconds> timeouts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return timeouts_;
    }

    size_t requestCount(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto& request : requests_) {
            if (request == url) {
                ++count;
            }
        }
        return count;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, net::HttpResult> responses_;
    std::vector<std::string> requests_;
    std::vector<std::chrono::milliseconds> timeouts_;
    std::chrono::milliseconds latency_{0};
};

class MockHttpClient : public net::HttpClient {
public:
    MOCK_METHOD(net::HttpResult, get,
                (const std::string& url,
                 const net::HttpRequestOptions& options,
                 const utils::CancellationToken& token),
                (override));
};

inline net::HttpResult httpOk(const std::string& body, long status = 200) {
    net::HttpResult result;
    result.ok = true;
    result.status_code = status;
    result.body = body;
    return result;
}

inline net::HttpResult httpFailure(const std::string& error) {
    net::HttpResult result;
    result.error = error;
    return result;
}

inline std::string configBody(const std::string& bridgeId,
                              const std::string& name = "Philips hue",
                              const std::string& modelId = "BSB002") {
    return "{\"name\":\"" + name + "\",\"datastoreversion\":\"131\",\"swversion\":\"1959194040\","
           "\"apiversion\":\"1.59.0\",\"mac\":\"00:17:88:ab:cd:ef\",\"bridgeid\":\"" + bridgeId + "\","
           "\"factorynew\":false,\"replacesbridgeid\":null,\"modelid\":\"" + modelId + "\","
           "\"starterkitid\":\"\"}";
}

inline std::string descriptionBody(const std::string& serial,
                                   const std::string& friendlyName = "Hue Bridge (192.168.1.10)") {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\" ?>\n"
           "<root xmlns=\"urn:schemas-upnp-org:device-1-0\">\n"
           "<specVersion><major>1</major><minor>0</minor></specVersion>\n"
           "<device>\n"
           "<deviceType>urn:schemas-upnp-org:device:Basic:1</deviceType>\n"
           "<friendlyName>" + friendlyName + "</friendlyName>\n"
           "<manufacturer>Signify</manufacturer>\n"
           "<modelDescription>Philips hue Personal Wireless Lighting</modelDescription>\n"
           "<modelName>Philips hue bridge 2015</modelName>\n"
           "<modelNumber>BSB002</modelNumber>\n"
           "<serialNumber>" + serial + "</serialNumber>\n"
           "<UDN>uuid:2f402f80-da50-11e1-9b23-" + serial + "</UDN>\n"
           "</device>\n"
           "</root>\n";
}

}  // namespace testing
}  // namespace huedisc
