/**
 * @file http_client.hpp
 * @brief Blocking HTTP GET client used by the discovery strategies.
 *
 * HttpClient is the seam between the strategies and the network: tests
 * substitute a fake, production code uses CurlHttpClient.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#pragma once

#include "huedisc/net/export.hpp"
#include "huedisc/utils/cancellation.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace huedisc {
namespace net {

/**
 * @struct HttpRequestOptions
 * @brief Per-request settings.
 */
struct HUEDISC_NET_API HttpRequestOptions {
    std::chrono::milliseconds timeout{5000};
    std::string accept = "*/*";
    std::string user_agent = "huedisc/1.0";
    bool verify_tls = true;
};

/**
 * @struct HttpResult
 * @brief Outcome of a GET request.
 *
 * `ok` means a complete HTTP response was received, whatever its status.
 * Transport failures (timeout, refused, DNS, TLS) leave `ok` false and
 * describe the failure in `error`.
 */
struct HUEDISC_NET_API HttpResult {
    bool ok = false;
    long status_code = 0;
    std::string body;
    std::string error;
    bool timed_out = false;
    bool cancelled = false;

    bool isSuccess() const { return ok && status_code >= 200 && status_code < 300; }
};

/**
 * @class HttpClient
 * @brief Abstract HTTP GET client. Implementations must be thread-safe.
 */
class HUEDISC_NET_API HttpClient {
public:
    virtual ~HttpClient() = default;

    /**
     * @brief Perform a GET request.
     * @param url Absolute http(s) URL.
     * @param options Timeout and header settings.
     * @param token Aborts the transfer when cancelled.
     */
    virtual HttpResult get(const std::string& url,
                           const HttpRequestOptions& options,
                           const utils::CancellationToken& token) = 0;
};

using HttpClientPtr = std::shared_ptr<HttpClient>;

/**
 * @class CurlHttpClient
 * @brief HttpClient backed by a libcurl easy handle per request.
 */
class HUEDISC_NET_API CurlHttpClient final : public HttpClient {
public:
    CurlHttpClient();

    HttpResult get(const std::string& url,
                   const HttpRequestOptions& options,
                   const utils::CancellationToken& token) override;
};

}  // namespace net
}  // namespace huedisc
