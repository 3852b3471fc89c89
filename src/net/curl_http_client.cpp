/**
 * @file curl_http_client.cpp
 * @brief libcurl implementation of HttpClient.
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#include "huedisc/net/http_client.hpp"
#include "huedisc/utils/logger.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace huedisc {
namespace net {

namespace {

// Bodies larger than this are not bridge descriptors.
constexpr size_t kMaxBodyBytes = 1024 * 1024;

std::once_flag g_curlInitOnce;

struct TransferContext {
    std::string* body;
    const utils::CancellationToken* token;
    bool overflow;
};

size_t writeCallback(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    size_t bytes = size * nmemb;
    if (ctx->body->size() + bytes > kMaxBodyBytes) {
        ctx->overflow = true;
        return 0;
    }
    ctx->body->append(data, bytes);
    return bytes;
}

int progressCallback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    // Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
    return ctx->token->isCancelled() ? 1 : 0;
}

struct CurlEasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

}  // namespace

CurlHttpClient::CurlHttpClient() {
    std::call_once(g_curlInitOnce, [] {
        CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (rc != CURLE_OK) {
            LOG_ERROR("Http", "curl_global_init failed: {}", curl_easy_strerror(rc));
        }
    });
}

HttpResult CurlHttpClient::get(const std::string& url,
                               const HttpRequestOptions& options,
                               const utils::CancellationToken& token) {
    HttpResult result;
    if (token.isCancelled()) {
        result.cancelled = true;
        result.error = "cancelled before start";
        return result;
    }

    std::unique_ptr<CURL, CurlEasyDeleter> handle(curl_easy_init());
    if (!handle) {
        result.error = "curl_easy_init failed";
        return result;
    }

    std::unique_ptr<curl_slist, CurlSlistDeleter> headers(
        curl_slist_append(nullptr, ("Accept: " + options.accept).c_str()));

    TransferContext ctx{&result.body, &token, false};
    CURL* curl = handle.get();

    long timeoutMs = static_cast<long>(options.timeout.count());
    if (timeoutMs <= 0) {
        timeoutMs = 1;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeoutMs);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeoutMs);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 3L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options.verify_tls ? 2L : 0L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        result.body.clear();
        result.timed_out = (rc == CURLE_OPERATION_TIMEDOUT);
        result.cancelled = (rc == CURLE_ABORTED_BY_CALLBACK);
        result.error = ctx.overflow ? "response body too large" : curl_easy_strerror(rc);
        LOG_TRACE("Http", "GET {} failed: {}", url, result.error);
        return result;
    }

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &result.status_code);
    result.ok = true;
    LOG_TRACE("Http", "GET {} -> {} ({} bytes)", url, result.status_code, result.body.size());
    return result;
}

}  // namespace net
}  // namespace huedisc
