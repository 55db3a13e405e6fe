#pragma once

#include "infra/http_client.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <unordered_map>

// 前向声明（隐藏 curl 实现细节）
typedef void CURL;

namespace spine::infra {

/// 基于 libcurl 的真实 HTTP Client 实现
/// 支持：超时、空闲检测、取消、响应头解析、GET/POST/PUT/DELETE、流式读取
///
/// One easy handle per instance, serialized by curl_mutex_. Give each job its
/// own instance so a long-lived stream never blocks another job's requests.
class CurlHttpClient : public IHttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    // 禁止拷贝（CURL handle 不可拷贝）
    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    Result execute(
        const HttpRequest& request,
        std::shared_ptr<spine::core::CancelToken> cancel_token = nullptr
    ) override;

    Result stream(
        const HttpRequest& request,
        ChunkCallback on_chunk,
        std::shared_ptr<spine::core::CancelToken> cancel_token = nullptr
    ) override;

    bool cancel(const std::string& request_id) override;

private:
    CURL* curl_;  // libcurl handle（单实例，非线程安全）
    std::mutex curl_mutex_;
    std::mutex in_flight_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::atomic<bool>>> in_flight_requests_;

    Result perform(const HttpRequest& request, const ChunkCallback* on_chunk,
                   const std::shared_ptr<spine::core::CancelToken>& cancel_token);
    HttpErrorCode classify_curl_error(int curl_code) const;
    // CURL 回调函数定义在 .cpp（依赖 curl_off_t）
};

} // namespace spine::infra
