#pragma once
#include "core/cancel_token.h"
#include "core/client_error.h"
#include "core/logger.h"
#include "core/result.h"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace spine::infra {

// HTTP 方法
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE
};

const char* to_string(HttpMethod method);

// HTTP 请求
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;  // binary safe (multipart uploads)
    std::string trace_id;    // 可观测性：贯穿请求链路
    std::string request_id;  // 用于 cancel(request_id)
    std::chrono::milliseconds timeout{30000};  // 总超时；0 = 不限（SSE）
    std::chrono::milliseconds connect_timeout{10000};
    // 无数据到达超过该时长即视为超时（SSE 空闲检测）
    std::optional<std::chrono::milliseconds> idle_timeout;
};

// HTTP 响应（任何状态码都会返回 Ok，由调用方翻译非 2xx）
struct HttpResponse {
    int status_code = 0;
    std::map<std::string, std::string> headers;  // keys lower-cased
    std::string body;
    std::string request_id;
    std::chrono::milliseconds elapsed_ms{0};
    bool closed_by_consumer = false;  // stream(): on_chunk returned false

    [[nodiscard]] bool is_success() const {
        return status_code >= 200 && status_code < 300;
    }

    /// Case-insensitive header lookup.
    [[nodiscard]] std::optional<std::string> header(const std::string& name) const;
};

// 传输层错误分类（写入 ClientError::details["http_error_code"]）
enum class HttpErrorCode {
    NETWORK_ERROR = 1001,    // 网络不可达、DNS 失败、连接拒绝、连接中断
    TIMEOUT = 1002,          // 超时（连接/请求/空闲）
    CANCELED = 1003,         // 用户主动取消
    UNKNOWN = 1999
};

const char* to_string(HttpErrorCode code);

// 将传输层错误转为 ClientError（CANCELED 映射为 ErrorKind::Canceled）
spine::core::ClientError make_transport_error(
    HttpErrorCode code,
    const std::string& user_message,
    const std::string& internal_message,
    bool retryable = false
);

// IHttpClient 接口（纯虚类）
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    using Result = spine::core::Result<HttpResponse, spine::core::ClientError>;

    /// Receives body bytes of a 2xx streaming response as they arrive.
    /// Return false to close the connection.
    using ChunkCallback = std::function<bool(std::string_view chunk)>;

    virtual Result get(
        const HttpRequest& request,
        std::shared_ptr<spine::core::CancelToken> cancel_token = nullptr
    ) {
        HttpRequest req = request;
        req.method = HttpMethod::GET;
        return execute(req, std::move(cancel_token));
    }

    virtual Result post(
        const HttpRequest& request,
        std::shared_ptr<spine::core::CancelToken> cancel_token = nullptr
    ) {
        HttpRequest req = request;
        req.method = HttpMethod::POST;
        return execute(req, std::move(cancel_token));
    }

    // 按 request_id 取消 in-flight 请求。
    // 返回 true 表示成功命中并触发取消；false 表示未命中或已完成。
    virtual bool cancel(const std::string& request_id) = 0;

    // 同步请求：完整读取响应体。
    // 只有传输层失败才返回 Err；HTTP 4xx/5xx 以 Ok 返回。
    virtual Result execute(
        const HttpRequest& request,
        std::shared_ptr<spine::core::CancelToken> cancel_token = nullptr
    ) = 0;

    // 流式请求：2xx 响应体逐块交给 on_chunk，非 2xx 响应体收集到 body。
    // 连接结束（EOF 或 on_chunk 返回 false）后返回状态码与响应头。
    virtual Result stream(
        const HttpRequest& request,
        ChunkCallback on_chunk,
        std::shared_ptr<spine::core::CancelToken> cancel_token = nullptr
    ) = 0;
};

// 重试策略配置
struct RetryPolicy {
    int max_retries = 3;  // 最多重试 3 次
    std::chrono::milliseconds initial_backoff{1000};  // 首次退避 1s
    double backoff_multiplier = 2.0;  // 指数退避因子
    std::chrono::milliseconds max_backoff{30000};  // 最大退避 30s
    std::chrono::milliseconds sleep_slice{50};  // 退避期间检查取消的粒度

    // 只重试可重试的传输层错误（HTTP 状态码由上层策略处理）
    bool should_retry(const spine::core::ClientError& error) const {
        return error.kind == spine::core::ErrorKind::Transport && error.retryable;
    }
};

// 带重试的 HttpClient 装饰器（仅用于幂等请求）
class RetryableHttpClient : public IHttpClient {
public:
    RetryableHttpClient(
        std::shared_ptr<IHttpClient> inner,
        RetryPolicy policy = {},
        std::shared_ptr<spine::core::ILogger> logger = nullptr
    );

    Result execute(
        const HttpRequest& request,
        std::shared_ptr<spine::core::CancelToken> cancel_token = nullptr
    ) override;

    // 流式请求不重试：重连策略由 EventStreamClient 负责
    Result stream(
        const HttpRequest& request,
        ChunkCallback on_chunk,
        std::shared_ptr<spine::core::CancelToken> cancel_token = nullptr
    ) override;

    bool cancel(const std::string& request_id) override;

private:
    std::shared_ptr<IHttpClient> inner_;
    RetryPolicy policy_;
    std::shared_ptr<spine::core::ILogger> logger_;
};

} // namespace spine::infra
