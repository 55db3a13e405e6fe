#include "infra/curl_http_client.h"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <stdexcept>

namespace spine::infra {

namespace {
    // 一次性初始化 libcurl（全局）
    struct CurlGlobalInit {
        CurlGlobalInit() { curl_global_init(CURL_GLOBAL_ALL); }
        ~CurlGlobalInit() { curl_global_cleanup(); }
    };
    static CurlGlobalInit g_curl_init;

    // 单次传输的状态，通过 userdata 传给回调
    struct Transfer {
        CURL* curl = nullptr;
        std::string body;
        std::map<std::string, std::string> headers;
        const IHttpClient::ChunkCallback* on_chunk = nullptr;
        bool consumer_closed = false;
        spine::core::CancelToken* cancel_token = nullptr;
        std::atomic<bool>* local_cancel = nullptr;
    };

    std::string trim(const std::string& s) {
        const auto begin = s.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) {
            return {};
        }
        const auto end = s.find_last_not_of(" \t\r\n");
        return s.substr(begin, end - begin + 1);
    }

    // Write callback：2xx 流式响应交给 on_chunk，其余写入 body
    size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* transfer = static_cast<Transfer*>(userdata);
        size_t total_size = size * nmemb;

        if (transfer->on_chunk) {
            long http_code = 0;
            curl_easy_getinfo(transfer->curl, CURLINFO_RESPONSE_CODE, &http_code);
            if (http_code >= 200 && http_code < 300) {
                if (!(*transfer->on_chunk)(std::string_view(ptr, total_size))) {
                    transfer->consumer_closed = true;
                    return 0;  // 返回值不等于 total_size 会让 curl 中止传输
                }
                return total_size;
            }
        }

        transfer->body.append(ptr, total_size);
        return total_size;
    }

    // Header callback：逐行接收响应头
    size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* transfer = static_cast<Transfer*>(userdata);
        size_t total_size = size * nitems;
        std::string line(buffer, total_size);

        if (line.rfind("HTTP/", 0) == 0) {
            // 新的状态行（重定向、100-continue），丢弃之前的头
            transfer->headers.clear();
            return total_size;
        }

        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            return total_size;
        }
        std::string name = trim(line.substr(0, colon));
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        transfer->headers[name] = trim(line.substr(colon + 1));
        return total_size;
    }

    // Progress callback：支持取消
    int progress_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                          curl_off_t ultotal, curl_off_t ulnow) {
        (void)dltotal; (void)dlnow; (void)ultotal; (void)ulnow;  // 避免未使用警告

        auto* transfer = static_cast<Transfer*>(clientp);
        if (transfer->cancel_token && transfer->cancel_token->is_canceled()) {
            return 1;  // 非0返回值会让 curl 中止请求
        }
        if (transfer->local_cancel && transfer->local_cancel->load()) {
            return 1;
        }
        return 0;
    }
}

CurlHttpClient::CurlHttpClient() {
    curl_ = curl_easy_init();
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }
}

CurlHttpClient::~CurlHttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

HttpErrorCode CurlHttpClient::classify_curl_error(int curl_code) const {
    switch (curl_code) {
        case CURLE_OK:
            return HttpErrorCode::UNKNOWN;  // 不应该走到这里

        // 网络错误
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_SSL_CONNECT_ERROR:
            return HttpErrorCode::NETWORK_ERROR;

        // 超时（包括 LOW_SPEED 空闲检测）
        case CURLE_OPERATION_TIMEDOUT:
            return HttpErrorCode::TIMEOUT;

        // 取消
        case CURLE_ABORTED_BY_CALLBACK:
            return HttpErrorCode::CANCELED;

        default:
            return HttpErrorCode::UNKNOWN;
    }
}

IHttpClient::Result CurlHttpClient::execute(
    const HttpRequest& request,
    std::shared_ptr<spine::core::CancelToken> cancel_token
) {
    return perform(request, nullptr, cancel_token);
}

IHttpClient::Result CurlHttpClient::stream(
    const HttpRequest& request,
    ChunkCallback on_chunk,
    std::shared_ptr<spine::core::CancelToken> cancel_token
) {
    return perform(request, on_chunk ? &on_chunk : nullptr, cancel_token);
}

bool CurlHttpClient::cancel(const std::string& request_id) {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    auto it = in_flight_requests_.find(request_id);
    if (it == in_flight_requests_.end()) {
        return false;
    }
    it->second->store(true);
    return true;
}

IHttpClient::Result CurlHttpClient::perform(
    const HttpRequest& request,
    const ChunkCallback* on_chunk,
    const std::shared_ptr<spine::core::CancelToken>& cancel_token
) {
    if (cancel_token && cancel_token->is_canceled()) {
        return Result::Err(make_transport_error(
            HttpErrorCode::CANCELED, "Request was canceled.",
            "Cancellation requested before HTTP call", false));
    }

    std::lock_guard<std::mutex> curl_lock(curl_mutex_);

    auto local_cancel = std::make_shared<std::atomic<bool>>(false);
    if (!request.request_id.empty()) {
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        in_flight_requests_[request.request_id] = local_cancel;
    }

    Transfer transfer;
    transfer.curl = curl_;
    transfer.on_chunk = on_chunk;
    transfer.cancel_token = cancel_token.get();
    transfer.local_cancel = local_cancel.get();

    // 重置 CURL handle（清除上次请求的状态）
    curl_easy_reset(curl_);

    curl_easy_setopt(curl_, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);  // 多线程环境必需

    // 设置超时（毫秒）；0 表示不限制总时长（SSE 长连接）
    if (request.timeout.count() > 0) {
        curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    }
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(request.connect_timeout.count()));

    // 空闲检测：低于 1 字节/秒持续 N 秒即中止
    if (request.idle_timeout) {
        const long idle_seconds = std::max<long>(
            1, static_cast<long>((request.idle_timeout->count() + 999) / 1000));
        curl_easy_setopt(curl_, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl_, CURLOPT_LOW_SPEED_TIME, idle_seconds);
    }

    // 设置请求方法
    switch (request.method) {
        case HttpMethod::GET:
            curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::POST:
            curl_easy_setopt(curl_, CURLOPT_POST, 1L);
            curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
            curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, request.body.data());
            break;
        case HttpMethod::PUT:
        case HttpMethod::DELETE:
            curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, to_string(request.method));
            if (!request.body.empty()) {
                curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
                curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, request.body.data());
            }
            break;
    }

    // 设置请求头
    struct curl_slist* headers = nullptr;
    for (const auto& [key, value] : request.headers) {
        std::string header = key + ": " + value;
        headers = curl_slist_append(headers, header.c_str());
    }
    if (request.method != HttpMethod::GET) {
        headers = curl_slist_append(headers, "Expect:");  // 禁用 100-continue
    }
    if (headers) {
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
    }

    // 响应体与响应头回调
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, &write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, &header_callback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &transfer);

    // 取消支持（通过 progress callback）
    curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, &progress_callback);
    curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, &transfer);
    curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);  // 启用 progress callback

    auto start_time = std::chrono::steady_clock::now();
    CURLcode res = curl_easy_perform(curl_);
    auto end_time = std::chrono::steady_clock::now();
    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    if (headers) {
        curl_slist_free_all(headers);
    }
    if (!request.request_id.empty()) {
        std::lock_guard<std::mutex> lock(in_flight_mutex_);
        in_flight_requests_.erase(request.request_id);
    }

    const bool closed_by_consumer = res == CURLE_WRITE_ERROR && transfer.consumer_closed;
    if (res != CURLE_OK && !closed_by_consumer) {
        HttpErrorCode error_code = classify_curl_error(res);
        std::string curl_error_msg = curl_easy_strerror(res);

        std::string user_message;
        switch (error_code) {
            case HttpErrorCode::NETWORK_ERROR:
                user_message = "Network error occurred. Please check your connection.";
                break;
            case HttpErrorCode::TIMEOUT:
                user_message = "Request timed out. Please try again.";
                break;
            case HttpErrorCode::CANCELED:
                user_message = "Request was canceled.";
                break;
            default:
                user_message = "Unknown error occurred.";
                break;
        }

        std::string internal_message = std::string(to_string(request.method)) + " " +
            request.url + " failed: CURL error: " + curl_error_msg +
            " (code: " + std::to_string(res) + ")";

        auto error = make_transport_error(error_code, user_message, internal_message,
                                          error_code != HttpErrorCode::CANCELED);
        error.details["curl_code"] = std::to_string(res);
        error.details["elapsed_ms"] = std::to_string(elapsed_ms.count());
        if (!request.request_id.empty()) {
            error.details["request_id"] = request.request_id;
        }
        return Result::Err(std::move(error));
    }

    // 获取 HTTP 状态码（任何状态码都作为 Ok 返回，交给上层翻译）
    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);

    HttpResponse response;
    response.status_code = static_cast<int>(http_code);
    response.headers = std::move(transfer.headers);
    response.body = std::move(transfer.body);
    response.elapsed_ms = elapsed_ms;
    response.closed_by_consumer = closed_by_consumer;
    auto server_request_id = response.header("x-request-id");
    response.request_id = server_request_id ? *server_request_id : request.request_id;

    return Result::Ok(std::move(response));
}

} // namespace spine::infra
