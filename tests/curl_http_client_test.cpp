#include <gtest/gtest.h>

#include "core/cancel_token.h"
#include "infra/curl_http_client.h"
#include "infra/http_client.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

using namespace spine::infra;
using namespace spine::core;
using namespace std::chrono_literals;

namespace {

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

std::string reason_phrase(int status) {
    switch (status) {
        case 200:
            return "OK";
        case 204:
            return "No Content";
        case 401:
            return "Unauthorized";
        case 404:
            return "Not Found";
        case 429:
            return "Too Many Requests";
        case 500:
            return "Internal Server Error";
        default:
            return "Status";
    }
}

class LocalHttpServer {
public:
    LocalHttpServer() { start(); }
    ~LocalHttpServer() { stop(); }

    LocalHttpServer(const LocalHttpServer&) = delete;
    LocalHttpServer& operator=(const LocalHttpServer&) = delete;

    std::string base_url() const { return "http://127.0.0.1:" + std::to_string(port_); }
    bool ready() const { return start_error_.empty(); }
    const std::string& start_error() const { return start_error_; }

private:
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> stop_{false};
    std::thread worker_;
    std::string start_error_;

    void start() {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) {
            start_error_ = std::string("socket() failed: ") + std::strerror(errno);
            return;
        }

        int enable = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = htons(0);

        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            start_error_ = std::string("bind() failed: ") + std::strerror(errno);
            ::close(listen_fd_);
            listen_fd_ = -1;
            return;
        }

        socklen_t addr_len = sizeof(addr);
        if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &addr_len) < 0) {
            start_error_ = std::string("getsockname() failed: ") + std::strerror(errno);
            ::close(listen_fd_);
            listen_fd_ = -1;
            return;
        }
        port_ = ntohs(addr.sin_port);

        if (::listen(listen_fd_, 16) < 0) {
            start_error_ = std::string("listen() failed: ") + std::strerror(errno);
            ::close(listen_fd_);
            listen_fd_ = -1;
            return;
        }

        worker_ = std::thread([this] { run_loop(); });
    }

    void stop() {
        stop_.store(true);
        if (listen_fd_ >= 0) {
            ::shutdown(listen_fd_, SHUT_RDWR);
            ::close(listen_fd_);
            listen_fd_ = -1;
        }
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    static bool send_all(int fd, const std::string& data) {
        size_t sent = 0;
        while (sent < data.size()) {
            int flags = 0;
#ifdef MSG_NOSIGNAL
            flags = MSG_NOSIGNAL;
#endif
            const ssize_t n =
                ::send(fd, data.data() + sent, data.size() - sent, flags);
            if (n <= 0) {
                return false;
            }
            sent += static_cast<size_t>(n);
        }
        return true;
    }

    void send_response(int client_fd,
                       int status,
                       const std::string& body,
                       const std::string& request_id = "local-req") {
        std::ostringstream response;
        response << "HTTP/1.1 " << status << ' ' << reason_phrase(status) << "\r\n";
        response << "Content-Type: application/json\r\n";
        response << "Content-Length: " << body.size() << "\r\n";
        response << "X-Request-ID: " << request_id << "\r\n";
        if (status == 429) {
            response << "Retry-After: 3\r\n";
        }
        response << "Connection: close\r\n\r\n";
        response << body;
        (void)send_all(client_fd, response.str());
    }

    void send_slow_stream(int client_fd) {
        constexpr size_t kChunkSize = 1024;
        constexpr int kChunkCount = 120;
        const std::string chunk(kChunkSize, 'a');

        std::ostringstream headers;
        headers << "HTTP/1.1 200 OK\r\n";
        headers << "Content-Type: application/octet-stream\r\n";
        headers << "Content-Length: " << (kChunkSize * kChunkCount) << "\r\n";
        headers << "X-Request-ID: local-stream\r\n";
        headers << "Connection: close\r\n\r\n";

        if (!send_all(client_fd, headers.str())) {
            return;
        }

        for (int i = 0; i < kChunkCount; ++i) {
            if (!send_all(client_fd, chunk)) {
                return;
            }
            std::this_thread::sleep_for(50ms);
        }
    }

    // text/event-stream without Content-Length; the connection close ends it.
    void send_event_stream(int client_fd, bool stall_after_first) {
        std::ostringstream headers;
        headers << "HTTP/1.1 200 OK\r\n";
        headers << "Content-Type: text/event-stream\r\n";
        headers << "Cache-Control: no-cache\r\n";
        headers << "X-Request-ID: local-events\r\n";
        headers << "Connection: close\r\n\r\n";
        if (!send_all(client_fd, headers.str())) {
            return;
        }

        for (int i = 1; i <= 5; ++i) {
            std::ostringstream record;
            record << "id: " << i << "\n";
            record << "event: progress\n";
            record << "data: {\"message\":\"step " << i << "\"}\n\n";
            if (!send_all(client_fd, record.str())) {
                return;
            }
            if (stall_after_first) {
                // Go silent until the client gives up (or the fixture stops).
                for (int waited = 0; waited < 100 && !stop_.load(); ++waited) {
                    std::this_thread::sleep_for(50ms);
                }
                return;
            }
            std::this_thread::sleep_for(20ms);
        }
        (void)send_all(client_fd, "event: complete\ndata: {\"books\":[]}\n\n");
    }

    void handle_client(int client_fd) {
        std::string raw_request;
        char buffer[4096];
        while (raw_request.find("\r\n\r\n") == std::string::npos) {
            const ssize_t n = ::recv(client_fd, buffer, sizeof(buffer), 0);
            if (n <= 0) {
                return;
            }
            raw_request.append(buffer, static_cast<size_t>(n));
        }

        const size_t header_end = raw_request.find("\r\n\r\n");
        std::string headers = raw_request.substr(0, header_end + 4);
        std::string body = raw_request.substr(header_end + 4);

        std::istringstream request_stream(headers);
        std::string request_line;
        std::getline(request_stream, request_line);
        if (!request_line.empty() && request_line.back() == '\r') {
            request_line.pop_back();
        }

        std::string method;
        std::string path;
        std::string version;
        {
            std::istringstream line_stream(request_line);
            line_stream >> method >> path >> version;
        }

        size_t content_length = 0;
        const std::string content_length_tag = "Content-Length:";
        const size_t content_length_pos = headers.find(content_length_tag);
        if (content_length_pos != std::string::npos) {
            size_t value_start = content_length_pos + content_length_tag.size();
            while (value_start < headers.size() && headers[value_start] == ' ') {
                ++value_start;
            }
            size_t value_end = headers.find("\r\n", value_start);
            const std::string value = headers.substr(value_start, value_end - value_start);
            content_length = static_cast<size_t>(std::stoul(value));
        }

        while (body.size() < content_length) {
            const ssize_t n = ::recv(client_fd, buffer, sizeof(buffer), 0);
            if (n <= 0) {
                break;
            }
            body.append(buffer, static_cast<size_t>(n));
        }

        if (method == "GET" && path == "/get") {
            send_response(client_fd, 200, R"({"ok":true})", "local-get");
            return;
        }

        if (method == "POST" && path == "/post") {
            send_response(client_fd, 200, body.empty() ? R"({"ok":true})" : body, "local-post");
            return;
        }

        if (starts_with(path, "/delay/")) {
            const std::string delay_text = path.substr(std::strlen("/delay/"));
            int delay_ms = 0;
            try {
                delay_ms = std::stoi(delay_text);
            } catch (...) {
                delay_ms = 0;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            send_response(client_fd, 200, R"({"delayed":true})", "local-delay");
            return;
        }

        if (method == "GET" && path == "/events") {
            send_event_stream(client_fd, false);
            return;
        }

        if (method == "GET" && path == "/events-stall") {
            send_event_stream(client_fd, true);
            return;
        }

        if (method == "GET" && path == "/echo-headers") {
            send_response(client_fd, 200, headers, "local-echo");
            return;
        }

        if (method == "DELETE" && starts_with(path, "/v3/jobs/scans/")) {
            send_response(client_fd, 204, "", "local-delete");
            return;
        }

        if (path == "/slow-stream") {
            send_slow_stream(client_fd);
            return;
        }

        if (starts_with(path, "/status/")) {
            const std::string status_text = path.substr(std::strlen("/status/"));
            int status_code = 500;
            try {
                status_code = std::stoi(status_text);
            } catch (...) {
                status_code = 500;
            }
            send_response(client_fd, status_code, R"({"status":"custom"})", "local-status");
            return;
        }

        send_response(client_fd, 404, R"({"error":"not found"})", "local-404");
    }

    void run_loop() {
        while (!stop_.load()) {
            sockaddr_in client_addr{};
            socklen_t client_addr_len = sizeof(client_addr);
            const int client_fd =
                ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&client_addr), &client_addr_len);
            if (client_fd < 0) {
                if (stop_.load()) {
                    break;
                }
                if (errno == EINTR) {
                    continue;
                }
                std::this_thread::sleep_for(5ms);
                continue;
            }

            handle_client(client_fd);
            ::close(client_fd);
        }
    }
};


class CurlHttpClientTest : public ::testing::Test {
protected:
    LocalHttpServer server_;

    void SetUp() override {
        if (!server_.ready()) {
            GTEST_SKIP() << "Loopback fixture unavailable: " << server_.start_error();
        }
    }

    HttpRequest make_request(HttpMethod method, const std::string& path,
                             const std::string& id) const {
        HttpRequest request;
        request.method = method;
        request.url = server_.base_url() + path;
        request.trace_id = "trace-" + id;
        request.request_id = "req-" + id;
        request.timeout = 3s;
        return request;
    }
};

TEST_F(CurlHttpClientTest, SimpleGetRequest) {
    CurlHttpClient client;

    auto result = client.execute(make_request(HttpMethod::GET, "/get", "001"));

    ASSERT_TRUE(result.is_ok()) << result.error().internal_message;
    EXPECT_EQ(result.value().status_code, 200);
    EXPECT_NE(result.value().body.find("\"ok\""), std::string::npos);
    EXPECT_EQ(result.value().request_id, "local-get");
    EXPECT_EQ(*result.value().header("Content-Type"), "application/json");
}

TEST_F(CurlHttpClientTest, PostRequest) {
    CurlHttpClient client;

    auto request = make_request(HttpMethod::POST, "/post", "002");
    request.body = R"({"test":"data"})";
    request.headers["Content-Type"] = "application/json";

    auto result = client.execute(request);

    ASSERT_TRUE(result.is_ok()) << result.error().internal_message;
    EXPECT_EQ(result.value().status_code, 200);
    EXPECT_NE(result.value().body.find("test"), std::string::npos);
}

TEST_F(CurlHttpClientTest, BinaryPostBodyIsSentIntact) {
    CurlHttpClient client;

    auto request = make_request(HttpMethod::POST, "/post", "003");
    request.body = std::string("\xFF\xD8\xFF\x00jpeg\x00\r\n", 11);
    request.headers["Content-Type"] = "multipart/form-data; boundary=x";

    auto result = client.execute(request);

    ASSERT_TRUE(result.is_ok()) << result.error().internal_message;
    EXPECT_EQ(result.value().body, request.body);
}

TEST_F(CurlHttpClientTest, RequestHeadersAreSent) {
    CurlHttpClient client;

    auto request = make_request(HttpMethod::GET, "/echo-headers", "004");
    request.headers["Authorization"] = "Bearer token-1";
    request.headers["X-Device-ID"] = "device-7";

    auto result = client.execute(request);

    ASSERT_TRUE(result.is_ok()) << result.error().internal_message;
    EXPECT_NE(result.value().body.find("Authorization: Bearer token-1"), std::string::npos);
    EXPECT_NE(result.value().body.find("X-Device-ID: device-7"), std::string::npos);
}

TEST_F(CurlHttpClientTest, DeleteRequest) {
    CurlHttpClient client;

    auto result = client.execute(
        make_request(HttpMethod::DELETE, "/v3/jobs/scans/job-1/cleanup", "005"));

    ASSERT_TRUE(result.is_ok()) << result.error().internal_message;
    EXPECT_EQ(result.value().status_code, 204);
    EXPECT_TRUE(result.value().is_success());
}

TEST_F(CurlHttpClientTest, Timeout) {
    CurlHttpClient client;

    auto request = make_request(HttpMethod::GET, "/delay/1200", "006");
    request.timeout = 200ms;

    auto result = client.execute(request);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, ErrorKind::Transport);
    EXPECT_EQ(result.error().code, "TIMEOUT");
    EXPECT_TRUE(result.error().retryable);
    EXPECT_EQ(result.error().details.at("request_id"), "req-006");
}

TEST_F(CurlHttpClientTest, CancelRequest) {
    CurlHttpClient client;
    auto cancel_token = CancelToken::create();

    auto request = make_request(HttpMethod::GET, "/slow-stream", "007");
    request.timeout = 30s;

    std::thread canceler([cancel_token]() {
        std::this_thread::sleep_for(200ms);
        cancel_token->request_cancel();
    });

    const auto start = std::chrono::steady_clock::now();
    auto result = client.execute(request, cancel_token);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    canceler.join();

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, ErrorKind::Canceled);
    EXPECT_FALSE(result.error().retryable);
    EXPECT_LT(elapsed.count(), 2000);
}

TEST_F(CurlHttpClientTest, CancelByRequestId) {
    CurlHttpClient client;

    auto request = make_request(HttpMethod::GET, "/slow-stream", "008");
    request.timeout = 30s;

    std::atomic<bool> hit{false};
    std::thread canceler([&client, &hit]() {
        for (int i = 0; i < 100 && !hit.load(); ++i) {
            std::this_thread::sleep_for(20ms);
            hit.store(client.cancel("req-008"));
        }
    });

    auto result = client.execute(request);
    canceler.join();

    ASSERT_TRUE(hit.load());
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, ErrorKind::Canceled);
    EXPECT_FALSE(client.cancel("req-008"));
}

TEST_F(CurlHttpClientTest, NotFoundIsReturnedAsResponse) {
    CurlHttpClient client;

    auto result = client.execute(make_request(HttpMethod::GET, "/status/404", "009"));

    ASSERT_TRUE(result.is_ok()) << result.error().internal_message;
    EXPECT_EQ(result.value().status_code, 404);
    EXPECT_FALSE(result.value().is_success());
    EXPECT_NE(result.value().body.find("custom"), std::string::npos);
}

TEST_F(CurlHttpClientTest, RateLimitHeadersAreCaptured) {
    CurlHttpClient client;

    auto result = client.execute(make_request(HttpMethod::GET, "/status/429", "010"));

    ASSERT_TRUE(result.is_ok()) << result.error().internal_message;
    EXPECT_EQ(result.value().status_code, 429);
    ASSERT_TRUE(result.value().header("Retry-After").has_value());
    EXPECT_EQ(*result.value().header("retry-after"), "3");
}

TEST_F(CurlHttpClientTest, ServerErrorIsReturnedAsResponse) {
    CurlHttpClient client;

    auto result = client.execute(make_request(HttpMethod::GET, "/status/500", "011"));

    ASSERT_TRUE(result.is_ok()) << result.error().internal_message;
    EXPECT_EQ(result.value().status_code, 500);
}

TEST_F(CurlHttpClientTest, ConnectionRefusedIsRetryableNetworkError) {
    CurlHttpClient client;

    HttpRequest request;
    request.url = "http://127.0.0.1:1/unreachable";
    request.request_id = "req-012";
    request.timeout = 2s;
    request.connect_timeout = 1s;

    auto result = client.execute(request);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, ErrorKind::Transport);
    EXPECT_EQ(result.error().code, "NETWORK_ERROR");
    EXPECT_TRUE(result.error().retryable);
}

TEST_F(CurlHttpClientTest, StreamDeliversChunksUntilEof) {
    CurlHttpClient client;

    auto request = make_request(HttpMethod::GET, "/events", "013");
    request.headers["Accept"] = "text/event-stream";
    request.timeout = 10s;

    std::string received;
    auto result = client.stream(request, [&received](std::string_view chunk) {
        received.append(chunk.data(), chunk.size());
        return true;
    });

    ASSERT_TRUE(result.is_ok()) << result.error().internal_message;
    EXPECT_EQ(result.value().status_code, 200);
    EXPECT_FALSE(result.value().closed_by_consumer);
    EXPECT_TRUE(result.value().body.empty());
    EXPECT_NE(received.find("id: 5"), std::string::npos);
    EXPECT_NE(received.find("event: complete"), std::string::npos);
}

TEST_F(CurlHttpClientTest, StreamConsumerCanClose) {
    CurlHttpClient client;

    auto request = make_request(HttpMethod::GET, "/events", "014");
    request.timeout = 10s;

    int chunks = 0;
    auto result = client.stream(request, [&chunks](std::string_view) {
        ++chunks;
        return false;
    });

    ASSERT_TRUE(result.is_ok()) << result.error().internal_message;
    EXPECT_TRUE(result.value().closed_by_consumer);
    EXPECT_EQ(chunks, 1);
}

TEST_F(CurlHttpClientTest, StreamErrorStatusCollectsBody) {
    CurlHttpClient client;

    int chunks = 0;
    auto result = client.stream(make_request(HttpMethod::GET, "/status/401", "015"),
                                [&chunks](std::string_view) {
                                    ++chunks;
                                    return true;
                                });

    ASSERT_TRUE(result.is_ok()) << result.error().internal_message;
    EXPECT_EQ(result.value().status_code, 401);
    EXPECT_EQ(chunks, 0);
    EXPECT_NE(result.value().body.find("custom"), std::string::npos);
}

TEST_F(CurlHttpClientTest, StreamIdleTimeout) {
    CurlHttpClient client;

    auto request = make_request(HttpMethod::GET, "/events-stall", "016");
    request.timeout = 10s;
    request.idle_timeout = 1s;

    std::string received;
    const auto start = std::chrono::steady_clock::now();
    auto result = client.stream(request, [&received](std::string_view chunk) {
        received.append(chunk.data(), chunk.size());
        return true;
    });
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code, "TIMEOUT");
    EXPECT_TRUE(result.error().retryable);
    EXPECT_NE(received.find("id: 1"), std::string::npos);
    EXPECT_LT(elapsed.count(), 4500);
}

TEST_F(CurlHttpClientTest, WithRetryDecorator) {
    auto inner = std::make_shared<CurlHttpClient>();
    RetryPolicy policy;
    policy.max_retries = 2;
    policy.initial_backoff = 100ms;
    policy.max_backoff = 400ms;
    policy.sleep_slice = 10ms;

    RetryableHttpClient retry_client(inner, policy);

    auto request = make_request(HttpMethod::GET, "/delay/800", "017");
    request.timeout = 100ms;

    const auto start = std::chrono::steady_clock::now();
    auto result = retry_client.execute(request);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code, "TIMEOUT");
    EXPECT_EQ(result.error().details.at("retry_count"), "2");
    EXPECT_GE(elapsed.count(), 250);
}

}  // namespace
