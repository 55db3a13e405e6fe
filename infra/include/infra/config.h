#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace spine::infra {

/// 扫描客户端配置（只读，启动时加载一次）
struct ScanClientConfig {
    std::string api_base_url = "https://api.oooefam.net";
    std::string device_id;  // 为空时由调用方生成
    std::string log_level = "info";

    // 上传：5xx/传输错误最多重试 3 次（共 4 次），429 只延迟重试 1 次
    int max_server_retries = 3;
    std::chrono::milliseconds upload_initial_backoff{1000};
    std::chrono::milliseconds rate_limit_default_delay{2000};
    std::chrono::milliseconds upload_timeout{60000};

    // 普通请求（结果拉取、清理）
    std::chrono::milliseconds request_timeout{30000};
    int max_transport_retries = 2;

    // SSE：空闲 90s（= 3 × 30s ping），连续失败 5 次放弃
    std::chrono::milliseconds stream_idle_timeout{90000};
    int max_reconnect_attempts = 5;
    std::chrono::milliseconds reconnect_initial_backoff{1000};
    std::chrono::milliseconds reconnect_max_backoff{30000};
    double reconnect_jitter = 0.2;
    std::chrono::milliseconds max_session_duration{5 * 60 * 1000};
    std::chrono::seconds token_ttl{2 * 60 * 60};
    bool forward_pings = false;

    int max_concurrent_streams = 5;

    /// Problems found while loading (invalid values keep their defaults).
    std::vector<std::string> warnings;

    /// Reads SPINE_API_BASE_URL, SPINE_DEVICE_ID, SPINE_LOG_LEVEL,
    /// SPINE_MAX_SERVER_RETRIES, SPINE_STREAM_IDLE_TIMEOUT_MS,
    /// SPINE_MAX_RECONNECTS, SPINE_MAX_CONCURRENT_STREAMS,
    /// SPINE_REQUEST_TIMEOUT_MS and SPINE_FORWARD_PINGS.
    static ScanClientConfig from_environment();
};

} // namespace spine::infra
