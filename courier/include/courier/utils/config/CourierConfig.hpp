//
// Created by ubuntu on 2025/11/6.
//

#ifndef COURIER_COURIER_CONFIG_HPP
#define COURIER_COURIER_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace courier {

// ------------------------------------------------
// [logging]
// ------------------------------------------------
struct LoggingConfig {
    ///  日志级别，如 "debug", "info", "warn", "error"
    std::string level = "info";
    /// 日志输出位置，如 "console", "file", "all", "off"
    std::string output_type = "console";
    /// 指定日志文件文件路径
    std::string file_path = "./logs/courier.log";
    /// 日志轮转配置 : 单个日志文件的最大大小（MB）
    uint16_t max_size_mb = 5;
    /// 日志轮转配置 : 日志文件轮转数量
    uint16_t max_files = 10;
};

/**
 * @brief 连接池容量与保活策略。客户端构造后不再修改。
 */
struct PoolLimits {
    /// 每个 Origin 同时存在的最大连接数（活跃 + 空闲 + 正在创建）
    std::size_t max_connections_per_origin = 10;
    /// 全局空闲连接上限，超过时归还的连接直接关闭
    std::size_t max_keepalive_connections = 20;
    /// 空闲连接的最长保活时间
    std::chrono::milliseconds keepalive_expiry{5000};
};

/**
 * @brief 各阶段独立的超时设置，每一种超时对应不同的错误码。
 */
struct TimeoutConfig {
    /// DNS + TCP + TLS (+ HTTP/2 握手) 的总时限
    std::chrono::milliseconds connect{5000};
    /// 等待连接池空位的时限
    std::chrono::milliseconds pool{5000};
    /// 单次读操作（响应头、响应体分块、HTTP/2 响应）的时限
    std::chrono::milliseconds read{30000};
    /// 写请求的时限
    std::chrono::milliseconds write{30000};
    /// HTTP/2 发送窗口耗尽后等待 WINDOW_UPDATE 的时限
    std::chrono::milliseconds flow_control{30000};
};

// ------------------------------------------------
// [client]
// ------------------------------------------------
struct ClientConfig {
    /// 是否通过 ALPN 协商 HTTP/2。默认true
    bool http2_enabled = true;
    /// 明文 http:// 上直接使用 HTTP/2 (h2c prior knowledge)。默认false
    bool http2_prior_knowledge = false;
    /// 是否验证服务器证书，默认值：true
    bool ssl_verify = true;
    /// 额外的 CA 证书文件路径，为空时只使用系统默认证书
    std::string ca_bundle_path;
    /// 是否读取 HTTP_PROXY / SSL_CERT_FILE 等环境变量。默认true
    bool trust_env = true;
    /// 最大重定向次数.默认3，(0则不跟随重定向)
    uint8_t max_redirects = 3;
    /// 收到 401 后携带凭据重试的次数，默认1
    uint8_t max_auth_retries = 1;
    /// 连接建立超时 TCP + TLS 握手阶段的最大等待时间，默认值：5000ms
    uint32_t connect_timeout_ms = 5000;
    /// 从连接池获取连接的最大等待时间，默认值：5000ms
    uint32_t pool_timeout_ms = 5000;
    /// 读取超时，默认值：30000ms
    uint32_t read_timeout_ms = 30000;
    /// 写入超时，默认值：30000ms
    uint32_t write_timeout_ms = 30000;
    /// HTTP/2 流控等待超时，默认值：30000ms
    uint32_t flow_control_timeout_ms = 30000;
    /// 每个 Origin 的最大连接数，默认值：10
    uint32_t max_connections_per_origin = 10;
    /// 全局最大空闲连接数，默认值：20
    uint32_t max_keepalive_connections = 20;
    /// 空闲连接的保活时间，默认值：5000ms
    /// @note 必须留出安全边际小于服务器的keep alive时间！否则客户端可能在服务器关闭连接的瞬间复用它。
    uint32_t keepalive_expiry_ms = 5000;
    /// 连接池后台维护间隔，0 表示只在 acquire / release 时顺带清理。默认值：5000ms
    uint32_t maintenance_interval_ms = 5000;
    /// HTTP2初始最大并发流数，默认值 100
    /// @note 当自定义最大并发流数大于服务器支持的最大并发流时，以服务器为准
    uint32_t http2_max_concurrent_streams = 100;
    /// Origin 协议探测结果 (h2 / http/1.1) 的缓存时间，默认值：300000ms
    uint32_t protocol_cache_ttl_ms = 300000;
    /// 请求未指定 User-Agent 时使用的值，为空时使用库默认值
    std::string user_agent;

    [[nodiscard]] PoolLimits limits() const {
        return PoolLimits{
            max_connections_per_origin,
            max_keepalive_connections,
            std::chrono::milliseconds(keepalive_expiry_ms)
        };
    }

    [[nodiscard]] TimeoutConfig timeouts() const {
        return TimeoutConfig{
            std::chrono::milliseconds(connect_timeout_ms),
            std::chrono::milliseconds(pool_timeout_ms),
            std::chrono::milliseconds(read_timeout_ms),
            std::chrono::milliseconds(write_timeout_ms),
            std::chrono::milliseconds(flow_control_timeout_ms)
        };
    }
};

struct CourierConfig {
    ClientConfig client;
    LoggingConfig logging;
};

} // namespace courier

#endif //COURIER_COURIER_CONFIG_HPP
