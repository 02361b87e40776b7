//
// Created by ubuntu on 2025/11/5.
//

#ifndef COURIER_COURIER_ERROR_HPP
#define COURIER_COURIER_ERROR_HPP

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <string>
#include <type_traits>

// =======================================================================
// 🔹 命名空间： courier_error::network (传输层 / 连接池错误)
// =======================================================================
namespace courier_error::network {
    // 定义错误枚举
    enum class code {
        connect_failed = 1,     // DNS / TCP / TLS 建立失败
        connect_timeout,        // 建立连接超时
        pool_timeout,           // 等待连接池空位超时
        read_timeout,           // 读取响应超时
        write_timeout,          // 写请求超时
        connection_lost,        // 交换过程中连接被对端关闭或出现 I/O 错误
        pool_closed,            // 连接池已关闭
    };

    // 自定义网络错误类别 (继承 boost::system::error_category)
    class category_impl final : public boost::system::error_category {
    public:
        const char* name() const noexcept override {
            return "courier.network";
        }

        std::string message(int ev) const override {
            switch (static_cast<code>(ev)) {
                case code::connect_failed: return "Failed to establish connection";
                case code::connect_timeout: return "Connection establishment timed out";
                case code::pool_timeout: return "Timed out waiting for a pooled connection";
                case code::read_timeout: return "Read timed out";
                case code::write_timeout: return "Write timed out";
                case code::connection_lost: return "Connection lost during exchange";
                case code::pool_closed: return "Connection pool is closed";
                default: return "Unknown network error";
            }
        }
    };

    // 全局访问接口
    inline const boost::system::error_category& category() {
        static category_impl instance;
        return instance;
    }

    // 为了让 error_code 能从枚举隐式构造，必须在同命名空间提供此函数 (ADL)
    inline boost::system::error_code make_error_code(code e) {
        return {static_cast<int>(e), category()};
    }

    // 预定义的 error_code 常量
    inline const boost::system::error_code connect_failed  = make_error_code(code::connect_failed);
    inline const boost::system::error_code connect_timeout = make_error_code(code::connect_timeout);
    inline const boost::system::error_code pool_timeout    = make_error_code(code::pool_timeout);
    inline const boost::system::error_code read_timeout    = make_error_code(code::read_timeout);
    inline const boost::system::error_code write_timeout   = make_error_code(code::write_timeout);
    inline const boost::system::error_code connection_lost = make_error_code(code::connection_lost);
    inline const boost::system::error_code pool_closed     = make_error_code(code::pool_closed);

} // namespace courier_error::network


// =======================================================================
// 🔹 命名空间： courier_error::protocol (HTTP/1.1 与 HTTP/2 协议错误)
// =======================================================================
namespace courier_error::protocol {

    enum class code {
        protocol_error = 1,     // 报文分帧或协议合规性错误，连接必须关闭
        connection_busy,        // HTTP/1.1 连接上已有进行中的交换
        too_many_streams,       // 达到 SETTINGS_MAX_CONCURRENT_STREAMS
        flow_control_timeout,   // 发送窗口耗尽且在期限内未收到 WINDOW_UPDATE
        stream_reset,           // 对端发送 RST_STREAM
        goaway_received,        // 对端发送 GOAWAY
    };

    class category_impl final : public boost::system::error_category {
    public:
        const char* name() const noexcept override {
            return "courier.protocol";
        }

        std::string message(int ev) const override {
            switch (static_cast<code>(ev)) {
                case code::protocol_error: return "HTTP protocol error";
                case code::connection_busy: return "Connection already has an exchange in flight";
                case code::too_many_streams: return "Concurrent stream limit reached";
                case code::flow_control_timeout: return "Flow control window was not replenished in time";
                case code::stream_reset: return "Stream reset by peer";
                case code::goaway_received: return "Peer sent GOAWAY";
                default: return "Unknown protocol error";
            }
        }
    };

    inline const boost::system::error_category& category() {
        static category_impl instance;
        return instance;
    }

    //  ADL 支持函数
    inline boost::system::error_code make_error_code(code e) {
        return {static_cast<int>(e), category()};
    }

    inline const boost::system::error_code protocol_error       = make_error_code(code::protocol_error);
    inline const boost::system::error_code connection_busy      = make_error_code(code::connection_busy);
    inline const boost::system::error_code too_many_streams     = make_error_code(code::too_many_streams);
    inline const boost::system::error_code flow_control_timeout = make_error_code(code::flow_control_timeout);
    inline const boost::system::error_code stream_reset         = make_error_code(code::stream_reset);
    inline const boost::system::error_code goaway_received      = make_error_code(code::goaway_received);

} // namespace courier_error::protocol


// =======================================================================
// 🔹 命名空间： courier_error::adapter (适配器链错误)
// =======================================================================
namespace courier_error::adapter {

    enum class code {
        too_many_redirects = 1,     // 超过 max_redirects
        auth_failed,                // 认证策略无法应答质询
        request_body_unavailable,   // 流式请求体已被消费，无法重放
    };

    class category_impl final : public boost::system::error_category {
    public:
        const char* name() const noexcept override {
            return "courier.adapter";
        }

        std::string message(int ev) const override {
            switch (static_cast<code>(ev)) {
                case code::too_many_redirects: return "Exceeded maximum number of redirects";
                case code::auth_failed: return "Authentication strategy could not answer the challenge";
                case code::request_body_unavailable: return "Streamed request body cannot be replayed";
                default: return "Unknown adapter error";
            }
        }
    };

    inline const boost::system::error_category& category() {
        static category_impl instance;
        return instance;
    }

    inline boost::system::error_code make_error_code(code e) {
        return {static_cast<int>(e), category()};
    }

    inline const boost::system::error_code too_many_redirects       = make_error_code(code::too_many_redirects);
    inline const boost::system::error_code auth_failed              = make_error_code(code::auth_failed);
    inline const boost::system::error_code request_body_unavailable = make_error_code(code::request_body_unavailable);

} // namespace courier_error::adapter


// =======================================================================
// 🔹 命名空间： courier_error::response (响应对象的使用错误)
// =======================================================================
namespace courier_error::response {

    enum class code {
        http_status = 1,        // raise_for_status 遇到 4xx / 5xx
        stream_consumed,        // 响应体流已被消费
        response_not_read,      // 未调用 read() 就访问 content()
        response_closed,        // 响应已关闭
    };

    class category_impl final : public boost::system::error_category {
    public:
        const char* name() const noexcept override {
            return "courier.response";
        }

        std::string message(int ev) const override {
            switch (static_cast<code>(ev)) {
                case code::http_status: return "HTTP error status";
                case code::stream_consumed: return "Response body stream has already been consumed";
                case code::response_not_read: return "Response content has not been read";
                case code::response_closed: return "Response has been closed";
                default: return "Unknown response error";
            }
        }
    };

    inline const boost::system::error_category& category() {
        static category_impl instance;
        return instance;
    }

    inline boost::system::error_code make_error_code(code e) {
        return {static_cast<int>(e), category()};
    }

    inline const boost::system::error_code http_status       = make_error_code(code::http_status);
    inline const boost::system::error_code stream_consumed   = make_error_code(code::stream_consumed);
    inline const boost::system::error_code response_not_read = make_error_code(code::response_not_read);
    inline const boost::system::error_code response_closed   = make_error_code(code::response_closed);

} // namespace courier_error::response


// =======================================================================
//  让枚举支持自动转换为 boost::system::error_code
// =======================================================================
namespace boost::system {

    template <>
    struct is_error_code_enum<courier_error::network::code> : std::true_type {};

    template <>
    struct is_error_code_enum<courier_error::protocol::code> : std::true_type {};

    template <>
    struct is_error_code_enum<courier_error::adapter::code> : std::true_type {};

    template <>
    struct is_error_code_enum<courier_error::response::code> : std::true_type {};

} // namespace boost::system

#endif //COURIER_COURIER_ERROR_HPP
