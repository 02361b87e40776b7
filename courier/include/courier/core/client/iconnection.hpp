//
// Created by ubuntu on 2025/11/7.
//

#ifndef COURIER_ICONNECTION_HPP
#define COURIER_ICONNECTION_HPP

#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cstddef>
#include <string>

#include <courier/http/http_common_types.hpp>
#include <courier/http/request.hpp>
#include <courier/http/response.hpp>

namespace courier {

/**
 * @interface IConnection
 * @brief 客户端网络连接的抽象接口。
 *
 * 这是连接池管理的核心抽象，统一了 HTTP/1.1 和 HTTP/2 两种连接的公共行为。
 * 协议在连接建立时由 ALPN 决定一次，之后不会切换。
 * 所有实现都通过 std::shared_ptr 管理，并且只在连接所属的 I/O 线程上被驱动。
 */
class IConnection {
public:
    /**
     * @brief 虚析构函数，允许通过基类指针安全地销毁派生类对象。
     */
    virtual ~IConnection() = default;

    /**
     * @brief 在此连接上执行一次请求 / 响应交换。
     *
     * 返回时响应头已经到达。HTTP/1.1 的响应体以流的形式留在连接上，
     * 直到响应体读完或被关闭之前，这条连接都不能开始下一次交换。
     *
     * @param request 要发送的请求。
     * @return 一个协程句柄 (awaitable)，其最终结果是 Response。
     * @throws boost::system::system_error courier_error::network / courier_error::protocol 中的错误。
     */
    virtual boost::asio::awaitable<Response> send(const Request& request) = 0;

    /**
     * @brief 判断此连接当前是否健康，并且在当前交换结束后可以被复用。
     *
     * HTTP/1.1：套接字打开、没有出现过错误、上一个响应没有声明 Connection: close。
     * HTTP/2：套接字打开、没有收到 GOAWAY、没有发生连接级错误。
     */
    [[nodiscard]] virtual bool is_reusable() const = 0;

    /**
     * @brief 异步地、主动地关闭此连接。
     *
     * 尽力发送关闭通知 (TLS close_notify, HTTP/2 GOAWAY)，然后关闭底层套接字。
     * @return 一个协程句柄，调用者可以 `co_await` 它来等待关闭完成。
     */
    virtual boost::asio::awaitable<void> close() = 0;

    /**
     * @brief 立即关闭底层套接字，不做任何协议层的告别。
     * 用于放弃一次进行到一半的交换，可以在析构路径上调用。
     */
    virtual void abort() noexcept = 0;

    /**
     * @brief 获取此连接实例的唯一标识符，主要用于日志和调试。
     */
    [[nodiscard]] virtual const std::string& id() const = 0;

    /**
     * @brief 获取此连接所属的连接池键。
     * 池键由 Origin::key() 和代理路由组成，用于标识连接的目标。
     */
    [[nodiscard]] virtual const std::string& get_pool_key() const = 0;

    /**
     * @brief 这条连接使用的协议。
     */
    [[nodiscard]] virtual HttpVersion version() const = 0;

    /**
     * @brief 返回当前连接上正在进行的交换 (流) 的数量。
     * @return 对于 HTTP/1.1，这个值是 0 或 1。对于 HTTP/2，是当前打开的流的数量。
     */
    [[nodiscard]] virtual std::size_t get_active_streams() const = 0;

    /**
     * @brief 获取这条连接允许的最大并发流数。
     * @return HTTP/1.1 返回 1。HTTP/2 返回本地配置与服务器 SETTINGS 中的较小值。
     */
    [[nodiscard]] virtual std::size_t get_max_concurrent_streams() const = 0;

    /**
     * @brief 查询该连接是否支持在单个TCP连接上进行多路复用。
     */
    [[nodiscard]] virtual bool supports_multiplexing() const { return false; }

    /**
     * @brief 更新连接的最后使用时间戳为当前时间。
     */
    virtual void update_last_used_time() = 0;

    /**
     * @brief 获取连接的最后一次活动时间戳。
     */
    [[nodiscard]] virtual std::chrono::steady_clock::time_point get_last_used_time() const = 0;
};

} // namespace courier

#endif //COURIER_ICONNECTION_HPP
