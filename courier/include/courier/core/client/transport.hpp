//
// Created by ubuntu on 2025/11/7.
//

#ifndef COURIER_TRANSPORT_HPP
#define COURIER_TRANSPORT_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

#include <courier/http/http_common_types.hpp>
#include <courier/http/origin.hpp>
#include <courier/utils/config/CourierConfig.hpp>

namespace courier {

using PlainStream = boost::beast::tcp_stream;
using TlsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;

/**
 * @brief 建立连接时的路由选项，来自请求上的代理 / CA 提示。
 */
struct ConnectOptions {
    /// 正向代理。http 目标直接转发 (absolute-form)，https 目标通过 CONNECT 隧道
    std::optional<Origin> proxy;
    /// 额外的 CA 证书文件
    std::optional<std::string> ca_bundle;
};

/**
 * @brief 建立好的字节流，以及这条连接要说的协议。
 */
struct TransportStream {
    std::variant<std::shared_ptr<PlainStream>, std::shared_ptr<TlsStream>> stream;
    HttpVersion version = HttpVersion::http_1_1;
    /// 明文请求经由正向代理转发，请求行需要使用 absolute-form target
    bool via_forward_proxy = false;
};

/**
 * @interface ITransport
 * @brief "建立传输"的能力：DNS、TCP、TLS 和 ALPN 都在这里完成，连接和连接池只消费结果。
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief 建立到 origin 的字节流。
     * @param timeout 整个建立过程 (DNS + TCP + 代理隧道 + TLS) 的时限。
     * @throws boost::system::system_error 超时为 connect_timeout，其他为底层错误。
     */
    virtual boost::asio::awaitable<TransportStream> connect(const Origin& origin, const ConnectOptions& options,
                                                            std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief 基于 Boost.Asio / Beast / OpenSSL 的默认传输。
 */
class TcpTransport final : public ITransport {
public:
    TcpTransport(boost::asio::any_io_executor executor, const ClientConfig& config);

    boost::asio::awaitable<TransportStream> connect(const Origin& origin, const ConnectOptions& options,
                                                    std::chrono::milliseconds timeout) override;

private:
    /// 按 CA 文件选择 SSL 上下文，没有指定时使用默认上下文
    std::shared_ptr<boost::asio::ssl::context> context_for(const std::optional<std::string>& ca_bundle);
    std::shared_ptr<boost::asio::ssl::context> make_ssl_context(const std::string& ca_bundle) const;

    boost::asio::awaitable<std::shared_ptr<PlainStream>> open_tcp(const std::string& host, uint16_t port,
                                                                  std::chrono::milliseconds timeout) const;

    /// 在到代理的 TCP 连接上建立 CONNECT 隧道
    static boost::asio::awaitable<void> establish_tunnel(PlainStream& stream, const Origin& target,
                                                         std::chrono::milliseconds timeout);

    boost::asio::any_io_executor executor_;
    bool http2_enabled_;
    bool http2_prior_knowledge_;
    bool ssl_verify_;
    std::string default_ca_bundle_;

    std::mutex contexts_mutex_;
    std::shared_ptr<boost::asio::ssl::context> default_ctx_;
    std::map<std::string, std::shared_ptr<boost::asio::ssl::context>> bundle_contexts_;
};

} // namespace courier

#endif //COURIER_TRANSPORT_HPP
