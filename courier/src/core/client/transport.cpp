//
// Created by ubuntu on 2025/11/7.
//

#include <courier/core/client/transport.hpp>
#include <courier/error/courier_error.hpp>
#include <courier/http/network_constants.hpp>

#include <algorithm>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <openssl/err.h>
#include <spdlog/spdlog.h>

namespace courier {

namespace {

using steady_clock = std::chrono::steady_clock;

// 把 Beast 的超时错误翻译成 connect_timeout，其他错误带上上下文原样抛出
[[noreturn]] void throw_connect_error(const boost::system::error_code& ec, const std::string& what) {
    if (ec == boost::beast::error::timeout) {
        throw boost::system::system_error(courier_error::network::connect_timeout, what);
    }
    throw boost::system::system_error(ec, what);
}

bool is_ip_literal(const std::string& host) {
    boost::system::error_code ec;
    boost::asio::ip::make_address(host, ec);
    return !ec;
}

} // namespace

TcpTransport::TcpTransport(boost::asio::any_io_executor executor, const ClientConfig& config)
    : executor_(std::move(executor)),
      http2_enabled_(config.http2_enabled),
      http2_prior_knowledge_(config.http2_prior_knowledge),
      ssl_verify_(config.ssl_verify),
      default_ca_bundle_(config.ca_bundle_path) {
    default_ctx_ = make_ssl_context(default_ca_bundle_);
}

std::shared_ptr<boost::asio::ssl::context> TcpTransport::make_ssl_context(const std::string& ca_bundle) const {
    auto ctx = std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::tls_client);

    // 配置 SSL/TLS 上下文，增强安全性。
    ctx->set_options(network::ssl::CONTEXT_OPTIONS);

    // 设置推荐的现代加密套件列表。
    if (SSL_CTX_set_cipher_list(ctx->native_handle(), network::ssl::CIPHER_SUITES) != 1) {
        SPDLOG_WARN("Could not set SSL cipher list. Using OpenSSL defaults");
    }

    // 加载系统默认的根证书，再叠加额外的 CA 文件
    ctx->set_default_verify_paths();
    if (!ca_bundle.empty()) {
        ctx->load_verify_file(ca_bundle);
        SPDLOG_DEBUG("Loaded CA bundle '{}'", ca_bundle);
    }

    ctx->set_verify_mode(ssl_verify_ ? boost::asio::ssl::verify_peer : boost::asio::ssl::verify_none);

    // "h2" 优先于 "http/1.1"，让服务器在 TLS 握手期间选择协议。
    const std::span<const unsigned char> client_protos = network::alpn::get_alpn_protos(http2_enabled_);
    if (SSL_CTX_set_alpn_protos(ctx->native_handle(), client_protos.data(), client_protos.size_bytes()) != 0) {
        throw std::runtime_error("Failed to set ALPN protocols on SSL_CTX.");
    }
    return ctx;
}

std::shared_ptr<boost::asio::ssl::context> TcpTransport::context_for(const std::optional<std::string>& ca_bundle) {
    if (!ca_bundle || ca_bundle->empty() || *ca_bundle == default_ca_bundle_) {
        return default_ctx_;
    }
    std::lock_guard lock(contexts_mutex_);
    auto& ctx = bundle_contexts_[*ca_bundle];
    if (!ctx) {
        ctx = make_ssl_context(*ca_bundle);
    }
    return ctx;
}

boost::asio::awaitable<std::shared_ptr<PlainStream>> TcpTransport::open_tcp(const std::string& host, const uint16_t port,
                                                                           const std::chrono::milliseconds timeout) const {
    // 1. 异步 DNS 解析。
    boost::system::error_code ec;
    boost::asio::ip::tcp::resolver resolver(executor_);
    const auto endpoints = co_await resolver.async_resolve(host, std::to_string(port),
                                                           boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec) {
        throw_connect_error(ec, "DNS resolution failed for '" + host + "'");
    }

    // 2. 建立 TCP 连接，tcp_stream 自带的定时器负责连接阶段的超时
    auto stream = std::make_shared<PlainStream>(executor_);
    stream->expires_after(timeout);
    co_await stream->async_connect(endpoints, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec) {
        throw_connect_error(ec, "TCP connect failed for '" + host + ":" + std::to_string(port) + "'");
    }
    stream->socket().set_option(boost::asio::ip::tcp::no_delay(true));
    co_return stream;
}

boost::asio::awaitable<void> TcpTransport::establish_tunnel(PlainStream& stream, const Origin& target,
                                                            const std::chrono::milliseconds timeout) {
    boost::system::error_code ec;
    const std::string authority = target.host_port();

    http::request<http::empty_body> req{http::verb::connect, authority, 11};
    req.set(http::field::host, authority);

    stream.expires_after(timeout);
    co_await http::async_write(stream, req, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec) {
        throw_connect_error(ec, "Failed to send CONNECT for '" + authority + "'");
    }

    // CONNECT 的 2xx 响应没有响应体，读完头部后隧道就建立了
    boost::beast::flat_buffer buffer;
    http::response_parser<http::empty_body> parser;
    parser.skip(true);
    co_await http::async_read_header(stream, buffer, parser, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec) {
        throw_connect_error(ec, "Failed to read CONNECT response for '" + authority + "'");
    }
    if (const unsigned status = parser.get().result_int(); status / 100 != 2) {
        throw boost::system::system_error(courier_error::network::connect_failed,
                                          "Proxy refused CONNECT to '" + authority + "' with status " + std::to_string(status));
    }
    SPDLOG_DEBUG("CONNECT tunnel to {} established", authority);
}

boost::asio::awaitable<TransportStream> TcpTransport::connect(const Origin& origin, const ConnectOptions& options,
                                                              const std::chrono::milliseconds timeout) {
    const auto deadline = steady_clock::now() + timeout;
    const auto remaining = [deadline] {
        return std::max(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - steady_clock::now()),
                        std::chrono::milliseconds(1));
    };

    if (options.proxy && options.proxy->is_tls()) {
        throw boost::system::system_error(courier_error::network::connect_failed,
                                          "TLS proxies are not supported: " + options.proxy->key());
    }

    // 1. 明文目标
    if (!origin.is_tls()) {
        if (options.proxy) {
            // 正向代理：连接到代理，请求行使用 absolute-form
            auto stream = co_await open_tcp(options.proxy->host(), options.proxy->port(), remaining());
            stream->expires_never();
            SPDLOG_DEBUG("Forwarding {} through proxy {}", origin.key(), options.proxy->key());
            co_return TransportStream{stream, HttpVersion::http_1_1, true};
        }
        auto stream = co_await open_tcp(origin.host(), origin.port(), remaining());
        stream->expires_never();
        const HttpVersion version = http2_enabled_ && http2_prior_knowledge_ ? HttpVersion::http_2 : HttpVersion::http_1_1;
        co_return TransportStream{stream, version, false};
    }

    // 2. TLS 目标：直连，或经由 CONNECT 隧道
    std::shared_ptr<PlainStream> tcp;
    if (options.proxy) {
        tcp = co_await open_tcp(options.proxy->host(), options.proxy->port(), remaining());
        co_await establish_tunnel(*tcp, origin, remaining());
    } else {
        tcp = co_await open_tcp(origin.host(), origin.port(), remaining());
    }

    const auto ctx = context_for(options.ca_bundle);
    auto stream = std::make_shared<TlsStream>(std::move(*tcp), *ctx);

    // a. 设置 SNI (Server Name Indication)，IP 字面量不发送 SNI。
    if (!is_ip_literal(origin.host()) && !SSL_set_tlsext_host_name(stream->native_handle(), origin.host().c_str())) {
        throw boost::system::system_error(static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category());
    }

    // b. 校验证书里的主机名
    if (ssl_verify_) {
        stream->set_verify_callback(boost::asio::ssl::host_name_verification(origin.host()));
    }

    // c. 执行 TLS 握手。
    boost::system::error_code ec;
    boost::beast::get_lowest_layer(*stream).expires_after(remaining());
    co_await stream->async_handshake(boost::asio::ssl::stream_base::client,
                                     boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec) {
        throw_connect_error(ec, "TLS handshake failed for '" + origin.host() + "'");
    }
    boost::beast::get_lowest_layer(*stream).expires_never();

    // d. 检查 ALPN 协商结果。
    const unsigned char* proto = nullptr;
    unsigned int len = 0;
    SSL_get0_alpn_selected(stream->native_handle(), &proto, &len);
    if (proto && std::string_view(reinterpret_cast<const char*>(proto), len) == "h2") {
        SPDLOG_DEBUG("ALPN selected HTTP/2 for {}", origin.key());
        co_return TransportStream{stream, HttpVersion::http_2, false};
    }
    SPDLOG_DEBUG("ALPN selected HTTP/1.1 for {}", origin.key());
    co_return TransportStream{stream, HttpVersion::http_1_1, false};
}

} // namespace courier
