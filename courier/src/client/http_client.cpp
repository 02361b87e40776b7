//
// Created by ubuntu on 2025/11/12.
//

#include <courier/client/http_client.hpp>

#include <courier/adapters/auth_adapter.hpp>
#include <courier/adapters/cookie_adapter.hpp>
#include <courier/adapters/redirect_adapter.hpp>
#include <courier/version.hpp>
#include <spdlog/spdlog.h>

namespace courier {

/**
 * @brief HttpClient 的构造函数。
 *
 * 按固定顺序组装适配器链，并启动连接池的后台维护任务。
 */
HttpClient::HttpClient(boost::asio::any_io_executor executor, ClientOptions options)
    : config_(std::move(options.config)),
      user_agent_(config_.user_agent.empty() ? std::string(framework::user_agent) : config_.user_agent),
      cookies_(options.cookies ? std::move(options.cookies) : std::make_shared<CookieJar>()) {
    std::shared_ptr<ITransport> transport = options.transport
        ? std::move(options.transport)
        : std::make_shared<TcpTransport>(executor, config_);
    std::shared_ptr<const IEnvironment> environment = options.environment
        ? std::move(options.environment)
        : std::make_shared<ProcessEnvironment>();

    pool_ = std::make_shared<ConnectionPool>(executor, std::move(transport), config_);
    pool_->start();

    std::vector<std::shared_ptr<Adapter>> adapters{
        std::make_shared<RedirectAdapter>(config_.max_redirects),
        std::make_shared<EnvironmentAdapter>(std::move(environment), config_.trust_env),
        std::make_shared<CookieAdapter>(cookies_),
        std::make_shared<AuthAdapter>(std::move(options.auth), config_.max_auth_retries),
    };
    pipeline_ = std::make_unique<AdapterPipeline>(std::move(adapters), [pool = pool_](Request request) {
        return send_through_pool(pool, std::move(request));
    });

    SPDLOG_DEBUG("{} client created, HTTP/2 {}", user_agent_, config_.http2_enabled ? "enabled" : "disabled");
}

HttpClient::~HttpClient() = default;

boost::asio::awaitable<Response> HttpClient::send(Request request) {
    co_return co_await pipeline_->send(with_defaults(std::move(request)));
}

boost::asio::awaitable<Response> HttpClient::request(const http::verb method, std::string url, Headers headers,
                                                     RequestBody body) {
    co_return co_await send(Request(method, std::move(url), std::move(headers), std::move(body)));
}

boost::asio::awaitable<void> HttpClient::close() {
    co_await pool_->close();
}

Request HttpClient::with_defaults(Request request) const {
    // 设置通用头 (如果用户没有提供)
    if (request.headers().find(http::field::user_agent) == request.headers().end()) {
        request = request.with_header(http::field::user_agent, user_agent_);
    }
    if (request.headers().find(http::field::accept) == request.headers().end()) {
        request = request.with_header(http::field::accept, "*/*");
    }
    return request;
}

boost::asio::awaitable<Response> HttpClient::send_through_pool(std::shared_ptr<ConnectionPool> pool, Request request) {
    auto sent = std::make_shared<const Request>(std::move(request));
    Response response = co_await pool->send(*sent);
    response.set_request(std::move(sent));
    co_return response;
}

// ------------------------------------------------
// CoroutineDriver
// ------------------------------------------------
CoroutineDriver::CoroutineDriver(ClientOptions options)
    : client_(std::make_unique<HttpClient>(io_context_.get_executor(), std::move(options))) {
}

CoroutineDriver::~CoroutineDriver() {
    try {
        run(client_->close());
    } catch (const std::exception& e) {
        SPDLOG_WARN("Closing client failed: {}", e.what());
    }
    client_.reset();
}

} // namespace courier
