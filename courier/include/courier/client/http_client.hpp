//
// Created by ubuntu on 2025/11/12.
//

#ifndef COURIER_HTTP_CLIENT_HPP
#define COURIER_HTTP_CLIENT_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <chrono>
#include <future>
#include <memory>

#include <courier/adapters/adapter.hpp>
#include <courier/adapters/auth.hpp>
#include <courier/adapters/cookie_jar.hpp>
#include <courier/adapters/environment_adapter.hpp>
#include <courier/client/ihttp_client.hpp>
#include <courier/core/client/connection_pool.hpp>
#include <courier/core/client/transport.hpp>
#include <courier/utils/config/CourierConfig.hpp>

namespace courier {

/**
 * @brief 构造客户端的全部可替换部件。为空的部件使用默认实现。
 */
struct ClientOptions {
    ClientConfig config;
    /// 默认 TcpTransport
    std::shared_ptr<ITransport> transport;
    /// 默认内存中的 CookieJar
    std::shared_ptr<ICookieStore> cookies;
    /// 默认不认证
    std::shared_ptr<IAuthStrategy> auth;
    /// 默认读取进程环境变量
    std::shared_ptr<const IEnvironment> environment;
};

/**
 * @class HttpClient
 * @brief 协程客户端。
 *
 * 拥有连接池和适配器链：Redirect -> Environment -> Cookie -> Auth -> 连接池。
 * 所有方法都必须在构造时传入的执行器上 co_await。
 * 正常停机应当先 `co_await close()`，析构时剩余的连接会被直接关闭。
 */
class HttpClient final : public IHttpClient {
public:
    explicit HttpClient(boost::asio::any_io_executor executor, ClientOptions options = {});
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    boost::asio::awaitable<Response> send(Request request) override;
    boost::asio::awaitable<Response> request(http::verb method, std::string url, Headers headers, RequestBody body) override;

    /// 关闭连接池，之后的请求以 pool_closed 失败
    boost::asio::awaitable<void> close();

    [[nodiscard]] const std::shared_ptr<ConnectionPool>& pool() const { return pool_; }
    [[nodiscard]] const AdapterPipeline& pipeline() const { return *pipeline_; }
    [[nodiscard]] const std::shared_ptr<ICookieStore>& cookies() const { return cookies_; }
    [[nodiscard]] const ClientConfig& config() const { return config_; }

private:
    /// 补上默认的 User-Agent / Accept
    [[nodiscard]] Request with_defaults(Request request) const;

    /// 适配器链的最内层：经由连接池发送，并把请求记录到响应上
    static boost::asio::awaitable<Response> send_through_pool(std::shared_ptr<ConnectionPool> pool, Request request);

    ClientConfig config_;
    std::string user_agent_;
    std::shared_ptr<ConnectionPool> pool_;
    std::shared_ptr<ICookieStore> cookies_;
    std::unique_ptr<AdapterPipeline> pipeline_;
};

/**
 * @brief 协作式驱动：一个 io_context，由调用者的线程在 run() 里驱动。
 *
 * run() 把一个协程跑到完成并返回它的结果 (或重新抛出它的异常)。连接池的后台任务
 * 只在 run() 期间推进。
 */
class CoroutineDriver {
public:
    explicit CoroutineDriver(ClientOptions options = {});
    ~CoroutineDriver();

    CoroutineDriver(const CoroutineDriver&) = delete;
    CoroutineDriver& operator=(const CoroutineDriver&) = delete;

    [[nodiscard]] boost::asio::io_context& context() { return io_context_; }
    [[nodiscard]] HttpClient& client() { return *client_; }

    template <typename T>
    T run(boost::asio::awaitable<T> task) {
        auto future = boost::asio::co_spawn(io_context_, std::move(task), boost::asio::use_future);
        while (future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            if (io_context_.stopped()) {
                io_context_.restart();
            }
            io_context_.run_one();
        }
        return future.get();
    }

private:
    boost::asio::io_context io_context_{1};
    std::unique_ptr<HttpClient> client_;
};

} // namespace courier

#endif //COURIER_HTTP_CLIENT_HPP
