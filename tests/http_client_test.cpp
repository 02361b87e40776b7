#include <courier/client/http_client.hpp>
#include <courier/error/courier_error.hpp>
#include <courier/version.hpp>

#include <gtest/gtest.h>

#include "support/test_support.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>
#include <future>
#include <memory>
#include <string>
#include <vector>

using namespace courier;
using namespace std::chrono_literals;
using courier::test::H2ServerOptions;
using courier::test::H2TestServer;
using courier::test::LoopbackServer;
using courier::test::ServerReply;
using courier::test::ServerRequest;
using courier::test::error_of;

namespace {

ClientOptions isolated_options() {
    ClientOptions options;
    options.config.http2_enabled = false;
    options.config.maintenance_interval_ms = 0;
    options.environment = std::make_shared<MapEnvironment>();
    return options;
}

/// 把请求的方法、User-Agent 和 Accept 拼成响应体
LoopbackServer::Handler describe() {
    return [](const ServerRequest& req) {
        if (req.method == http::verb::head) {
            return ServerReply::text(200, "");
        }
        return ServerReply::text(200, std::string(http::to_string(req.method)) + " " + req.target + " | " +
                                      std::string(req.headers[http::field::user_agent]) + " | " +
                                      std::string(req.headers[http::field::accept]));
    };
}

boost::asio::awaitable<std::string> get_body(HttpClient& client, std::string url) {
    Response response = co_await client.get(std::move(url));
    co_return co_await response.read();
}

/// 同时发起 count 个 GET，等待全部完成
std::vector<std::string> get_concurrently(CoroutineDriver& driver, const std::string& url, const int count) {
    std::vector<std::future<std::string>> futures;
    for (int i = 0; i < count; ++i) {
        futures.push_back(boost::asio::co_spawn(driver.context(), get_body(driver.client(), url), boost::asio::use_future));
    }
    std::vector<std::string> bodies;
    for (auto& future : futures) {
        while (future.wait_for(0s) != std::future_status::ready) {
            if (driver.context().stopped()) {
                driver.context().restart();
            }
            driver.context().run_one_for(50ms);
        }
        bodies.push_back(future.get());
    }
    return bodies;
}

} // namespace

// ===========================================================================
// 默认头与便捷方法
// ===========================================================================

TEST(HttpClientTest, AddsDefaultUserAgentAndAccept) {
    LoopbackServer server(describe());
    CoroutineDriver driver(isolated_options());

    Response response = driver.run(driver.client().get(server.url("/info")));
    EXPECT_EQ(driver.run(response.read()), "GET /info | " + std::string(framework::user_agent) + " | */*");
}

TEST(HttpClientTest, ConfiguredUserAgentIsUsed) {
    LoopbackServer server(describe());
    ClientOptions options = isolated_options();
    options.config.user_agent = "tester/2.0";
    CoroutineDriver driver(std::move(options));

    Response response = driver.run(driver.client().get(server.url("/")));
    EXPECT_EQ(driver.run(response.read()), "GET / | tester/2.0 | */*");
}

TEST(HttpClientTest, CallerHeadersWin) {
    LoopbackServer server(describe());
    CoroutineDriver driver(isolated_options());

    Headers headers;
    headers.set(http::field::user_agent, "custom");
    headers.set(http::field::accept, "application/json");
    Response response = driver.run(driver.client().get(server.url("/"), headers));
    EXPECT_EQ(driver.run(response.read()), "GET / | custom | application/json");
}

TEST(HttpClientTest, VerbHelpersSendMatchingMethod) {
    LoopbackServer server(describe());
    CoroutineDriver driver(isolated_options());
    HttpClient& client = driver.client();

    const auto method_of = [&](boost::asio::awaitable<Response> call) {
        Response response = driver.run(std::move(call));
        const std::string body = driver.run(response.read());
        return body.substr(0, body.find(' '));
    };

    EXPECT_EQ(method_of(client.post(server.url("/"), RequestBody("p"))), "POST");
    EXPECT_EQ(method_of(client.put(server.url("/"), RequestBody("p"))), "PUT");
    EXPECT_EQ(method_of(client.patch(server.url("/"), RequestBody("p"))), "PATCH");
    EXPECT_EQ(method_of(client.del(server.url("/"))), "DELETE");
    EXPECT_EQ(method_of(client.options(server.url("/"))), "OPTIONS");

    Response head = driver.run(client.head(server.url("/")));
    EXPECT_EQ(head.status(), 200u);
    EXPECT_EQ(driver.run(head.read()), "");

    const auto requests = server.requests();
    ASSERT_EQ(requests.size(), 6u);
    EXPECT_EQ(requests[0].body, "p");
    EXPECT_EQ(requests[5].method, http::verb::head);
}

TEST(HttpClientTest, ResponseCarriesFinalRequest) {
    LoopbackServer server(describe());
    CoroutineDriver driver(isolated_options());

    Response response = driver.run(driver.client().get(server.url("/who")));
    ASSERT_TRUE(response.request());
    EXPECT_EQ(response.request()->url(), server.url("/who"));
    EXPECT_EQ(response.request()->headers()[http::field::user_agent], framework::user_agent);
    EXPECT_EQ(response.protocol(), "HTTP/1.1");
}

TEST(HttpClientTest, PipelineOrder) {
    CoroutineDriver driver(isolated_options());
    EXPECT_EQ(driver.client().pipeline().names(),
              (std::vector<std::string>{"redirect", "environment", "cookie", "auth"}));
}

// ===========================================================================
// 连接复用与并发
// ===========================================================================

TEST(HttpClientTest, SequentialRequestsReuseOneConnection) {
    LoopbackServer server(describe());
    CoroutineDriver driver(isolated_options());

    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(driver.run(get_body(driver.client(), server.url("/n"))).substr(0, 6), "GET /n");
    }
    EXPECT_EQ(server.connections_accepted(), 1u);
}

TEST(HttpClientTest, ConcurrentRequestsRespectPerOriginLimit) {
    LoopbackServer server([](const ServerRequest&) { return ServerReply::text(200, "late").after(100ms); });
    ClientOptions options = isolated_options();
    options.config.max_connections_per_origin = 2;
    CoroutineDriver driver(std::move(options));

    for (const auto& body : get_concurrently(driver, server.url("/"), 6)) {
        EXPECT_EQ(body, "late");
    }
    EXPECT_LE(server.peak_open_connections(), 2u);
    EXPECT_EQ(server.request_count(), 6u);
}

TEST(HttpClientTest, Http2PriorKnowledgeMultiplexes) {
    H2TestServer server;
    ClientOptions options = isolated_options();
    options.config.http2_enabled = true;
    options.config.http2_prior_knowledge = true;
    CoroutineDriver driver(std::move(options));

    for (const auto& body : get_concurrently(driver, server.url("/slow?ms=50"), 4)) {
        EXPECT_EQ(body, "slow");
    }
    EXPECT_EQ(server.connections_accepted(), 1u);

    Response response = driver.run(driver.client().get(server.url("/proto")));
    EXPECT_EQ(response.protocol(), "HTTP/2");
    EXPECT_EQ(driver.run(response.read()), "h2:/proto");
}

// ===========================================================================
// 错误
// ===========================================================================

TEST(HttpClientTest, UnreachableHostIsConnectFailed) {
    ClientOptions options = isolated_options();
    options.config.connect_timeout_ms = 2000;
    CoroutineDriver driver(std::move(options));

    // 端口 1 上通常没有监听者
    const auto ec = error_of([&] { driver.run(driver.client().get("http://127.0.0.1:1/")); });
    EXPECT_EQ(ec, courier_error::network::connect_failed);
}

TEST(HttpClientTest, InvalidUrlIsRejectedBeforeSending) {
    CoroutineDriver driver(isolated_options());
    EXPECT_THROW(driver.run(driver.client().get("ftp://example.com/file")), std::invalid_argument);
    EXPECT_THROW(driver.run(driver.client().get("not a url")), std::invalid_argument);
}

TEST(HttpClientTest, ReadTimeoutSurfacesFromClient) {
    LoopbackServer server([](const ServerRequest&) { return ServerReply::text(200, "too late").after(1000ms); });
    ClientOptions options = isolated_options();
    options.config.read_timeout_ms = 100;
    CoroutineDriver driver(std::move(options));

    const auto ec = error_of([&] { driver.run(driver.client().get(server.url("/"))); });
    EXPECT_EQ(ec, courier_error::network::read_timeout);
}

TEST(HttpClientTest, ClosedClientRejectsRequests) {
    LoopbackServer server(describe());
    CoroutineDriver driver(isolated_options());

    EXPECT_EQ(driver.run(get_body(driver.client(), server.url("/"))).substr(0, 5), "GET /");
    driver.run(driver.client().close());
    const auto ec = error_of([&] { driver.run(driver.client().get(server.url("/"))); });
    EXPECT_EQ(ec, courier_error::network::pool_closed);
}
