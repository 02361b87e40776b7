#include <courier/adapters/redirect_adapter.hpp>
#include <courier/client/http_client.hpp>
#include <courier/error/courier_error.hpp>

#include <gtest/gtest.h>

#include "support/test_support.hpp"

#include <boost/asio/io_context.hpp>
#include <memory>
#include <string>
#include <vector>

using namespace courier;
using courier::test::LoopbackServer;
using courier::test::ServerReply;
using courier::test::ServerRequest;
using courier::test::error_of;
using courier::test::run_coro;

namespace {

Response reply(unsigned status, const std::string& location = "", std::string body = "") {
    Headers headers;
    if (!location.empty()) {
        headers.set(http::field::location, location);
    }
    return Response(status, std::string(http::obsolete_reason(static_cast<http::status>(status))), HttpVersion::http_1_1,
                    std::move(headers), std::make_unique<BufferedBodyStream>(std::move(body)));
}

/// 按顺序返回预设响应，并记录收到的请求
struct Script {
    std::vector<Response> replies;
    std::vector<Request> seen;
    std::size_t index = 0;
};

boost::asio::awaitable<Response> play(std::shared_ptr<Script> script, Request request) {
    script->seen.push_back(request);
    co_return script->replies.at(script->index++);
}

Next next_for(const std::shared_ptr<Script>& script) {
    return [script](Request request) { return play(script, std::move(request)); };
}

ClientOptions isolated_options() {
    ClientOptions options;
    options.config.http2_enabled = false;
    options.config.maintenance_interval_ms = 0;
    options.environment = std::make_shared<MapEnvironment>();
    return options;
}

/// /r/N 重定向到 /r/N-1，/r/0 返回 200
LoopbackServer::Handler countdown() {
    return [](const ServerRequest& req) {
        if (req.target.rfind("/r/", 0) == 0) {
            const int n = std::stoi(req.target.substr(3));
            if (n > 0) {
                return ServerReply::redirect(302, "/r/" + std::to_string(n - 1));
            }
            return ServerReply::text(200, "done");
        }
        return ServerReply::text(404, "");
    };
}

} // namespace

// ===========================================================================
// build_redirect_request
// ===========================================================================

TEST(RedirectRequestTest, SeeOtherTurnsPostIntoBodilessGet) {
    const Request post = Request(http::verb::post, "http://example.com/form", {}, RequestBody("a=1"))
                             .with_header(http::field::content_type, "application/x-www-form-urlencoded");
    const Request next = RedirectAdapter::build_redirect_request(post, 303, "http://example.com/result");
    EXPECT_EQ(next.method(), http::verb::get);
    EXPECT_TRUE(next.body().empty());
    EXPECT_EQ(next.headers().count(http::field::content_type), 0u);
    EXPECT_EQ(next.url(), "http://example.com/result");
}

TEST(RedirectRequestTest, SeeOtherKeepsHead) {
    const Request head(http::verb::head, "http://example.com/a");
    EXPECT_EQ(RedirectAdapter::build_redirect_request(head, 303, "http://example.com/b").method(), http::verb::head);
}

TEST(RedirectRequestTest, MovedAndFoundTurnPostIntoGet) {
    const Request post(http::verb::post, "http://example.com/a", {}, RequestBody("x"));
    EXPECT_EQ(RedirectAdapter::build_redirect_request(post, 301, "http://example.com/b").method(), http::verb::get);
    EXPECT_EQ(RedirectAdapter::build_redirect_request(post, 302, "http://example.com/b").method(), http::verb::get);

    const Request put(http::verb::put, "http://example.com/a", {}, RequestBody("x"));
    const Request kept = RedirectAdapter::build_redirect_request(put, 302, "http://example.com/b");
    EXPECT_EQ(kept.method(), http::verb::put);
    EXPECT_EQ(kept.body().data(), "x");
}

TEST(RedirectRequestTest, TemporaryAndPermanentPreserveMethodAndBody) {
    const Request post(http::verb::post, "http://example.com/a", {}, RequestBody("payload"));
    for (const unsigned status : {307u, 308u}) {
        const Request next = RedirectAdapter::build_redirect_request(post, status, "http://example.com/b");
        EXPECT_EQ(next.method(), http::verb::post);
        EXPECT_EQ(next.body().data(), "payload");
    }
}

TEST(RedirectRequestTest, ConsumedStreamCannotBeReplayed) {
    int calls = 0;
    const RequestBody body = RequestBody::stream([&calls]() -> std::optional<std::string> {
        if (calls++ == 0) {
            return std::string("once");
        }
        return std::nullopt;
    });
    const Request post(http::verb::post, "http://example.com/a", {}, body);
    (void)post.body().next_chunk();

    EXPECT_EQ(error_of([&] { (void)RedirectAdapter::build_redirect_request(post, 307, "http://example.com/b"); }),
              courier_error::adapter::request_body_unavailable);
    // 变成 GET 的重定向不需要请求体
    EXPECT_NO_THROW((void)RedirectAdapter::build_redirect_request(post, 303, "http://example.com/b"));
}

TEST(RedirectRequestTest, CredentialsStayOnSameOrigin) {
    const Request request = Request(http::verb::get, "http://example.com/a")
                                .with_header(http::field::authorization, "Bearer t")
                                .with_header(http::field::host, "example.com");

    const Request same = RedirectAdapter::build_redirect_request(request, 302, "http://example.com/b");
    EXPECT_EQ(same.headers()[http::field::authorization], "Bearer t");
    EXPECT_EQ(same.headers().count(http::field::host), 0u);

    const Request upgraded = RedirectAdapter::build_redirect_request(request, 301, "https://example.com/b");
    EXPECT_EQ(upgraded.headers()[http::field::authorization], "Bearer t");

    const Request other_host = RedirectAdapter::build_redirect_request(request, 302, "http://evil.example/b");
    EXPECT_EQ(other_host.headers().count(http::field::authorization), 0u);

    const Request other_port = RedirectAdapter::build_redirect_request(request, 302, "http://example.com:8080/b");
    EXPECT_EQ(other_port.headers().count(http::field::authorization), 0u);
}

// ===========================================================================
// RedirectAdapter
// ===========================================================================

TEST(RedirectAdapterTest, FollowsChainAndRecordsHistory) {
    boost::asio::io_context ctx;
    auto script = std::make_shared<Script>();
    script->replies = {reply(301, "/b"), reply(302, "http://other.example/c"), reply(200, "", "final")};
    RedirectAdapter adapter(3);

    Response response = run_coro(ctx, adapter.handle(Request(http::verb::get, "http://example.com/a"), next_for(script)));
    EXPECT_EQ(response.status(), 200u);
    ASSERT_EQ(response.history().size(), 2u);
    EXPECT_EQ(response.history()[0].status(), 301u);
    EXPECT_EQ(response.history()[1].status(), 302u);
    // 历史里的响应体已经读完
    EXPECT_TRUE(response.history()[0].is_read());

    ASSERT_EQ(script->seen.size(), 3u);
    EXPECT_EQ(script->seen[1].url(), "http://example.com/b");
    EXPECT_EQ(script->seen[2].url(), "http://other.example/c");
}

TEST(RedirectAdapterTest, TooManyRedirectsCarriesHistory) {
    boost::asio::io_context ctx;
    auto script = std::make_shared<Script>();
    script->replies = {reply(302, "/1"), reply(302, "/2"), reply(302, "/3"), reply(302, "/4")};
    RedirectAdapter adapter(3);

    try {
        run_coro(ctx, adapter.handle(Request(http::verb::get, "http://example.com/0"), next_for(script)));
        FAIL() << "expected RedirectError";
    } catch (const RedirectError& e) {
        EXPECT_EQ(e.code(), courier_error::adapter::too_many_redirects);
        EXPECT_EQ(e.history().size(), 4u);
    }
    EXPECT_EQ(script->seen.size(), 4u);
}

TEST(RedirectAdapterTest, ZeroMaxRedirectsRejectsFirstRedirect) {
    boost::asio::io_context ctx;
    auto script = std::make_shared<Script>();
    script->replies = {reply(302, "/elsewhere")};
    RedirectAdapter adapter(0);

    EXPECT_EQ(error_of([&] {
                  run_coro(ctx, adapter.handle(Request(http::verb::get, "http://example.com/"), next_for(script)));
              }),
              courier_error::adapter::too_many_redirects);
}

TEST(RedirectAdapterTest, DisabledRedirectsReturnRedirectResponse) {
    boost::asio::io_context ctx;
    auto script = std::make_shared<Script>();
    script->replies = {reply(302, "/elsewhere")};
    RedirectAdapter adapter(3);

    Response response = run_coro(ctx, adapter.handle(
        Request(http::verb::get, "http://example.com/").with_allow_redirects(false), next_for(script)));
    EXPECT_EQ(response.status(), 302u);
    EXPECT_TRUE(response.is_redirect());
    EXPECT_TRUE(response.history().empty());
}

TEST(RedirectAdapterTest, RedirectWithoutLocationIsFinal) {
    boost::asio::io_context ctx;
    auto script = std::make_shared<Script>();
    script->replies = {reply(302)};
    RedirectAdapter adapter(3);

    Response response = run_coro(ctx, adapter.handle(Request(http::verb::get, "http://example.com/"), next_for(script)));
    EXPECT_EQ(response.status(), 302u);
    EXPECT_EQ(script->seen.size(), 1u);
}

// ===========================================================================
// 经由客户端的重定向
// ===========================================================================

TEST(RedirectClientTest, ThreeHopsSucceedWithHistory) {
    LoopbackServer server(countdown());
    CoroutineDriver driver(isolated_options());

    Response response = driver.run(driver.client().get(server.url("/r/3")));
    EXPECT_EQ(response.status(), 200u);
    EXPECT_EQ(driver.run(response.read()), "done");
    ASSERT_EQ(response.history().size(), 3u);
    for (const auto& hop : response.history()) {
        EXPECT_EQ(hop.status(), 302u);
        ASSERT_TRUE(hop.request());
    }
    EXPECT_EQ(response.history()[0].request()->url(), server.url("/r/3"));
    ASSERT_TRUE(response.request());
    EXPECT_EQ(response.request()->url(), server.url("/r/0"));
    // 重定向响应读完后连接被复用
    EXPECT_EQ(server.connections_accepted(), 1u);
}

TEST(RedirectClientTest, FourthHopIsTooManyRedirects) {
    LoopbackServer server(countdown());
    CoroutineDriver driver(isolated_options());

    try {
        driver.run(driver.client().get(server.url("/r/4")));
        FAIL() << "expected RedirectError";
    } catch (const RedirectError& e) {
        EXPECT_EQ(e.history().size(), 4u);
    }
    EXPECT_EQ(server.request_count(), 4u);
}

TEST(RedirectClientTest, SeeOtherDropsBodyOnTheWire) {
    LoopbackServer server([](const ServerRequest& req) {
        if (req.target == "/submit") {
            return ServerReply::redirect(303, "/result");
        }
        return ServerReply::text(200, std::string(http::to_string(req.method)));
    });
    CoroutineDriver driver(isolated_options());

    Response response = driver.run(driver.client().post(server.url("/submit"), RequestBody("form=data")));
    EXPECT_EQ(driver.run(response.read()), "GET");

    const auto requests = server.requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].body, "form=data");
    EXPECT_TRUE(requests[1].body.empty());
    EXPECT_TRUE(requests[1].headers.count(http::field::content_length) == 0 ||
                requests[1].headers[http::field::content_length] == "0");
}

TEST(RedirectClientTest, CrossOriginHopDropsAuthorization) {
    LoopbackServer target([](const ServerRequest&) { return ServerReply::text(200, "landed"); });
    LoopbackServer origin([&target](const ServerRequest&) { return ServerReply::redirect(302, target.url("/landing")); });
    CoroutineDriver driver(isolated_options());

    Headers headers;
    headers.set(http::field::authorization, "Bearer secret");
    Response response = driver.run(driver.client().get(origin.url("/start"), headers));
    EXPECT_EQ(driver.run(response.read()), "landed");

    ASSERT_EQ(origin.requests().size(), 1u);
    EXPECT_EQ(origin.requests()[0].headers[http::field::authorization], "Bearer secret");
    ASSERT_EQ(target.requests().size(), 1u);
    EXPECT_EQ(target.requests()[0].headers.count(http::field::authorization), 0u);
    EXPECT_EQ(target.requests()[0].headers[http::field::host], "127.0.0.1:" + std::to_string(target.port()));
}
