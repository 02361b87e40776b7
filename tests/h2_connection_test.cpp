#include <courier/core/client/h2_connection.hpp>
#include <courier/core/client/transport.hpp>
#include <courier/error/courier_error.hpp>

#include <gtest/gtest.h>

#include "support/test_support.hpp"

#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/io_context.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace courier;
using namespace std::chrono_literals;
using namespace boost::asio::experimental::awaitable_operators;
using courier::test::H2ServerOptions;
using courier::test::H2TestServer;
using courier::test::error_of;
using courier::test::run_all;
using courier::test::run_coro;
using courier::test::sleep_for;

namespace {

boost::asio::awaitable<std::shared_ptr<PlainHttp2Connection>> connect_h2(std::string url, TimeoutConfig timeouts,
                                                                         std::size_t max_streams) {
    ClientConfig config;
    config.http2_enabled = true;
    config.http2_prior_knowledge = true;
    TcpTransport transport(co_await boost::asio::this_coro::executor, config);
    TransportStream ts = co_await transport.connect(Origin::from_url(url), {}, 2000ms);
    EXPECT_EQ(ts.version, HttpVersion::http_2);
    auto stream = std::get<std::shared_ptr<PlainStream>>(ts.stream);
    auto conn = std::make_shared<PlainHttp2Connection>(stream, Origin::from_url(url).key(), timeouts, max_streams);
    co_await conn->run();
    co_return conn;
}

boost::asio::awaitable<std::string> fetch(std::shared_ptr<PlainHttp2Connection> conn, Request request) {
    Response response = co_await conn->send(request);
    EXPECT_EQ(response.protocol(), "HTTP/2");
    co_return co_await response.read();
}

/// 先打开两个不会应答的流，再打开 trigger 流触发连接级错误，按顺序返回三个流各自的错误码
boost::asio::awaitable<std::vector<boost::system::error_code>> fail_open_streams(std::shared_ptr<PlainHttp2Connection> conn,
                                                                                  std::string hold_url, std::string trigger_url) {
    std::vector<std::shared_ptr<H2Stream>> streams;
    streams.push_back(co_await conn->open_stream(Request(http::verb::get, hold_url)));
    streams.push_back(co_await conn->open_stream(Request(http::verb::get, hold_url)));
    streams.push_back(co_await conn->open_stream(Request(http::verb::get, trigger_url)));

    std::vector<boost::system::error_code> codes;
    for (auto& h2_stream : streams) {
        boost::system::error_code code;
        try {
            co_await conn->await_response(h2_stream);
        } catch (const boost::system::system_error& e) {
            code = e.code();
        }
        codes.push_back(code);
    }
    co_return codes;
}

/// patience 之内没拿到响应就放弃，返回是否拿到了
boost::asio::awaitable<bool> fetch_within(std::shared_ptr<PlainHttp2Connection> conn, Request request,
                                          std::chrono::milliseconds patience) {
    auto result = co_await (fetch(conn, std::move(request)) || sleep_for(patience));
    co_return result.index() == 0;
}

class Http2ConnectionTest : public ::testing::Test {
protected:
    std::shared_ptr<PlainHttp2Connection> connect(const H2TestServer& server, TimeoutConfig timeouts = {},
                                                  std::size_t max_streams = 100) {
        return run_coro(ctx, connect_h2(server.url(), timeouts, max_streams));
    }

    void TearDown() override {
        for (auto& conn : opened) {
            run_coro(ctx, conn->close());
        }
    }

    boost::asio::io_context ctx;
    std::vector<std::shared_ptr<PlainHttp2Connection>> opened;
};

} // namespace

TEST_F(Http2ConnectionTest, SimpleGet) {
    H2TestServer server;
    auto conn = connect(server);
    opened.push_back(conn);

    EXPECT_TRUE(conn->supports_multiplexing());
    EXPECT_EQ(conn->version(), HttpVersion::http_2);
    EXPECT_EQ(run_coro(ctx, fetch(conn, Request(http::verb::get, server.url("/hello")))), "h2:/hello");
    EXPECT_TRUE(conn->is_reusable());
    EXPECT_EQ(conn->get_active_streams(), 0u);
}

TEST_F(Http2ConnectionTest, FixedAndStreamedBodiesAreSentAsData) {
    H2TestServer server;
    auto conn = connect(server);
    opened.push_back(conn);

    EXPECT_EQ(run_coro(ctx, fetch(conn, Request(http::verb::post, server.url("/echo"), {}, RequestBody("payload")))),
              "payload");

    std::vector<std::string> parts{"s1-", "s2-", std::string(40000, 'q')};
    std::size_t index = 0;
    RequestBody streamed = RequestBody::stream([&]() -> std::optional<std::string> {
        if (index < parts.size()) {
            return parts[index++];
        }
        return std::nullopt;
    });
    EXPECT_EQ(run_coro(ctx, fetch(conn, Request(http::verb::post, server.url("/echo"), {}, streamed))),
              "s1-s2-" + std::string(40000, 'q'));
}

TEST_F(Http2ConnectionTest, ConcurrentStreamsShareOneConnection) {
    H2TestServer server;
    auto conn = connect(server);
    opened.push_back(conn);

    std::vector<boost::asio::awaitable<std::string>> tasks;
    for (int i = 0; i < 5; ++i) {
        tasks.push_back(fetch(conn, Request(http::verb::get, server.url("/slow?ms=100"))));
    }
    const auto bodies = run_all(ctx, std::move(tasks));
    for (const auto& body : bodies) {
        EXPECT_EQ(body, "slow");
    }
    EXPECT_EQ(server.connections_accepted(), 1u);
    EXPECT_GE(server.peak_concurrent_streams(), 2u);
}

TEST_F(Http2ConnectionTest, PeerStreamLimitWins) {
    H2ServerOptions options;
    options.max_concurrent_streams = 2;
    H2TestServer server(options);
    auto conn = connect(server, {}, 100);
    opened.push_back(conn);

    EXPECT_EQ(conn->get_max_concurrent_streams(), 2u);
}

TEST_F(Http2ConnectionTest, LocalStreamLimitWins) {
    H2TestServer server;
    auto conn = connect(server, {}, 3);
    opened.push_back(conn);

    EXPECT_EQ(conn->get_max_concurrent_streams(), 3u);
}

TEST_F(Http2ConnectionTest, StreamBeyondLimitFailsWithoutDisturbingOthers) {
    H2ServerOptions options;
    options.max_concurrent_streams = 2;
    H2TestServer server(options);
    auto conn = connect(server);
    opened.push_back(conn);

    const auto outcome = run_coro(ctx, [](std::shared_ptr<PlainHttp2Connection> c,
                                          std::string slow_url) -> boost::asio::awaitable<std::vector<std::string>> {
        auto first = co_await c->open_stream(Request(http::verb::get, slow_url));
        auto second = co_await c->open_stream(Request(http::verb::get, slow_url));

        std::vector<std::string> results;
        try {
            co_await c->open_stream(Request(http::verb::get, slow_url));
            results.emplace_back("third stream opened");
        } catch (const boost::system::system_error& e) {
            results.push_back(e.code() == courier_error::protocol::too_many_streams ? "too_many_streams"
                                                                                    : e.code().message());
        }

        Response r1 = co_await c->await_response(first);
        Response r2 = co_await c->await_response(second);
        results.push_back(co_await r1.read());
        results.push_back(co_await r2.read());
        co_return results;
    }(conn, server.url("/slow?ms=200")));

    ASSERT_EQ(outcome.size(), 3u);
    EXPECT_EQ(outcome[0], "too_many_streams");
    EXPECT_EQ(outcome[1], "slow");
    EXPECT_EQ(outcome[2], "slow");

    // 连接没有被破坏，后续请求正常
    EXPECT_TRUE(conn->is_reusable());
    EXPECT_EQ(run_coro(ctx, fetch(conn, Request(http::verb::get, server.url("/after")))), "h2:/after");
}

TEST_F(Http2ConnectionTest, ResetStreamFailsOnlyThatStream) {
    H2TestServer server;
    auto conn = connect(server);
    opened.push_back(conn);

    const auto ec = error_of([&] { run_coro(ctx, fetch(conn, Request(http::verb::get, server.url("/reset")))); });
    EXPECT_EQ(ec, courier_error::protocol::stream_reset);
    EXPECT_TRUE(conn->is_reusable());
    EXPECT_EQ(run_coro(ctx, fetch(conn, Request(http::verb::get, server.url("/ok")))), "h2:/ok");
}

TEST_F(Http2ConnectionTest, GoawayStopsNewStreams) {
    H2TestServer server;
    auto conn = connect(server);
    opened.push_back(conn);

    // GOAWAY 之前已被接受的流可能完成，也可能随连接一起终止
    try {
        EXPECT_EQ(run_coro(ctx, fetch(conn, Request(http::verb::get, server.url("/goaway")))), "bye");
    } catch (const boost::system::system_error& e) {
        EXPECT_TRUE(e.code() == courier_error::protocol::goaway_received ||
                    e.code() == courier_error::protocol::stream_reset)
            << e.what();
    }

    EXPECT_TRUE(conn->goaway_received());
    EXPECT_FALSE(conn->is_reusable());
    const auto ec = error_of([&] { run_coro(ctx, fetch(conn, Request(http::verb::get, server.url("/late")))); });
    EXPECT_EQ(ec, courier_error::protocol::goaway_received);
}

TEST_F(Http2ConnectionTest, GoawayEndsEveryOpenStreamWithSameError) {
    H2TestServer server;
    auto conn = connect(server);
    opened.push_back(conn);

    const auto codes = run_coro(ctx, fail_open_streams(conn, server.url("/hold"), server.url("/goaway-now")));
    ASSERT_EQ(codes.size(), 3u);
    for (const auto& code : codes) {
        EXPECT_EQ(code, courier_error::protocol::goaway_received) << code.message();
    }
    EXPECT_FALSE(conn->is_reusable());
    EXPECT_EQ(conn->get_active_streams(), 0u);
}

TEST_F(Http2ConnectionTest, MalformedFrameEndsEveryOpenStreamWithProtocolError) {
    H2TestServer server;
    auto conn = connect(server);
    opened.push_back(conn);

    const auto codes = run_coro(ctx, fail_open_streams(conn, server.url("/hold"), server.url("/malformed")));
    ASSERT_EQ(codes.size(), 3u);
    for (const auto& code : codes) {
        EXPECT_EQ(code, courier_error::protocol::protocol_error) << code.message();
    }
    EXPECT_FALSE(conn->is_reusable());
    const auto ec = error_of([&] { run_coro(ctx, fetch(conn, Request(http::verb::get, server.url("/late")))); });
    EXPECT_EQ(ec, courier_error::network::connection_lost);
}

TEST_F(Http2ConnectionTest, AbandonedStreamIsCancelledAndConnectionSurvives) {
    H2TestServer server;
    auto conn = connect(server);
    opened.push_back(conn);

    EXPECT_FALSE(run_coro(ctx, fetch_within(conn, Request(http::verb::get, server.url("/hold")), 50ms)));

    // 放弃的流以 RST_STREAM(CANCEL) 结束
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (server.cancels_received() == 0 && std::chrono::steady_clock::now() < deadline) {
        run_coro(ctx, sleep_for(10ms));
    }
    EXPECT_EQ(server.cancels_received(), 1u);
    EXPECT_EQ(conn->get_active_streams(), 0u);

    EXPECT_TRUE(conn->is_reusable());
    EXPECT_EQ(run_coro(ctx, fetch(conn, Request(http::verb::get, server.url("/next")))), "h2:/next");
    EXPECT_EQ(server.connections_accepted(), 1u);
}

TEST_F(Http2ConnectionTest, SlowStreamIsReadTimeoutAndConnectionSurvives) {
    H2TestServer server;
    TimeoutConfig timeouts;
    timeouts.read = 100ms;
    auto conn = connect(server, timeouts);
    opened.push_back(conn);

    const auto ec = error_of([&] {
        run_coro(ctx, fetch(conn, Request(http::verb::get, server.url("/slow?ms=1000"))));
    });
    EXPECT_EQ(ec, courier_error::network::read_timeout);
    EXPECT_TRUE(conn->is_reusable());
    EXPECT_EQ(run_coro(ctx, fetch(conn, Request(http::verb::get, server.url("/fast")))), "h2:/fast");
}

TEST_F(Http2ConnectionTest, ExhaustedWindowIsFlowControlTimeout) {
    H2ServerOptions options;
    options.initial_window_size = 0;
    H2TestServer server(options);
    TimeoutConfig timeouts;
    timeouts.flow_control = 150ms;
    auto conn = connect(server, timeouts);
    opened.push_back(conn);

    const auto ec = error_of([&] {
        run_coro(ctx, fetch(conn, Request(http::verb::post, server.url("/echo"), {}, RequestBody(std::string(1024, 'w')))));
    });
    EXPECT_EQ(ec, courier_error::protocol::flow_control_timeout);
    EXPECT_TRUE(conn->is_reusable());
}

TEST_F(Http2ConnectionTest, CloseSendsGoawayAndRejectsStreams) {
    H2TestServer server;
    auto conn = connect(server);

    run_coro(ctx, conn->close());
    EXPECT_FALSE(conn->is_reusable());
    const auto ec = error_of([&] { run_coro(ctx, fetch(conn, Request(http::verb::get, server.url("/")))); });
    EXPECT_TRUE(ec == courier_error::network::connection_lost || ec == courier_error::protocol::goaway_received)
        << ec.message();
}
