#include <courier/adapters/cookie_adapter.hpp>
#include <courier/adapters/cookie_jar.hpp>
#include <courier/client/http_client.hpp>

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
using courier::test::run_coro;

namespace {

const Origin kPlain = Origin::from_url("http://example.com/");
const Origin kSecure = Origin::from_url("https://example.com/");

/// 记录下一跳收到的请求，并返回带指定 Set-Cookie 的响应
struct Recorder {
    std::vector<std::string> set_cookies;
    std::vector<Request> seen;
};

boost::asio::awaitable<Response> record(std::shared_ptr<Recorder> recorder, Request request) {
    recorder->seen.push_back(request);
    Headers headers;
    for (const auto& value : recorder->set_cookies) {
        headers.insert(http::field::set_cookie, value);
    }
    co_return Response(200, "OK", HttpVersion::http_1_1, std::move(headers), std::make_unique<BufferedBodyStream>(""));
}

Next next_for(const std::shared_ptr<Recorder>& recorder) {
    return [recorder](Request request) { return record(recorder, std::move(request)); };
}

} // namespace

// ===========================================================================
// CookieJar
// ===========================================================================

TEST(CookieJarTest, StoresAndReturnsCookie) {
    CookieJar jar;
    jar.store(kPlain, "/", "session=abc123; Path=/; HttpOnly");

    EXPECT_EQ(jar.size(), 1u);
    EXPECT_EQ(jar.cookie_header(kPlain, "/"), "session=abc123");
    const auto stored = jar.cookies();
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_TRUE(stored[0].http_only);
    EXPECT_TRUE(stored[0].host_only);
}

TEST(CookieJarTest, MultipleCookiesAreJoined) {
    CookieJar jar;
    jar.store(kPlain, "/", "a=1");
    jar.store(kPlain, "/", "b=2");
    EXPECT_EQ(jar.cookie_header(kPlain, "/"), "a=1; b=2");
}

TEST(CookieJarTest, SameNameReplacesValue) {
    CookieJar jar;
    jar.store(kPlain, "/", "a=1");
    jar.store(kPlain, "/", "a=2");
    EXPECT_EQ(jar.size(), 1u);
    EXPECT_EQ(jar.cookie_header(kPlain, "/"), "a=2");
}

TEST(CookieJarTest, HostOnlyCookieSkipsSubdomains) {
    CookieJar jar;
    jar.store(kPlain, "/", "a=1");
    EXPECT_EQ(jar.cookie_header(Origin::from_url("http://www.example.com/"), "/"), "");
}

TEST(CookieJarTest, DomainAttributeCoversSubdomains) {
    CookieJar jar;
    jar.store(kPlain, "/", "wide=1; Domain=.example.com");
    EXPECT_EQ(jar.cookie_header(Origin::from_url("http://api.example.com/"), "/"), "wide=1");
    EXPECT_EQ(jar.cookie_header(Origin::from_url("http://badexample.com/"), "/"), "");
    ASSERT_EQ(jar.cookies().size(), 1u);
    EXPECT_FALSE(jar.cookies()[0].host_only);
}

TEST(CookieJarTest, ForeignDomainAttributeIsRejected) {
    CookieJar jar;
    jar.store(kPlain, "/", "evil=1; Domain=other.org");
    EXPECT_EQ(jar.size(), 0u);
}

TEST(CookieJarTest, PathScoping) {
    CookieJar jar;
    jar.store(kPlain, "/", "docs=1; Path=/docs");
    EXPECT_EQ(jar.cookie_header(kPlain, "/docs"), "docs=1");
    EXPECT_EQ(jar.cookie_header(kPlain, "/docs/page"), "docs=1");
    EXPECT_EQ(jar.cookie_header(kPlain, "/docsearch"), "");
    EXPECT_EQ(jar.cookie_header(kPlain, "/"), "");
}

TEST(CookieJarTest, LongerPathsAreSentFirst) {
    CookieJar jar;
    jar.store(kPlain, "/", "root=1; Path=/");
    jar.store(kPlain, "/", "deep=3; Path=/docs/api");
    jar.store(kPlain, "/", "mid=2; Path=/docs");
    EXPECT_EQ(jar.cookie_header(kPlain, "/docs/api/v1"), "deep=3; mid=2; root=1");
    EXPECT_EQ(jar.cookie_header(kPlain, "/docs"), "mid=2; root=1");
}

TEST(CookieJarTest, EqualPathsKeepCreationOrderAcrossDomains) {
    const Origin www = Origin::from_url("http://www.example.com/");
    CookieJar jar;
    jar.store(www, "/", "z=1");
    jar.store(kPlain, "/", "a=2; Domain=example.com");
    jar.store(www, "/", "m=3");
    EXPECT_EQ(jar.cookie_header(www, "/"), "z=1; a=2; m=3");

    // 替换沿用原来的创建顺序
    jar.store(www, "/", "z=9");
    EXPECT_EQ(jar.cookie_header(www, "/"), "z=9; a=2; m=3");
}

TEST(CookieJarTest, SingleLabelDomainIsRejected) {
    CookieJar jar;
    jar.store(kPlain, "/", "tld=1; Domain=com");
    jar.store(kPlain, "/", "tld=2; Domain=.com");
    EXPECT_EQ(jar.size(), 0u);
    EXPECT_EQ(jar.cookie_header(Origin::from_url("http://other.com/"), "/"), "");

    // 主机自己就是单标签名字时，按 host-only 保存
    const Origin local = Origin::from_url("http://localhost:8080/");
    jar.store(local, "/", "dev=1; Domain=localhost");
    ASSERT_EQ(jar.cookies().size(), 1u);
    EXPECT_TRUE(jar.cookies()[0].host_only);
    EXPECT_EQ(jar.cookie_header(local, "/"), "dev=1");
}

TEST(CookieJarTest, DefaultPathIsRequestDirectory) {
    CookieJar jar;
    jar.store(kPlain, "/account/login", "token=1");
    ASSERT_EQ(jar.cookies().size(), 1u);
    EXPECT_EQ(jar.cookies()[0].path, "/account");
    EXPECT_EQ(jar.cookie_header(kPlain, "/account/settings"), "token=1");
    EXPECT_EQ(jar.cookie_header(kPlain, "/other"), "");
}

TEST(CookieJarTest, SecureCookieOnlyOverTls) {
    CookieJar jar;
    jar.store(kSecure, "/", "secret=1; Secure");
    EXPECT_EQ(jar.cookie_header(kSecure, "/"), "secret=1");
    EXPECT_EQ(jar.cookie_header(kPlain, "/"), "");
}

TEST(CookieJarTest, NonPositiveMaxAgeDeletes) {
    CookieJar jar;
    jar.store(kPlain, "/", "a=1");
    jar.store(kPlain, "/", "a=1; Max-Age=0");
    EXPECT_EQ(jar.size(), 0u);
    EXPECT_EQ(jar.cookie_header(kPlain, "/"), "");
}

TEST(CookieJarTest, PastExpiresDeletes) {
    CookieJar jar;
    jar.store(kPlain, "/", "a=1");
    jar.store(kPlain, "/", "a=1; Expires=Thu, 01 Jan 2015 00:00:00 GMT");
    EXPECT_EQ(jar.size(), 0u);
}

TEST(CookieJarTest, MaxAgeBeatsExpires) {
    CookieJar jar;
    jar.store(kPlain, "/", "a=1; Max-Age=3600; Expires=Thu, 01 Jan 2015 00:00:00 GMT");
    EXPECT_EQ(jar.cookie_header(kPlain, "/"), "a=1");
}

TEST(CookieJarTest, MalformedCookieIgnored) {
    CookieJar jar;
    jar.store(kPlain, "/", "no-equals-sign");
    jar.store(kPlain, "/", "=value");
    EXPECT_EQ(jar.size(), 0u);
}

TEST(CookieJarTest, ClearEmptiesJar) {
    CookieJar jar;
    jar.store(kPlain, "/", "a=1");
    jar.clear();
    EXPECT_EQ(jar.size(), 0u);
}

// ===========================================================================
// CookieAdapter
// ===========================================================================

TEST(CookieAdapterTest, StoresSetCookieAndSendsItBack) {
    boost::asio::io_context ctx;
    auto jar = std::make_shared<CookieJar>();
    CookieAdapter adapter(jar);
    auto recorder = std::make_shared<Recorder>();
    recorder->set_cookies = {"a=1; Path=/", "b=2; Path=/"};

    run_coro(ctx, adapter.handle(Request(http::verb::get, "http://example.com/login"), next_for(recorder)));
    EXPECT_EQ(jar->size(), 2u);
    EXPECT_EQ(recorder->seen[0].headers().count(http::field::cookie), 0u);

    recorder->set_cookies.clear();
    run_coro(ctx, adapter.handle(Request(http::verb::get, "http://example.com/home?tab=1"), next_for(recorder)));
    ASSERT_EQ(recorder->seen.size(), 2u);
    EXPECT_EQ(recorder->seen[1].headers()[http::field::cookie], "a=1; b=2");
}

TEST(CookieAdapterTest, ExistingCookieHeaderComesFirst) {
    boost::asio::io_context ctx;
    auto jar = std::make_shared<CookieJar>();
    jar->store(kPlain, "/", "jar=1");
    CookieAdapter adapter(jar);
    auto recorder = std::make_shared<Recorder>();

    const Request request = Request(http::verb::get, "http://example.com/").with_header(http::field::cookie, "manual=0");
    run_coro(ctx, adapter.handle(request, next_for(recorder)));
    EXPECT_EQ(recorder->seen[0].headers()[http::field::cookie], "manual=0; jar=1");
    // 传入的请求本身没有被修改
    EXPECT_EQ(request.headers()[http::field::cookie], "manual=0");
}

TEST(CookieAdapterTest, RequiresStore) {
    EXPECT_THROW(CookieAdapter(nullptr), std::invalid_argument);
}

TEST(CookieClientTest, CookiesSurviveAcrossRequests) {
    LoopbackServer server([](const ServerRequest& req) {
        if (req.target == "/login") {
            return ServerReply::text(200, "ok", {{"Set-Cookie", "session=xyz; Path=/"}});
        }
        return ServerReply::text(200, std::string(req.headers[http::field::cookie]));
    });

    ClientOptions options;
    options.config.http2_enabled = false;
    options.config.maintenance_interval_ms = 0;
    options.environment = std::make_shared<MapEnvironment>();
    CoroutineDriver driver(std::move(options));

    Response login = driver.run(driver.client().get(server.url("/login")));
    driver.run(login.read());
    Response profile = driver.run(driver.client().get(server.url("/profile")));
    EXPECT_EQ(driver.run(profile.read()), "session=xyz");
    EXPECT_EQ(driver.client().cookies()->cookie_header(Origin::from_url(server.url()), "/"), "session=xyz");
}

TEST(CookieClientTest, CookieSetDuringRedirectIsSentToNextHop) {
    LoopbackServer server([](const ServerRequest& req) {
        if (req.target == "/start") {
            ServerReply reply = ServerReply::redirect(302, "/next");
            // 在重定向响应里插入 Set-Cookie
            const auto header_end = reply.raw.find("\r\n");
            reply.raw.insert(header_end + 2, "Set-Cookie: hop=1; Path=/\r\n");
            return reply;
        }
        return ServerReply::text(200, std::string(req.headers[http::field::cookie]));
    });

    ClientOptions options;
    options.config.http2_enabled = false;
    options.config.maintenance_interval_ms = 0;
    options.environment = std::make_shared<MapEnvironment>();
    CoroutineDriver driver(std::move(options));

    Response response = driver.run(driver.client().get(server.url("/start")));
    EXPECT_EQ(driver.run(response.read()), "hop=1");
}
