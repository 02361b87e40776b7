#include <courier/adapters/environment_adapter.hpp>
#include <courier/client/http_client.hpp>

#include <gtest/gtest.h>

#include "support/test_support.hpp"

#include <memory>
#include <string>
#include <unordered_map>

using namespace courier;
using courier::test::LoopbackServer;
using courier::test::ServerReply;
using courier::test::ServerRequest;

namespace {

EnvironmentAdapter adapter_with(std::unordered_map<std::string, std::string> values, bool trust_env = true) {
    return EnvironmentAdapter(std::make_shared<MapEnvironment>(std::move(values)), trust_env);
}

} // namespace

// ===========================================================================
// 代理选择
// ===========================================================================

TEST(EnvironmentAdapterTest, ProxyChosenByScheme) {
    const auto adapter = adapter_with({{"HTTP_PROXY", "http://plain-proxy:3128"}, {"HTTPS_PROXY", "http://tls-proxy:3129"}});

    const Request plain = adapter.apply(Request(http::verb::get, "http://example.com/"));
    ASSERT_TRUE(plain.proxy());
    EXPECT_EQ(*plain.proxy(), "http://plain-proxy:3128");

    const Request secure = adapter.apply(Request(http::verb::get, "https://example.com/"));
    ASSERT_TRUE(secure.proxy());
    EXPECT_EQ(*secure.proxy(), "http://tls-proxy:3129");
}

TEST(EnvironmentAdapterTest, LowercaseNameWins) {
    const auto adapter = adapter_with({{"HTTP_PROXY", "http://upper:1"}, {"http_proxy", "http://lower:2"}});
    EXPECT_EQ(*adapter.apply(Request(http::verb::get, "http://example.com/")).proxy(), "http://lower:2");
}

TEST(EnvironmentAdapterTest, AllProxyIsFallback) {
    const auto adapter = adapter_with({{"ALL_PROXY", "fallback:8080"}});
    const Request routed = adapter.apply(Request(http::verb::get, "https://example.com/"));
    ASSERT_TRUE(routed.proxy());
    // 没有 scheme 的代理地址按 http 处理
    EXPECT_EQ(*routed.proxy(), "http://fallback:8080");
}

TEST(EnvironmentAdapterTest, EmptyValueCountsAsUnset) {
    const auto adapter = adapter_with({{"http_proxy", "  "}, {"HTTP_PROXY", "http://upper:1"}});
    EXPECT_EQ(*adapter.apply(Request(http::verb::get, "http://example.com/")).proxy(), "http://upper:1");
}

TEST(EnvironmentAdapterTest, NoProxyBypassesListedHosts) {
    const auto adapter = adapter_with({{"HTTP_PROXY", "http://proxy:3128"}, {"NO_PROXY", "internal.example, localhost"}});

    EXPECT_FALSE(adapter.apply(Request(http::verb::get, "http://internal.example/")).proxy());
    EXPECT_FALSE(adapter.apply(Request(http::verb::get, "http://api.internal.example/")).proxy());
    EXPECT_FALSE(adapter.apply(Request(http::verb::get, "http://localhost:8080/")).proxy());
    EXPECT_TRUE(adapter.apply(Request(http::verb::get, "http://example.com/")).proxy());
}

TEST(EnvironmentAdapterTest, NoProxyWildcardDisablesProxy) {
    const auto adapter = adapter_with({{"HTTP_PROXY", "http://proxy:3128"}, {"no_proxy", "*"}});
    EXPECT_FALSE(adapter.apply(Request(http::verb::get, "http://example.com/")).proxy());
}

TEST(EnvironmentAdapterTest, TrustEnvFalseIgnoresEverything) {
    const auto adapter = adapter_with({{"HTTP_PROXY", "http://proxy:3128"}, {"SSL_CERT_FILE", "/etc/ca.pem"}}, false);
    const Request untouched = adapter.apply(Request(http::verb::get, "https://example.com/"));
    EXPECT_FALSE(untouched.proxy());
    EXPECT_FALSE(untouched.ca_bundle());
}

TEST(EnvironmentAdapterTest, ExplicitHintsAreKept) {
    const auto adapter = adapter_with({{"HTTPS_PROXY", "http://proxy:3128"}, {"SSL_CERT_FILE", "/etc/env-ca.pem"}});
    const Request request = Request(http::verb::get, "https://example.com/")
                                .with_proxy("http://explicit:9000")
                                .with_ca_bundle("/etc/explicit-ca.pem");
    const Request routed = adapter.apply(request);
    EXPECT_EQ(*routed.proxy(), "http://explicit:9000");
    EXPECT_EQ(*routed.ca_bundle(), "/etc/explicit-ca.pem");
}

TEST(EnvironmentAdapterTest, CaBundleOnlyForHttps) {
    const auto adapter = adapter_with({{"SSL_CERT_FILE", "/etc/ssl/ca.pem"}});
    EXPECT_EQ(*adapter.apply(Request(http::verb::get, "https://example.com/")).ca_bundle(), "/etc/ssl/ca.pem");
    EXPECT_FALSE(adapter.apply(Request(http::verb::get, "http://example.com/")).ca_bundle());
}

TEST(EnvironmentAdapterTest, RequestsCaBundleIsFallback) {
    const auto adapter = adapter_with({{"REQUESTS_CA_BUNDLE", "/etc/requests-ca.pem"}});
    EXPECT_EQ(*adapter.apply(Request(http::verb::get, "https://example.com/")).ca_bundle(), "/etc/requests-ca.pem");
}

TEST(EnvironmentAdapterTest, ApplyDoesNotModifyOriginal) {
    const auto adapter = adapter_with({{"HTTP_PROXY", "http://proxy:3128"}});
    const Request original(http::verb::get, "http://example.com/");
    (void)adapter.apply(original);
    EXPECT_FALSE(original.proxy());
}

// ===========================================================================
// NO_PROXY 匹配
// ===========================================================================

TEST(NoProxyTest, MatchesExactHostAndSubdomains) {
    EXPECT_TRUE(EnvironmentAdapter::bypasses_proxy("example.com", "example.com", 80));
    EXPECT_TRUE(EnvironmentAdapter::bypasses_proxy("example.com", "www.example.com", 80));
    EXPECT_TRUE(EnvironmentAdapter::bypasses_proxy(".example.com", "www.example.com", 80));
    EXPECT_FALSE(EnvironmentAdapter::bypasses_proxy("example.com", "notexample.com", 80));
}

TEST(NoProxyTest, HostPortEntriesMatchOnlyThatPort) {
    EXPECT_TRUE(EnvironmentAdapter::bypasses_proxy("example.com:8080", "example.com", 8080));
    EXPECT_FALSE(EnvironmentAdapter::bypasses_proxy("example.com:8080", "example.com", 80));
}

TEST(NoProxyTest, IgnoresCaseWhitespaceAndEmptyEntries) {
    EXPECT_TRUE(EnvironmentAdapter::bypasses_proxy(" , ,Example.COM ", "example.com", 443));
    EXPECT_FALSE(EnvironmentAdapter::bypasses_proxy(",,", "example.com", 443));
    EXPECT_FALSE(EnvironmentAdapter::bypasses_proxy("", "example.com", 443));
}

TEST(NoProxyTest, MatchesIpLiterals) {
    EXPECT_TRUE(EnvironmentAdapter::bypasses_proxy("127.0.0.1", "127.0.0.1", 80));
    EXPECT_FALSE(EnvironmentAdapter::bypasses_proxy("127.0.0.1", "127.0.0.2", 80));
}

// ===========================================================================
// 正向代理
// ===========================================================================

TEST(EnvironmentClientTest, PlainRequestGoesThroughForwardProxy) {
    LoopbackServer proxy([](const ServerRequest& req) { return ServerReply::text(200, "proxied " + req.target); });

    ClientOptions options;
    options.config.http2_enabled = false;
    options.config.maintenance_interval_ms = 0;
    options.environment = std::make_shared<MapEnvironment>(
        std::unordered_map<std::string, std::string>{{"HTTP_PROXY", "http://127.0.0.1:" + std::to_string(proxy.port())}});
    CoroutineDriver driver(std::move(options));

    Response response = driver.run(driver.client().get("http://origin.invalid/page?x=1"));
    EXPECT_EQ(driver.run(response.read()), "proxied http://origin.invalid/page?x=1");

    ASSERT_EQ(proxy.requests().size(), 1u);
    EXPECT_EQ(proxy.requests()[0].headers[http::field::host], "origin.invalid");
}

TEST(EnvironmentClientTest, NoProxyHostIsReachedDirectly) {
    LoopbackServer target([](const ServerRequest& req) { return ServerReply::text(200, "direct " + req.target); });

    ClientOptions options;
    options.config.http2_enabled = false;
    options.config.maintenance_interval_ms = 0;
    options.environment = std::make_shared<MapEnvironment>(std::unordered_map<std::string, std::string>{
        {"HTTP_PROXY", "http://127.0.0.1:1"}, {"NO_PROXY", "127.0.0.1"}});
    CoroutineDriver driver(std::move(options));

    Response response = driver.run(driver.client().get(target.url("/page")));
    EXPECT_EQ(driver.run(response.read()), "direct /page");
}
