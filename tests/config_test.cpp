#include <courier/utils/config/ConfigLoader.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

using namespace courier;

TEST(ConfigLoaderTest, EmptyDocumentYieldsDefaults) {
    const CourierConfig config = ConfigLoader::load_from_string("");
    const ClientConfig defaults;
    EXPECT_EQ(config.client.http2_enabled, defaults.http2_enabled);
    EXPECT_EQ(config.client.max_redirects, 3);
    EXPECT_EQ(config.client.max_auth_retries, 1);
    EXPECT_EQ(config.client.max_connections_per_origin, 10u);
    EXPECT_EQ(config.client.pool_timeout_ms, 5000u);
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_EQ(config.logging.output_type, "console");
}

TEST(ConfigLoaderTest, ReadsClientAndLoggingTables) {
    const CourierConfig config = ConfigLoader::load_from_string(R"(
[client]
http2_enabled = false
trust_env = false
max_redirects = 5
connect_timeout_ms = 1500
read_timeout_ms = 2500
max_connections_per_origin = 4
max_keepalive_connections = 8
keepalive_expiry_ms = 9000
maintenance_interval_ms = 1000
user_agent = "tester/2.0"

[logging]
level = "debug"
output_type = "off"
)");

    EXPECT_FALSE(config.client.http2_enabled);
    EXPECT_FALSE(config.client.trust_env);
    EXPECT_EQ(config.client.max_redirects, 5);
    EXPECT_EQ(config.client.user_agent, "tester/2.0");
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.logging.output_type, "off");

    const PoolLimits limits = config.client.limits();
    EXPECT_EQ(limits.max_connections_per_origin, 4u);
    EXPECT_EQ(limits.max_keepalive_connections, 8u);
    EXPECT_EQ(limits.keepalive_expiry, std::chrono::milliseconds(9000));

    const TimeoutConfig timeouts = config.client.timeouts();
    EXPECT_EQ(timeouts.connect, std::chrono::milliseconds(1500));
    EXPECT_EQ(timeouts.read, std::chrono::milliseconds(2500));
    EXPECT_EQ(timeouts.write, std::chrono::milliseconds(30000));
}

TEST(ConfigLoaderTest, RejectsZeroConnectionsPerOrigin) {
    EXPECT_THROW(ConfigLoader::load_from_string("[client]\nmax_connections_per_origin = 0\n"), std::runtime_error);
}

TEST(ConfigLoaderTest, RejectsZeroTimeouts) {
    EXPECT_THROW(ConfigLoader::load_from_string("[client]\npool_timeout_ms = 0\n"), std::runtime_error);
}

TEST(ConfigLoaderTest, PriorKnowledgeNeedsHttp2) {
    EXPECT_THROW(ConfigLoader::load_from_string("[client]\nhttp2_enabled = false\nhttp2_prior_knowledge = true\n"),
                 std::runtime_error);
}

TEST(ConfigLoaderTest, RejectsUnknownLogOutput) {
    EXPECT_THROW(ConfigLoader::load_from_string("[logging]\noutput_type = \"syslog\"\n"), std::runtime_error);
}

TEST(ConfigLoaderTest, RejectsMissingCaBundle) {
    EXPECT_THROW(ConfigLoader::load_from_string("[client]\nca_bundle_path = \"/nonexistent/ca.pem\"\n"),
                 std::runtime_error);
}

TEST(ConfigLoaderTest, SyntaxErrorIsRuntimeError) {
    EXPECT_THROW(ConfigLoader::load_from_string("[client\nmax_redirects = "), std::runtime_error);
}

TEST(ConfigLoaderTest, MissingFileIsRuntimeError) {
    EXPECT_THROW(ConfigLoader::load("/nonexistent/courier.toml"), std::runtime_error);
}
