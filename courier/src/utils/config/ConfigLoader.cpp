//
// Created by ubuntu on 2025/11/6.
//

#include <courier/utils/config/ConfigLoader.hpp>

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace courier {

namespace {

void finalize_config(CourierConfig& config) {
    ClientConfig& client = config.client;

    if (client.max_connections_per_origin == 0) {
        throw std::runtime_error("client.max_connections_per_origin 必须大于 0");
    }
    if (client.connect_timeout_ms == 0 || client.pool_timeout_ms == 0 ||
        client.read_timeout_ms == 0 || client.write_timeout_ms == 0 || client.flow_control_timeout_ms == 0) {
        throw std::runtime_error("client 的超时配置 (connect/pool/read/write/flow_control) 必须大于 0");
    }
    if (client.http2_max_concurrent_streams == 0) {
        throw std::runtime_error("client.http2_max_concurrent_streams 必须大于 0");
    }
    if (client.http2_prior_knowledge && !client.http2_enabled) {
        throw std::runtime_error("client.http2_prior_knowledge 需要同时开启 client.http2_enabled");
    }

    // 维护间隔比保活时间还长时，过期连接只能依赖 acquire / release 时的顺带清理
    if (client.maintenance_interval_ms > client.keepalive_expiry_ms) {
        SPDLOG_WARN("client.maintenance_interval_ms ({}) 大于 keepalive_expiry_ms ({})，后台清理会滞后",
                    client.maintenance_interval_ms, client.keepalive_expiry_ms);
    }

    if (!client.ca_bundle_path.empty() && !std::ifstream(client.ca_bundle_path)) {
        throw std::runtime_error("未找到 CA 证书文件: " + client.ca_bundle_path);
    }

    const std::string& output = config.logging.output_type;
    if (output != "console" && output != "file" && output != "all" && output != "off") {
        throw std::runtime_error("logging.output_type 的值 '" + output + "' 无效，仅支持 console / file / all / off");
    }
}

} // namespace

// --- 主加载函数 ---
CourierConfig ConfigLoader::load(const std::string& filepath) {
    try {
        const toml::table root_tbl = toml::parse_file(filepath);
        return from_table(root_tbl);
    } catch (const toml::parse_error& err) {
        std::cerr << "Error parsing config file '" << filepath << "':\n" << err << std::endl;
        throw std::runtime_error(std::string(err.description()));
    }
}

CourierConfig ConfigLoader::load_from_string(const std::string_view toml_text) {
    try {
        const toml::table root_tbl = toml::parse(toml_text);
        return from_table(root_tbl);
    } catch (const toml::parse_error& err) {
        throw std::runtime_error(std::string(err.description()));
    }
}

CourierConfig ConfigLoader::from_table(const toml::table& root_tbl) {
    CourierConfig config;
    config.client = parse_client(root_tbl);
    config.logging = parse_logging(root_tbl);
    finalize_config(config);
    return config;
}

// --- 私有帮助函数实现 ---

LoggingConfig ConfigLoader::parse_logging(const toml::table& log_tb) {
    LoggingConfig logConfig;
    if (const auto table = log_tb["logging"].as_table()) {
        logConfig.level = (*table)["level"].value_or(logConfig.level);
        logConfig.output_type = (*table)["output_type"].value_or(logConfig.output_type);
        logConfig.file_path = (*table)["file_path"].value_or(logConfig.file_path);
        logConfig.max_size_mb = (*table)["max_size_mb"].value_or(logConfig.max_size_mb);
        logConfig.max_files = (*table)["max_files"].value_or(logConfig.max_files);
    }
    return logConfig;
}

ClientConfig ConfigLoader::parse_client(const toml::table& client_tb) {
    ClientConfig cfg;
    if (const auto client_tbl = client_tb["client"].as_table()) {
        // 使用 value_or 填充每个字段
        cfg.http2_enabled = (*client_tbl)["http2_enabled"].value_or(cfg.http2_enabled);
        cfg.http2_prior_knowledge = (*client_tbl)["http2_prior_knowledge"].value_or(cfg.http2_prior_knowledge);
        cfg.ssl_verify = (*client_tbl)["ssl_verify"].value_or(cfg.ssl_verify);
        cfg.ca_bundle_path = (*client_tbl)["ca_bundle_path"].value_or(cfg.ca_bundle_path);
        cfg.trust_env = (*client_tbl)["trust_env"].value_or(cfg.trust_env);
        cfg.max_redirects = (*client_tbl)["max_redirects"].value_or(cfg.max_redirects);
        cfg.max_auth_retries = (*client_tbl)["max_auth_retries"].value_or(cfg.max_auth_retries);
        cfg.connect_timeout_ms = (*client_tbl)["connect_timeout_ms"].value_or(cfg.connect_timeout_ms);
        cfg.pool_timeout_ms = (*client_tbl)["pool_timeout_ms"].value_or(cfg.pool_timeout_ms);
        cfg.read_timeout_ms = (*client_tbl)["read_timeout_ms"].value_or(cfg.read_timeout_ms);
        cfg.write_timeout_ms = (*client_tbl)["write_timeout_ms"].value_or(cfg.write_timeout_ms);
        cfg.flow_control_timeout_ms = (*client_tbl)["flow_control_timeout_ms"].value_or(cfg.flow_control_timeout_ms);
        cfg.max_connections_per_origin = (*client_tbl)["max_connections_per_origin"].value_or(cfg.max_connections_per_origin);
        cfg.max_keepalive_connections = (*client_tbl)["max_keepalive_connections"].value_or(cfg.max_keepalive_connections);
        cfg.keepalive_expiry_ms = (*client_tbl)["keepalive_expiry_ms"].value_or(cfg.keepalive_expiry_ms);
        cfg.maintenance_interval_ms = (*client_tbl)["maintenance_interval_ms"].value_or(cfg.maintenance_interval_ms);
        cfg.http2_max_concurrent_streams = (*client_tbl)["http2_max_concurrent_streams"].value_or(cfg.http2_max_concurrent_streams);
        cfg.protocol_cache_ttl_ms = (*client_tbl)["protocol_cache_ttl_ms"].value_or(cfg.protocol_cache_ttl_ms);
        cfg.user_agent = (*client_tbl)["user_agent"].value_or(cfg.user_agent);
    }
    return cfg;
}

} // namespace courier
