//
// Created by ubuntu on 2025/11/10.
//

#include <courier/adapters/environment_adapter.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace courier {

namespace {

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::ranges::transform(result, result.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string_view trim(std::string_view s) {
    const auto start = s.find_first_not_of(" \t");
    if (start == std::string_view::npos) {
        return {};
    }
    const auto end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

/// "proxy:3128" 这种没有 scheme 的写法按 http 代理处理
std::string normalize_proxy_url(const std::string& value) {
    if (value.find("://") == std::string::npos) {
        return "http://" + value;
    }
    return value;
}

} // namespace

std::optional<std::string> ProcessEnvironment::get(const std::string_view name) const {
    const std::string key(name);
    if (const char* value = std::getenv(key.c_str())) {
        return std::string(value);
    }
    return std::nullopt;
}

std::optional<std::string> MapEnvironment::get(const std::string_view name) const {
    if (const auto it = values_.find(std::string(name)); it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

EnvironmentAdapter::EnvironmentAdapter(std::shared_ptr<const IEnvironment> environment, const bool trust_env)
    : environment_(std::move(environment)),
      trust_env_(trust_env) {
}

boost::asio::awaitable<Response> EnvironmentAdapter::handle(Request request, Next next) {
    co_return co_await next(apply(request));
}

Request EnvironmentAdapter::apply(const Request& request) const {
    if (!trust_env_ || !environment_) {
        return request;
    }

    Request result = request;
    const Origin& origin = request.origin();

    if (!request.proxy()) {
        const auto no_proxy = lookup("NO_PROXY");
        if (!no_proxy || !bypasses_proxy(*no_proxy, origin.host(), origin.port())) {
            auto proxy = lookup(origin.is_tls() ? "HTTPS_PROXY" : "HTTP_PROXY");
            if (!proxy) {
                proxy = lookup("ALL_PROXY");
            }
            if (proxy) {
                SPDLOG_DEBUG("Using proxy '{}' from environment for {}", *proxy, origin.key());
                result = result.with_proxy(normalize_proxy_url(*proxy));
            }
        }
    }

    if (!request.ca_bundle() && origin.is_tls()) {
        auto ca_bundle = lookup("SSL_CERT_FILE");
        if (!ca_bundle) {
            ca_bundle = lookup("REQUESTS_CA_BUNDLE");
        }
        if (ca_bundle) {
            result = result.with_ca_bundle(std::move(ca_bundle));
        }
    }
    return result;
}

bool EnvironmentAdapter::bypasses_proxy(const std::string_view no_proxy, const std::string& host, const uint16_t port) {
    const std::string lower_host = to_lower(host);
    std::string_view rest = no_proxy;
    while (!rest.empty()) {
        const auto comma = rest.find(',');
        std::string entry = to_lower(trim(rest.substr(0, comma)));
        rest = comma == std::string_view::npos ? std::string_view{} : rest.substr(comma + 1);
        if (entry.empty()) {
            continue;
        }
        if (entry == "*") {
            return true;
        }

        // host:port 形式只匹配对应端口 (IPv6 字面量不带端口)
        if (const auto colon = entry.rfind(':'); colon != std::string::npos && entry.find(':') == colon) {
            if (entry.substr(colon + 1) != std::to_string(port)) {
                continue;
            }
            entry.resize(colon);
        }
        if (!entry.empty() && entry.front() == '.') {
            entry.erase(0, 1);
        }
        if (entry.empty()) {
            continue;
        }
        if (lower_host == entry) {
            return true;
        }
        if (lower_host.size() > entry.size() && lower_host.ends_with(entry) &&
            lower_host[lower_host.size() - entry.size() - 1] == '.') {
            return true;
        }
    }
    return false;
}

std::optional<std::string> EnvironmentAdapter::lookup(const std::string_view upper_name) const {
    for (const std::string& name : {to_lower(upper_name), std::string(upper_name)}) {
        if (auto value = environment_->get(name); value && !trim(*value).empty()) {
            return std::string(trim(*value));
        }
    }
    return std::nullopt;
}

} // namespace courier
