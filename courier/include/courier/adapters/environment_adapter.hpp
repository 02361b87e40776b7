//
// Created by ubuntu on 2025/11/10.
//

#ifndef COURIER_ENVIRONMENT_ADAPTER_HPP
#define COURIER_ENVIRONMENT_ADAPTER_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <courier/adapters/adapter.hpp>

namespace courier {

/**
 * @interface IEnvironment
 * @brief 环境变量的读取接口。
 */
class IEnvironment {
public:
    virtual ~IEnvironment() = default;

    /// 变量不存在时返回 std::nullopt
    [[nodiscard]] virtual std::optional<std::string> get(std::string_view name) const = 0;
};

/// 读取进程环境变量
class ProcessEnvironment final : public IEnvironment {
public:
    [[nodiscard]] std::optional<std::string> get(std::string_view name) const override;
};

/// 固定内容的环境，用于嵌入式配置和测试
class MapEnvironment final : public IEnvironment {
public:
    MapEnvironment() = default;
    explicit MapEnvironment(std::unordered_map<std::string, std::string> values) : values_(std::move(values)) {}

    void set(std::string name, std::string value) { values_[std::move(name)] = std::move(value); }

    [[nodiscard]] std::optional<std::string> get(std::string_view name) const override;

private:
    std::unordered_map<std::string, std::string> values_;
};

/**
 * @brief 根据环境变量给请求填上代理和 CA 文件提示。
 *
 * - 代理：HTTPS_PROXY / HTTP_PROXY 按请求的 scheme 选择，其次是 ALL_PROXY；
 *   NO_PROXY 中列出的主机 (逗号分隔，`*` 表示全部，支持子域名和 host:port) 不走代理；
 * - CA 文件：SSL_CERT_FILE，其次是 REQUESTS_CA_BUNDLE，只对 https 请求生效。
 *
 * 变量名大小写均可，小写优先。请求上已有的提示不会被覆盖。trust_env 为 false 时什么也不做。
 */
class EnvironmentAdapter final : public Adapter {
public:
    EnvironmentAdapter(std::shared_ptr<const IEnvironment> environment, bool trust_env);

    boost::asio::awaitable<Response> handle(Request request, Next next) override;

    [[nodiscard]] std::string_view name() const override { return "environment"; }

    /// 根据环境补全请求的路由提示，不修改原请求
    [[nodiscard]] Request apply(const Request& request) const;

    /// host (以及 port) 是否命中 NO_PROXY 列表
    static bool bypasses_proxy(std::string_view no_proxy, const std::string& host, uint16_t port);

private:
    /// 先查小写名字，再查大写名字，空值视为不存在
    [[nodiscard]] std::optional<std::string> lookup(std::string_view upper_name) const;

    std::shared_ptr<const IEnvironment> environment_;
    bool trust_env_;
};

} // namespace courier

#endif //COURIER_ENVIRONMENT_ADAPTER_HPP
