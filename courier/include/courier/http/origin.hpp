//
// Created by ubuntu on 2025/11/6.
//

#ifndef COURIER_ORIGIN_HPP
#define COURIER_ORIGIN_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace courier {

/**
 * @brief 连接池的键：scheme + host + port。
 *
 * scheme 只保存 "http" / "https" (不带 ":")，host 为小写且不带 IPv6 的方括号，
 * 端口总是显式的，所以 `HTTP://Example.COM:80/a` 和 `http://example.com/b` 得到同一个 Origin。
 */
class Origin {
public:
    Origin() = default;
    Origin(std::string scheme, std::string host, uint16_t port);

    /**
     * @brief 从绝对 URL 中提取 Origin。
     * @throws std::invalid_argument URL 无效，或 scheme 不是 http / https。
     */
    static Origin from_url(std::string_view url);

    [[nodiscard]] const std::string& scheme() const { return scheme_; }
    [[nodiscard]] const std::string& host() const { return host_; }
    [[nodiscard]] uint16_t port() const { return port_; }

    [[nodiscard]] bool is_tls() const { return scheme_ == "https"; }
    [[nodiscard]] bool is_default_port() const { return port_ == default_port(scheme_); }

    /// "scheme://host:port"，用于日志和连接池的 map 键
    [[nodiscard]] std::string key() const;

    /// 用于 Host 头和 CONNECT 目标的 authority，默认端口时省略端口
    [[nodiscard]] std::string authority() const;

    /// 用于 CONNECT 请求行的 "host:port"，总是带端口
    [[nodiscard]] std::string host_port() const;

    static uint16_t default_port(std::string_view scheme);

    friend bool operator==(const Origin& lhs, const Origin& rhs) {
        return lhs.port_ == rhs.port_ && lhs.scheme_ == rhs.scheme_ && lhs.host_ == rhs.host_;
    }

    friend bool operator!=(const Origin& lhs, const Origin& rhs) {
        return !(lhs == rhs);
    }

private:
    std::string scheme_;
    std::string host_;
    uint16_t port_ = 0;
};

/// 解析后的绝对 URL：Origin + 请求行里的 target (path + query)
struct ParsedUrl {
    Origin origin;
    std::string target;
};

/**
 * @brief 使用 ada 解析绝对 URL。
 * @throws std::invalid_argument URL 无效或 scheme 不受支持。
 */
ParsedUrl parse_url(std::string_view url);

/**
 * @brief 按 RFC 3986 把 Location 之类的引用解析为绝对 URL。
 * @return 解析失败时原样返回 reference。
 */
std::string resolve_url(const std::string& base_url, const std::string& reference);

} // namespace courier

#endif //COURIER_ORIGIN_HPP
