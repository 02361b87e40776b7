//
// Created by ubuntu on 2025/11/11.
//

#ifndef COURIER_AUTH_HPP
#define COURIER_AUTH_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <courier/http/request.hpp>
#include <courier/http/response.hpp>

namespace courier {

/**
 * @brief WWW-Authenticate 里的一个质询，例如 `Digest realm="x", nonce="y", qop="auth"`。
 * scheme 和参数名都已转为小写。
 */
struct AuthChallenge {
    std::string scheme;
    std::map<std::string, std::string> params;

    [[nodiscard]] std::optional<std::string> param(const std::string& name) const;
};

/**
 * @brief 解析响应里所有 WWW-Authenticate 头中的质询。一个头里可以有多个以逗号分隔的质询。
 */
std::vector<AuthChallenge> parse_challenges(const Headers& headers);

/**
 * @interface IAuthStrategy
 * @brief 认证策略：根据 401 响应的质询生成 Authorization 头。
 */
class IAuthStrategy {
public:
    virtual ~IAuthStrategy() = default;

    /**
     * @brief 回应一个 401 响应。
     * @param request 得到 401 的请求。
     * @param response 401 响应，质询在它的 WWW-Authenticate 头里。
     * @return Authorization 头的值；策略无法回应这个质询时返回 std::nullopt。
     */
    virtual std::optional<std::string> respond(const Request& request, const Response& response) = 0;
};

/// RFC 7617 Basic 认证
class BasicAuth final : public IAuthStrategy {
public:
    BasicAuth(std::string username, std::string password);

    std::optional<std::string> respond(const Request& request, const Response& response) override;

    /// "Basic base64(user:pass)"
    [[nodiscard]] std::string authorization() const;

private:
    std::string username_;
    std::string password_;
};

/**
 * @brief RFC 7616 Digest 认证，支持 MD5 / MD5-sess / SHA-256 / SHA-256-sess 与 qop=auth (或没有 qop)。
 *
 * 同一个 nonce 的 nc 计数在多次请求之间递增。
 */
class DigestAuth final : public IAuthStrategy {
public:
    /// 生成客户端随机数 cnonce 的函数
    using CnonceSource = std::function<std::string()>;

    DigestAuth(std::string username, std::string password, CnonceSource cnonce_source = {});

    std::optional<std::string> respond(const Request& request, const Response& response) override;

    /**
     * @brief 针对单个 Digest 质询生成 Authorization 头。
     * @return 算法或 qop 不受支持、缺少 nonce 时返回 std::nullopt。
     */
    std::optional<std::string> answer(const AuthChallenge& challenge, http::verb method, const std::string& uri);

private:
    std::string username_;
    std::string password_;
    CnonceSource cnonce_source_;

    std::mutex mutex_;
    std::string last_nonce_;
    uint32_t nonce_count_ = 0;
};

} // namespace courier

#endif //COURIER_AUTH_HPP
