//
// Created by ubuntu on 2025/11/10.
//

#ifndef COURIER_COOKIE_JAR_HPP
#define COURIER_COOKIE_JAR_HPP

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <courier/http/origin.hpp>

namespace courier {

struct Cookie {
    std::string name;
    std::string value;
    std::string domain;
    std::string path = "/";
    bool secure = false;
    bool http_only = false;
    /// 没有 Domain 属性的 cookie 只发回给设置它的主机本身
    bool host_only = true;
    // 0 = 会话 cookie；否则为 epoch 秒
    int64_t expires_at = 0;
    /// 创建顺序。替换同名 cookie 时沿用旧值
    uint64_t creation_index = 0;
};

/**
 * @interface ICookieStore
 * @brief Cookie 的存取接口，CookieAdapter 通过它读写 cookie。实现必须是线程安全的。
 */
class ICookieStore {
public:
    virtual ~ICookieStore() = default;

    /// 保存响应里的一个 Set-Cookie 头
    virtual void store(const Origin& origin, std::string_view request_path, std::string_view set_cookie) = 0;

    /// 生成发往 origin + path 的 Cookie 头的值，没有匹配的 cookie 时返回空字符串
    [[nodiscard]] virtual std::string cookie_header(const Origin& origin, std::string_view request_path) const = 0;
};

/**
 * @brief 内存中的 cookie 容器。
 *
 * 作用域是域名 (Domain 属性允许子域名匹配) 加路径，过期时间和 Secure 属性都会被遵守。
 * Max-Age 优先于 Expires，Max-Age <= 0 或过去的 Expires 会删除同名 cookie。
 * 单标签的 Domain (例如 "com") 被拒绝，除非它就是设置它的主机本身，这时按 host-only 处理。
 * Cookie 头里路径更长的排在前面，路径一样长时先创建的在前。
 */
class CookieJar final : public ICookieStore {
public:
    void store(const Origin& origin, std::string_view request_path, std::string_view set_cookie) override;

    [[nodiscard]] std::string cookie_header(const Origin& origin, std::string_view request_path) const override;

    /// 当前保存的所有未过期 cookie
    [[nodiscard]] std::vector<Cookie> cookies() const;

    void clear();

    [[nodiscard]] std::size_t size() const;

private:
    static bool domain_matches(const Cookie& cookie, const std::string& request_host);
    static bool path_matches(const std::string& cookie_path, std::string_view request_path);
    /// RFC 6265 5.1.4：请求路径中最后一个 '/' 之前的部分
    static std::string default_path(std::string_view request_path);

    mutable std::mutex mutex_;
    // domain -> cookies
    std::unordered_map<std::string, std::vector<Cookie>> cookies_;
    uint64_t next_creation_index_ = 0;
};

} // namespace courier

#endif //COURIER_COOKIE_JAR_HPP
