//
// Created by ubuntu on 2025/11/10.
//

#include <courier/adapters/cookie_jar.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <ctime>
#include <ranges>
#include <spdlog/spdlog.h>

namespace courier {

namespace {

std::string_view trim(std::string_view s) {
    const auto start = s.find_first_not_of(" \t");
    if (start == std::string_view::npos) {
        return {};
    }
    const auto end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::ranges::transform(result, result.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

int64_t now_seconds() {
    return static_cast<int64_t>(std::time(nullptr));
}

bool is_expired(const Cookie& cookie, const int64_t now) {
    return cookie.expires_at > 0 && cookie.expires_at <= now;
}

} // namespace

void CookieJar::store(const Origin& origin, const std::string_view request_path, const std::string_view set_cookie) {
    // 格式: name=value; Path=/; Domain=.example.com; Max-Age=60; Secure; HttpOnly
    Cookie cookie;
    cookie.domain = to_lower(origin.host());
    cookie.path = default_path(request_path);

    bool first = true;
    bool has_max_age = false;
    std::string_view rest = set_cookie;
    while (true) {
        const auto semi = rest.find(';');
        const std::string_view part = trim(rest.substr(0, semi));

        if (first) {
            // 第一段是 name=value
            const auto eq = part.find('=');
            if (eq == std::string_view::npos) {
                SPDLOG_DEBUG("Ignoring malformed Set-Cookie '{}'", set_cookie);
                return;
            }
            cookie.name = std::string(trim(part.substr(0, eq)));
            cookie.value = std::string(trim(part.substr(eq + 1)));
            first = false;
        } else if (!part.empty()) {
            const auto eq = part.find('=');
            const std::string attr_name = to_lower(trim(part.substr(0, eq)));
            const std::string_view attr_value = eq == std::string_view::npos ? std::string_view{} : trim(part.substr(eq + 1));

            if (attr_name == "domain" && !attr_value.empty()) {
                std::string dom = to_lower(attr_value);
                // 去掉开头的点
                if (dom.front() == '.') {
                    dom.erase(0, 1);
                }
                cookie.domain = std::move(dom);
                cookie.host_only = false;
            } else if (attr_name == "path") {
                if (!attr_value.empty() && attr_value.front() == '/') {
                    cookie.path = std::string(attr_value);
                }
            } else if (attr_name == "secure") {
                cookie.secure = true;
            } else if (attr_name == "httponly") {
                cookie.http_only = true;
            } else if (attr_name == "max-age") {
                // Max-Age 单位为秒，优先于 Expires
                int64_t max_age = 0;
                const auto [ptr, ec] = std::from_chars(attr_value.data(), attr_value.data() + attr_value.size(), max_age);
                if (ec == std::errc{} && ptr == attr_value.data() + attr_value.size()) {
                    has_max_age = true;
                    // 过期的 cookie 用 1 表示 (epoch + 1)
                    cookie.expires_at = max_age <= 0 ? 1 : now_seconds() + max_age;
                }
            } else if (attr_name == "expires" && !has_max_age) {
                // HTTP 日期，例如 "Thu, 01 Dec 2025 00:00:00 GMT"
                std::tm tm = {};
                const std::string date(attr_value);
                if (strptime(date.c_str(), "%a, %d %b %Y %H:%M:%S", &tm)) {
                    const auto expires = static_cast<int64_t>(timegm(&tm));
                    cookie.expires_at = expires > 0 ? expires : 1;
                }
            }
        }

        if (semi == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(semi + 1);
    }

    if (cookie.name.empty()) {
        return;
    }

    const std::string host = to_lower(origin.host());
    if (!cookie.host_only && cookie.domain.find('.') == std::string::npos) {
        // 单标签的 Domain 是顶级域名一类的公共后缀，只允许主机给自己设置
        if (cookie.domain != host) {
            SPDLOG_DEBUG("Rejecting cookie '{}' for top-level domain '{}' set by {}", cookie.name, cookie.domain, origin.host());
            return;
        }
        cookie.host_only = true;
    }

    // Domain 属性必须覆盖设置它的主机，否则拒绝
    if (!domain_matches(cookie, host)) {
        SPDLOG_DEBUG("Rejecting cookie '{}' for domain '{}' set by {}", cookie.name, cookie.domain, origin.host());
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    // 替换同 name + domain + path 的 cookie，过期的直接删除
    const std::string domain = cookie.domain;
    auto& domain_cookies = cookies_[domain];
    cookie.creation_index = next_creation_index_++;
    std::erase_if(domain_cookies, [&](const Cookie& existing) {
        if (existing.name != cookie.name || existing.path != cookie.path) {
            return false;
        }
        cookie.creation_index = existing.creation_index;
        return true;
    });
    if (!is_expired(cookie, now_seconds())) {
        domain_cookies.push_back(std::move(cookie));
    }
    if (domain_cookies.empty()) {
        cookies_.erase(domain);
    }
}

std::string CookieJar::cookie_header(const Origin& origin, const std::string_view request_path) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string host = to_lower(origin.host());
    const int64_t now = now_seconds();

    std::vector<const Cookie*> matched;
    for (const auto& domain_cookies : cookies_ | std::views::values) {
        for (const auto& cookie : domain_cookies) {
            if (!domain_matches(cookie, host)) continue;
            if (!path_matches(cookie.path, request_path)) continue;
            if (cookie.secure && !origin.is_tls()) continue;
            if (is_expired(cookie, now)) continue;
            matched.push_back(&cookie);
        }
    }

    // RFC 6265 5.4：路径长的在前，同样长时先创建的在前
    std::ranges::sort(matched, [](const Cookie* a, const Cookie* b) {
        if (a->path.size() != b->path.size()) {
            return a->path.size() > b->path.size();
        }
        return a->creation_index < b->creation_index;
    });

    std::string result;
    for (const Cookie* cookie : matched) {
        if (!result.empty()) result += "; ";
        result += cookie->name + "=" + cookie->value;
    }
    return result;
}

std::vector<Cookie> CookieJar::cookies() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Cookie> result;
    const int64_t now = now_seconds();
    for (const auto& domain_cookies : cookies_ | std::views::values) {
        for (const auto& cookie : domain_cookies) {
            if (!is_expired(cookie, now)) {
                result.push_back(cookie);
            }
        }
    }
    return result;
}

void CookieJar::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cookies_.clear();
}

std::size_t CookieJar::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& domain_cookies : cookies_ | std::views::values) {
        count += domain_cookies.size();
    }
    return count;
}

bool CookieJar::domain_matches(const Cookie& cookie, const std::string& request_host) {
    if (cookie.domain == request_host) return true;
    if (cookie.host_only) return false;
    // request_host 以 "." + cookie.domain 结尾
    if (request_host.size() > cookie.domain.size()) {
        const auto pos = request_host.size() - cookie.domain.size();
        if (request_host[pos - 1] == '.' && request_host.compare(pos, std::string::npos, cookie.domain) == 0) {
            return true;
        }
    }
    return false;
}

bool CookieJar::path_matches(const std::string& cookie_path, const std::string_view request_path) {
    const std::string_view path = request_path.empty() ? std::string_view{"/"} : request_path;
    if (cookie_path == path) return true;
    if (!path.starts_with(cookie_path)) return false;
    // "/docs" 匹配 "/docs/a"，不匹配 "/docsearch"
    return cookie_path.back() == '/' || path[cookie_path.size()] == '/';
}

std::string CookieJar::default_path(const std::string_view request_path) {
    if (request_path.empty() || request_path.front() != '/') {
        return "/";
    }
    const auto last_slash = request_path.rfind('/');
    if (last_slash == 0) {
        return "/";
    }
    return std::string(request_path.substr(0, last_slash));
}

} // namespace courier
