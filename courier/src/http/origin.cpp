//
// Created by ubuntu on 2025/11/6.
//

#include <courier/http/origin.hpp>

#include <ada.h>
#include <boost/url/parse.hpp>
#include <boost/url/url.hpp>
#include <charconv>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace courier {

namespace {

// ada 对 IPv6 返回 "[::1]"，池键里统一去掉方括号
std::string strip_brackets(std::string_view host) {
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host.remove_prefix(1);
        host.remove_suffix(1);
    }
    return std::string(host);
}

std::string bracket_if_ipv6(const std::string& host) {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]";
    }
    return host;
}

} // namespace

Origin::Origin(std::string scheme, std::string host, const uint16_t port)
    : scheme_(std::move(scheme)), host_(std::move(host)), port_(port) {
}

Origin Origin::from_url(const std::string_view url) {
    return parse_url(url).origin;
}

std::string Origin::key() const {
    return scheme_ + "://" + bracket_if_ipv6(host_) + ":" + std::to_string(port_);
}

std::string Origin::authority() const {
    if (is_default_port()) {
        return bracket_if_ipv6(host_);
    }
    return host_port();
}

std::string Origin::host_port() const {
    return bracket_if_ipv6(host_) + ":" + std::to_string(port_);
}

uint16_t Origin::default_port(const std::string_view scheme) {
    if (scheme == "https") return 443;
    if (scheme == "http") return 80;
    return 0;
}

/**
 * @brief 使用 ada-url 解析绝对 URL。
 *
 * - 缺少协议头的 URL (如 "example.com/a") 会补全为 "http://" 后重试。
 * - host 由 ada 规范化为小写，端口为空时取 scheme 的默认端口。
 * - target 由 pathname + search 组成，二者都为空时为 "/"。
 */
ParsedUrl parse_url(const std::string_view url_strv) {
    // 1. 尝试直接解析 string_view (零拷贝的快速路径)
    auto url = ada::parse<ada::url_aggregator>(url_strv);

    std::string url_storage; // 仅在需要修改时才分配内存

    // 2. 如果初步解析失败，通常是因为缺少协议头，尝试补全并重试
    if (!url) {
        url_storage = std::string(url_strv);
        if (url_storage.find("://") == std::string::npos) {
            url_storage.insert(0, "http://");
        }
        SPDLOG_DEBUG("Re-parsing URL with protocol hint: {}", url_storage);
        url = ada::parse<ada::url_aggregator>(url_storage);

        if (!url) {
            throw std::invalid_argument("Failed to parse URL: " + std::string(url_strv));
        }
    }

    // 3. ada::parse 成功不代表 URL 一定有效，is_valid 做更深层的检查
    if (!url->is_valid) {
        throw std::invalid_argument("Invalid URL format: " + std::string(url_strv));
    }

    // get_protocol() 返回 "https:" 形式，去掉结尾的 ':'
    std::string_view protocol = url->get_protocol();
    if (!protocol.empty() && protocol.back() == ':') {
        protocol.remove_suffix(1);
    }
    if (protocol != "http" && protocol != "https") {
        throw std::invalid_argument("Unsupported URL scheme '" + std::string(protocol) + "' in: " + std::string(url_strv));
    }

    const std::string_view hostname = url->get_hostname();
    if (hostname.empty()) {
        throw std::invalid_argument("URL has no host: " + std::string(url_strv));
    }

    // 4. 端口为空时取默认端口，否则用 from_chars 做严格解析
    uint16_t port = Origin::default_port(protocol);
    if (const std::string_view port_sv = url->get_port(); !port_sv.empty()) {
        auto [ptr, ec] = std::from_chars(port_sv.data(), port_sv.data() + port_sv.size(), port);
        if (ec != std::errc{} || ptr != port_sv.data() + port_sv.size()) {
            throw std::invalid_argument("Invalid port in URL: '" + std::string(port_sv) + "'");
        }
    }

    ParsedUrl result{Origin(std::string(protocol), strip_brackets(hostname), port), {}};

    // 5. 组合 target (path + query)
    const std::string_view pathname = url->get_pathname();
    const std::string_view search = url->get_search();
    if (pathname.empty() && search.empty()) {
        result.target = "/";
    } else {
        result.target.reserve(pathname.length() + search.length());
        result.target.append(pathname);
        result.target.append(search);
    }
    return result;
}

std::string resolve_url(const std::string& base_url, const std::string& reference) {
    // 1. 将字符串解析为 boost::url_view 对象，url_view 是非拥有式的视图
    const boost::system::result<boost::urls::url_view> base_view_res = boost::urls::parse_uri(base_url);
    if (!base_view_res) {
        SPDLOG_WARN("Failed to parse base_url '{}': {}", base_url, base_view_res.error().message());
        return reference;
    }

    const boost::system::result<boost::urls::url_view> ref_view_res = boost::urls::parse_uri_reference(reference);
    if (!ref_view_res) {
        SPDLOG_WARN("Failed to parse reference '{}': {}", reference, ref_view_res.error().message());
        return reference;
    }

    // 2. 三参数的 resolve 把结果写入 resolved_url
    boost::urls::url resolved_url;
    const boost::system::result<void> resolve_result = boost::urls::resolve(*base_view_res, *ref_view_res, resolved_url);
    if (!resolve_result) {
        SPDLOG_WARN("Failed to resolve '{}' against base '{}': {}",
                    reference, base_url, resolve_result.error().message());
        return reference;
    }

    return std::string(resolved_url.buffer());
}

} // namespace courier
