//
// Created by ubuntu on 2025/11/6.
//

#ifndef COURIER_REQUEST_HPP
#define COURIER_REQUEST_HPP

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <courier/http/http_common_types.hpp>
#include <courier/http/origin.hpp>

namespace courier {

/**
 * @brief 请求体的来源：空、已知长度的字符串，或长度未知的生产者函数。
 *
 * 生产者每次返回一个分块，返回 std::nullopt 表示结束。生产者只会在 I/O 线程上被调用。
 * 拷贝 RequestBody 会共享同一个生产者，一旦开始消费就不能重放。
 */
class RequestBody {
public:
    using Producer = std::function<std::optional<std::string>()>;

    RequestBody() = default;

    /// 已知长度的请求体，以 Content-Length 发送
    explicit RequestBody(std::string data);

    /// 长度未知的请求体，HTTP/1.1 上以 chunked 发送，HTTP/2 上以 DATA 帧发送
    static RequestBody stream(Producer producer);

    [[nodiscard]] bool is_streaming() const { return stream_ != nullptr; }

    /// 流式请求体返回 std::nullopt
    [[nodiscard]] std::optional<std::size_t> content_length() const;

    /// 已知长度且长度为 0
    [[nodiscard]] bool empty() const;

    /// 定长请求体总是可以重发，流式请求体只有在还没被读取时可以
    [[nodiscard]] bool is_replayable() const;

    /// 定长请求体的内容，流式请求体返回空字符串
    [[nodiscard]] const std::string& data() const;

    /**
     * @brief 从流式请求体取下一个分块，结束后返回 std::nullopt。
     * 定长请求体没有分块可取，总是返回 std::nullopt，内容通过 data() 获取。
     */
    [[nodiscard]] std::optional<std::string> next_chunk() const;

private:
    struct StreamState {
        Producer producer;
        bool started = false;
        bool finished = false;
    };

    std::shared_ptr<const std::string> data_;
    std::shared_ptr<StreamState> stream_;
};

/**
 * @brief 不可变的请求描述。
 *
 * 适配器不会修改已有的 Request，而是通过 with_* 系列函数生成新的副本，
 * 原始请求因此可以留在重定向历史里。
 */
class Request {
public:
    /**
     * @throws std::invalid_argument URL 无效或 scheme 不受支持。
     */
    Request(http::verb method, std::string url, Headers headers = {}, RequestBody body = {});

    [[nodiscard]] http::verb method() const { return method_; }
    [[nodiscard]] const std::string& url() const { return url_; }
    [[nodiscard]] const Origin& origin() const { return origin_; }
    /// 请求行上的 origin-form target (path + query)
    [[nodiscard]] const std::string& target() const { return target_; }
    [[nodiscard]] const Headers& headers() const { return headers_; }
    [[nodiscard]] const RequestBody& body() const { return body_; }
    [[nodiscard]] const std::optional<std::string>& proxy() const { return proxy_; }
    [[nodiscard]] const std::optional<std::string>& ca_bundle() const { return ca_bundle_; }
    [[nodiscard]] bool allow_redirects() const { return allow_redirects_; }

    [[nodiscard]] Request with_url(std::string url) const;
    [[nodiscard]] Request with_method(http::verb method) const;
    [[nodiscard]] Request with_headers(Headers headers) const;
    /// 设置 (替换) 一个头部字段
    [[nodiscard]] Request with_header(http::field name, std::string_view value) const;
    [[nodiscard]] Request with_header(std::string_view name, std::string_view value) const;
    [[nodiscard]] Request without_header(http::field name) const;
    [[nodiscard]] Request with_body(RequestBody body) const;
    [[nodiscard]] Request with_proxy(std::optional<std::string> proxy_url) const;
    [[nodiscard]] Request with_ca_bundle(std::optional<std::string> path) const;
    [[nodiscard]] Request with_allow_redirects(bool allow) const;

private:
    http::verb method_;
    std::string url_;
    Origin origin_;
    std::string target_;
    Headers headers_;
    RequestBody body_;
    std::optional<std::string> proxy_;
    std::optional<std::string> ca_bundle_;
    bool allow_redirects_ = true;
};

} // namespace courier

#endif //COURIER_REQUEST_HPP
