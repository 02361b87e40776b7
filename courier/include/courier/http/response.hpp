//
// Created by ubuntu on 2025/11/7.
//

#ifndef COURIER_RESPONSE_HPP
#define COURIER_RESPONSE_HPP

#include <boost/asio/awaitable.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <courier/http/body_stream.hpp>
#include <courier/http/http_common_types.hpp>
#include <courier/http/request.hpp>

namespace courier {

/**
 * @brief HTTP 响应。
 *
 * 响应体是一次性的流：要么用 read_some() 逐块读取，要么用 read() 一次读完并缓存到 content()。
 * Response 的拷贝共享同一个响应体状态，所以历史记录里的响应和调用者手里的响应不会被读两次。
 */
class Response {
public:
    Response() = default;
    Response(unsigned status, std::string reason, HttpVersion version, Headers headers,
             std::unique_ptr<IBodyStream> body);

    [[nodiscard]] unsigned status() const { return status_; }
    [[nodiscard]] const std::string& reason() const { return reason_; }
    [[nodiscard]] HttpVersion version() const { return version_; }
    /// "HTTP/1.1" 或 "HTTP/2"
    [[nodiscard]] std::string_view protocol() const { return to_string(version_); }
    [[nodiscard]] const Headers& headers() const { return headers_; }

    /// 产生这个响应的请求 (重定向之后是最后一跳的请求)
    [[nodiscard]] const std::shared_ptr<const Request>& request() const { return request_; }

    /// 重定向链上之前的响应，按时间顺序，不包含本响应
    [[nodiscard]] const std::vector<Response>& history() const { return history_; }

    /**
     * @brief 读取下一个响应体分块，读到结尾时返回 std::nullopt。
     * @throws system_error response_closed 响应已关闭；stream_consumed 响应体已经被 read() 读完或已经读到过结尾。
     */
    boost::asio::awaitable<std::optional<std::string>> read_some();

    /**
     * @brief 读取完整的响应体并缓存，之后可以通过 content() 反复访问。读完后借用的连接会被归还。
     * @throws system_error stream_consumed 已经用 read_some() 读取过一部分。
     */
    boost::asio::awaitable<std::string> read();

    /**
     * @throws system_error response_not_read 还没有调用过 read()。
     */
    [[nodiscard]] const std::string& content() const;

    /// 是否已经通过 read() 缓存了响应体
    [[nodiscard]] bool is_read() const;

    /// 关闭响应，放弃尚未读取的响应体并归还连接。可重复调用。
    boost::asio::awaitable<void> close();

    [[nodiscard]] bool is_closed() const;

    /// 3xx 并且带有 Location 头
    [[nodiscard]] bool is_redirect() const;

    /**
     * @throws system_error http_status 状态码为 4xx / 5xx。
     */
    void raise_for_status() const;

    /**
     * @brief 用 wrap 包装底层的响应体流，必须在开始读取响应体之前调用。
     * 连接池用它把"归还连接"挂在响应体读完 / 关闭 / 析构上。
     */
    template <typename Wrap>
    void wrap_body(Wrap&& wrap) {
        if (body_) {
            body_->stream = std::forward<Wrap>(wrap)(std::move(body_->stream));
        }
    }

    void set_request(std::shared_ptr<const Request> request) { request_ = std::move(request); }
    void set_history(std::vector<Response> history) { history_ = std::move(history); }

private:
    struct BodyState {
        std::unique_ptr<IBodyStream> stream;
        std::optional<std::string> content;
        bool started = false;
        bool exhausted = false;
        bool closed = false;
    };

    unsigned status_ = 0;
    std::string reason_;
    HttpVersion version_ = HttpVersion::http_1_1;
    Headers headers_;
    std::shared_ptr<BodyState> body_;
    std::shared_ptr<const Request> request_;
    std::vector<Response> history_;
};

} // namespace courier

#endif //COURIER_RESPONSE_HPP
