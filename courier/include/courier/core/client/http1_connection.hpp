//
// Created by ubuntu on 2025/11/7.
//

#ifndef COURIER_HTTP1_CONNECTION_HPP
#define COURIER_HTTP1_CONNECTION_HPP

#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>
#include <memory>
#include <optional>
#include <string>

#include <courier/core/client/iconnection.hpp>
#include <courier/core/client/transport.hpp>
#include <courier/utils/config/CourierConfig.hpp>

namespace courier {

/**
 * @brief HTTP/1.1 连接，同一时刻只承载一次交换。
 *
 * 交换的状态依次为 Idle → RequestSent → RequestBodySent → ResponseHeadersReceived
 * → ResponseBodyStreaming → Idle | Closed。send() 在响应头到达后返回，
 * 响应体通过 Response 的流从这条连接上按需读取，读完后连接回到 Idle。
 *
 * 任何 I/O 错误、超时、报文格式错误或者中途放弃，都会让连接进入 Closed，不再复用。
 *
 * @tparam Stream PlainStream 或 TlsStream。
 */
template <typename Stream>
class Http1Connection final : public IConnection, public std::enable_shared_from_this<Http1Connection<Stream>> {
public:
    enum class State {
        idle,
        request_sent,
        request_body_sent,
        response_headers_received,
        response_body_streaming,
        closed
    };

    /// 请求体使用的分帧方式
    enum class BodyFraming {
        none,
        content_length,
        chunked
    };

    /**
     * @param stream 已经建立好的流 (TLS 流已经完成握手)。
     * @param via_forward_proxy 为 true 时请求行使用 absolute-form target。
     */
    Http1Connection(std::shared_ptr<Stream> stream, std::string pool_key, const TimeoutConfig& timeouts,
                    bool via_forward_proxy = false);

    ~Http1Connection() override;

    Http1Connection(const Http1Connection&) = delete;
    Http1Connection& operator=(const Http1Connection&) = delete;

    boost::asio::awaitable<Response> send(const Request& request) override;
    [[nodiscard]] bool is_reusable() const override;
    boost::asio::awaitable<void> close() override;
    void abort() noexcept override;

    [[nodiscard]] const std::string& id() const override { return id_; }
    [[nodiscard]] const std::string& get_pool_key() const override { return pool_key_; }
    [[nodiscard]] HttpVersion version() const override { return HttpVersion::http_1_1; }
    [[nodiscard]] std::size_t get_active_streams() const override;
    [[nodiscard]] std::size_t get_max_concurrent_streams() const override { return 1; }
    void update_last_used_time() override;
    [[nodiscard]] std::chrono::steady_clock::time_point get_last_used_time() const override { return last_used_timestamp_; }

    [[nodiscard]] State state() const { return state_; }

    /// 最近一次请求体使用的分帧方式
    [[nodiscard]] BodyFraming request_framing() const { return request_framing_; }

    /**
     * @brief 读取响应体的下一个分块，读到结尾时返回 std::nullopt 并结束本次交换。
     * 只由这条连接自己创建的响应体流调用。
     */
    boost::asio::awaitable<std::optional<std::string>> read_body_chunk();

    /**
     * @brief 调用者在响应体读完之前放弃了交换，连接的中间状态不可信，直接关闭。
     */
    void abandon_exchange() noexcept;

private:
    boost::asio::awaitable<void> write_request(const Request& request);
    boost::asio::awaitable<void> read_response_header(http::verb method);
    void finish_exchange();

    /// 关闭连接，并把底层错误翻译成 courier_error 抛出
    [[noreturn]] void fail(const boost::system::error_code& ec, bool writing, const char* what);

    std::string request_target(const Request& request) const;

    std::shared_ptr<Stream> stream_;
    boost::beast::flat_buffer buffer_; // 可重用的缓冲区
    std::optional<http::response_parser<http::string_body>> parser_;
    std::string id_;
    std::string pool_key_;
    TimeoutConfig timeouts_;
    bool via_forward_proxy_;
    State state_ = State::idle;
    BodyFraming request_framing_ = BodyFraming::none;
    bool keep_alive_ = true;
    std::chrono::steady_clock::time_point last_used_timestamp_;
};

using PlainHttp1Connection = Http1Connection<PlainStream>;
using TlsHttp1Connection = Http1Connection<TlsStream>;

} // namespace courier

#endif //COURIER_HTTP1_CONNECTION_HPP
