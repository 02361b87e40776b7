//
// Created by ubuntu on 2025/11/7.
//

#include <courier/core/client/http1_connection.hpp>
#include <courier/error/courier_error.hpp>
#include <courier/utils/process_info.hpp>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/error.hpp>
#include <limits>
#include <type_traits>
#include <spdlog/spdlog.h>

namespace courier {

namespace {

/**
 * @brief HTTP/1.1 响应体流，从连接上按需读取。
 * 读到结尾之前被关闭或析构，意味着交换被放弃，连接随之关闭。
 */
template <typename Stream>
class Http1BodyStream final : public IBodyStream {
public:
    explicit Http1BodyStream(std::shared_ptr<Http1Connection<Stream>> conn) : conn_(std::move(conn)) {}

    ~Http1BodyStream() override {
        if (!complete_) {
            conn_->abandon_exchange();
        }
    }

    boost::asio::awaitable<std::optional<std::string>> next() override {
        if (complete_) {
            co_return std::nullopt;
        }
        std::optional<std::string> chunk = co_await conn_->read_body_chunk();
        if (!chunk) {
            complete_ = true;
        }
        co_return chunk;
    }

    boost::asio::awaitable<void> close() override {
        if (!complete_) {
            complete_ = true;
            conn_->abandon_exchange();
        }
        co_return;
    }

    [[nodiscard]] bool is_complete() const override { return complete_; }

private:
    std::shared_ptr<Http1Connection<Stream>> conn_;
    bool complete_ = false;
};

// Beast 的报文解析错误 (分帧冲突、非法 chunk size 等)，对端中途断开不算在内
bool is_parse_error(const boost::system::error_code& ec) {
    return ec.category() == http::make_error_code(http::error::bad_chunk).category() &&
           ec != http::error::end_of_stream &&
           ec != http::error::partial_message;
}

} // namespace

template <typename Stream>
Http1Connection<Stream>::Http1Connection(std::shared_ptr<Stream> stream, std::string pool_key,
                                         const TimeoutConfig& timeouts, const bool via_forward_proxy)
    : stream_(std::move(stream)),
      id_(ProcessInfo::next_connection_id(std::is_same_v<Stream, TlsStream> ? "h1s" : "h1")),
      pool_key_(std::move(pool_key)),
      timeouts_(timeouts),
      via_forward_proxy_(via_forward_proxy),
      last_used_timestamp_(std::chrono::steady_clock::now()) {
    SPDLOG_DEBUG("Http1Connection [{}] for pool [{}] created.", id_, pool_key_);
}

template <typename Stream>
Http1Connection<Stream>::~Http1Connection() {
    abort();
    SPDLOG_DEBUG("Http1Connection [{}] destroyed.", id_);
}

/**
 * @brief 在此连接上执行一次交换，响应头到达后返回。
 *
 * 响应体为空 (HEAD、204、304、Content-Length: 0) 时交换立即结束；
 * 否则响应体留在连接上，由返回的 Response 流式读取。
 */
template <typename Stream>
boost::asio::awaitable<Response> Http1Connection<Stream>::send(const Request& request) {
    if (state_ == State::closed) {
        throw boost::system::system_error(courier_error::network::connection_lost,
                                          "Http1Connection [" + id_ + "] is closed");
    }
    if (state_ != State::idle) {
        throw boost::system::system_error(courier_error::protocol::connection_busy,
                                          "Http1Connection [" + id_ + "] already has an exchange in flight");
    }

    update_last_used_time();

    co_await write_request(request);
    SPDLOG_DEBUG("Http1Connection [{}] request sent: {} {}", id_, std::string(http::to_string(request.method())), request.target());

    co_await read_response_header(request.method());

    auto& msg = parser_->get();
    const unsigned status = msg.result_int();
    std::string reason(msg.reason());
    Headers headers = static_cast<const Headers&>(msg);
    SPDLOG_DEBUG("Http1Connection [{}] response received with status {}.", id_, status);

    std::unique_ptr<IBodyStream> body;
    if (parser_->is_done()) {
        std::string data = std::move(msg.body());
        finish_exchange();
        body = std::make_unique<BufferedBodyStream>(std::move(data));
    } else {
        state_ = State::response_body_streaming;
        body = std::make_unique<Http1BodyStream<Stream>>(this->shared_from_this());
    }
    co_return Response(status, std::move(reason), HttpVersion::http_1_1, std::move(headers), std::move(body));
}

template <typename Stream>
boost::asio::awaitable<void> Http1Connection<Stream>::write_request(const Request& request) {
    Headers fields = request.headers();
    if (fields.find(http::field::host) == fields.end()) {
        fields.set(http::field::host, request.origin().authority());
    }
    const std::string target = request_target(request);
    const RequestBody& body = request.body();
    auto& lowest = boost::beast::get_lowest_layer(*stream_);
    boost::system::error_code ec;

    // 1. 长度已知：Content-Length 分帧，头部和请求体一次写出
    if (!body.is_streaming()) {
        http::request<http::string_body> req{request.method(), target, 11};
        for (const auto& field : fields) {
            req.insert(field.name_string(), field.value());
        }
        req.body() = body.data();
        // prepare_payload 会按请求体改写 Content-Length / Transfer-Encoding
        req.prepare_payload();
        request_framing_ = body.empty() ? BodyFraming::none : BodyFraming::content_length;

        lowest.expires_after(timeouts_.write);
        co_await http::async_write(*stream_, req, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        lowest.expires_never();
        if (ec) {
            fail(ec, true, "writing request");
        }
        state_ = State::request_body_sent;
        co_return;
    }

    // 2. 长度未知：chunked 分帧，先写头部，再逐块写请求体
    http::request<http::empty_body> req{request.method(), target, 11};
    for (const auto& field : fields) {
        req.insert(field.name_string(), field.value());
    }
    req.erase(http::field::content_length);
    req.chunked(true);
    request_framing_ = BodyFraming::chunked;

    http::request_serializer<http::empty_body> serializer{req};
    lowest.expires_after(timeouts_.write);
    co_await http::async_write_header(*stream_, serializer, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec) {
        fail(ec, true, "writing request header");
    }
    state_ = State::request_sent;

    while (true) {
        std::optional<std::string> chunk;
        try {
            chunk = body.next_chunk();
        } catch (const std::exception& e) {
            // 请求体写到一半，连接状态已经不可信
            SPDLOG_WARN("Http1Connection [{}] request body producer failed: {}", id_, e.what());
            abort();
            throw;
        }
        if (!chunk) {
            break;
        }
        lowest.expires_after(timeouts_.write);
        co_await boost::asio::async_write(*stream_, http::make_chunk(boost::asio::buffer(*chunk)),
                                          boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec) {
            fail(ec, true, "writing request body chunk");
        }
    }

    lowest.expires_after(timeouts_.write);
    co_await boost::asio::async_write(*stream_, http::make_chunk_last(), boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    lowest.expires_never();
    if (ec) {
        fail(ec, true, "writing last chunk");
    }
    state_ = State::request_body_sent;
}

template <typename Stream>
boost::asio::awaitable<void> Http1Connection<Stream>::read_response_header(const http::verb method) {
    auto& lowest = boost::beast::get_lowest_layer(*stream_);
    boost::system::error_code ec;

    while (true) {
        parser_.emplace();
        // 响应体按块交给调用者，不在这里限制总大小
        parser_->body_limit((std::numeric_limits<std::uint64_t>::max)());
        parser_->header_limit(64 * 1024);
        // HEAD 的响应带着 Content-Length 但没有响应体
        if (method == http::verb::head) {
            parser_->skip(true);
        }

        lowest.expires_after(timeouts_.read);
        co_await http::async_read_header(*stream_, buffer_, *parser_, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        lowest.expires_never();
        if (ec) {
            fail(ec, false, "reading response header");
        }

        // 1xx 中间响应 (100 Continue 等) 直接跳过，101 交给调用者
        if (const unsigned status = parser_->get().result_int(); status >= 100 && status < 200 && status != 101) {
            SPDLOG_DEBUG("Http1Connection [{}] skipped interim response {}", id_, status);
            continue;
        }
        break;
    }
    state_ = State::response_headers_received;
}

template <typename Stream>
boost::asio::awaitable<std::optional<std::string>> Http1Connection<Stream>::read_body_chunk() {
    if (state_ == State::closed) {
        throw boost::system::system_error(courier_error::network::connection_lost,
                                          "Http1Connection [" + id_ + "] closed while streaming the response body");
    }
    if (state_ != State::response_body_streaming || !parser_) {
        co_return std::nullopt;
    }

    auto& lowest = boost::beast::get_lowest_layer(*stream_);
    while (!parser_->is_done()) {
        boost::system::error_code ec;
        lowest.expires_after(timeouts_.read);
        co_await http::async_read_some(*stream_, buffer_, *parser_, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        lowest.expires_never();
        if (ec) {
            fail(ec, false, "reading response body");
        }

        // string_body 的 reader 总是追加到 body 的末尾，取走已解码的部分后清空即可
        if (std::string& body = parser_->get().body(); !body.empty()) {
            std::string chunk = std::move(body);
            body.clear();
            update_last_used_time();
            co_return chunk;
        }
    }

    std::string rest = std::move(parser_->get().body());
    finish_exchange();
    if (!rest.empty()) {
        co_return rest;
    }
    co_return std::nullopt;
}

template <typename Stream>
void Http1Connection<Stream>::finish_exchange() {
    // 响应声明了 Connection: close，或者响应体以 EOF 结尾，都不能复用
    keep_alive_ = keep_alive_ && parser_->keep_alive();

    // 响应之后还有多余的数据，连接状态不可信
    if (buffer_.size() > 0) {
        SPDLOG_WARN("Http1Connection [{}] has {} trailing bytes after the response. Marking closed.", id_, buffer_.size());
        keep_alive_ = false;
    }
    parser_.reset();
    update_last_used_time();

    if (keep_alive_) {
        state_ = State::idle;
        return;
    }
    SPDLOG_DEBUG("Http1Connection [{}] will not be reused, closing.", id_);
    abort();
}

template <typename Stream>
void Http1Connection<Stream>::abandon_exchange() noexcept {
    if (state_ == State::idle || state_ == State::closed) {
        return;
    }
    SPDLOG_DEBUG("Http1Connection [{}] exchange abandoned mid-flight, closing.", id_);
    abort();
}

template <typename Stream>
void Http1Connection<Stream>::fail(const boost::system::error_code& ec, const bool writing, const char* what) {
    abort();
    const std::string message = "Http1Connection [" + id_ + "] " + what + " failed: " + ec.message();
    SPDLOG_WARN("{}", message);

    if (ec == boost::beast::error::timeout) {
        throw boost::system::system_error(writing ? courier_error::network::write_timeout : courier_error::network::read_timeout, message);
    }
    if (is_parse_error(ec)) {
        throw boost::system::system_error(courier_error::protocol::protocol_error, message);
    }
    throw boost::system::system_error(courier_error::network::connection_lost, message);
}

template <typename Stream>
std::string Http1Connection<Stream>::request_target(const Request& request) const {
    if (!via_forward_proxy_) {
        return request.target();
    }
    // 经由正向代理时使用 absolute-form
    return request.origin().scheme() + "://" + request.origin().authority() + request.target();
}

template <typename Stream>
bool Http1Connection<Stream>::is_reusable() const {
    return state_ == State::idle && keep_alive_ && stream_ &&
           boost::beast::get_lowest_layer(*stream_).socket().is_open();
}

template <typename Stream>
std::size_t Http1Connection<Stream>::get_active_streams() const {
    return state_ == State::idle || state_ == State::closed ? 0 : 1;
}

template <typename Stream>
void Http1Connection<Stream>::update_last_used_time() {
    last_used_timestamp_ = std::chrono::steady_clock::now();
}

/**
 * @brief 异步地、主动地关闭此连接。TLS 连接会先尽力发送 close_notify。
 */
template <typename Stream>
boost::asio::awaitable<void> Http1Connection<Stream>::close() {
    co_await boost::asio::dispatch(stream_->get_executor(), boost::asio::use_awaitable);

    // 立即将连接在逻辑上标记为不可用。
    keep_alive_ = false;
    auto& lowest = boost::beast::get_lowest_layer(*stream_);

    if constexpr (std::is_same_v<Stream, TlsStream>) {
        if (state_ != State::closed && lowest.socket().is_open()) {
            boost::system::error_code ec;
            lowest.expires_after(timeouts_.write);
            co_await stream_->async_shutdown(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            // 对端经常不回 close_notify 直接断开，这里的错误只记录
            if (ec) {
                SPDLOG_DEBUG("Http1Connection [{}] TLS shutdown: {}", id_, ec.message());
            }
        }
    }
    abort();
}

template <typename Stream>
void Http1Connection<Stream>::abort() noexcept {
    state_ = State::closed;
    keep_alive_ = false;
    if (!stream_) {
        return;
    }
    auto& socket = boost::beast::get_lowest_layer(*stream_).socket();
    if (socket.is_open()) {
        boost::system::error_code ec;
        socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        socket.close(ec);
    }
}

template class Http1Connection<PlainStream>;
template class Http1Connection<TlsStream>;

} // namespace courier
