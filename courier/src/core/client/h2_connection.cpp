//
// Created by ubuntu on 2025/11/8.
//

#include <courier/core/client/h2_connection.hpp>
#include <courier/error/courier_error.hpp>
#include <courier/utils/finally.hpp>
#include <courier/utils/process_info.hpp>

#include <algorithm>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <charconv>
#include <cstring>
#include <ranges>
#include <type_traits>
#include <spdlog/spdlog.h>

namespace asio = boost::asio;
// 引入 asio 协程操作符，如 || (race)
using namespace boost::asio::experimental::awaitable_operators;

namespace courier {

// 内部常量
namespace {
    // 使用 string_view literal (sv) 来避免构造 string
    using namespace std::literals::string_view_literals;

    constexpr auto H2_METHOD_SV = ":method"sv;
    constexpr auto H2_SCHEME_SV = ":scheme"sv;
    constexpr auto H2_AUTHORITY_SV = ":authority"sv;
    constexpr auto H2_PATH_SV = ":path"sv;

    // HTTP/2 禁止的连接级头部
    bool is_connection_specific(const http::field name) {
        return name == http::field::host || name == http::field::connection ||
               name == http::field::upgrade || name == http::field::proxy_connection ||
               name == http::field::transfer_encoding || name == http::field::keep_alive ||
               name == http::field::te;
    }
}

template <typename Stream>
Http2Connection<Stream>::Http2Connection(std::shared_ptr<Stream> stream, std::string pool_key, const TimeoutConfig& timeouts,
                                         const std::size_t max_concurrent_streams)
    : stream_(std::move(stream)),
      pool_key_(std::move(pool_key)),
      id_(ProcessInfo::next_connection_id(std::is_same_v<Stream, TlsStream> ? "h2" : "h2c")),
      timeouts_(timeouts),
      configured_max_streams_(max_concurrent_streams),
      // 初始化 Actor 的邮箱，设置一个缓冲区大小
      actor_channel_(stream_->get_executor(), 256),
      // 初始化握手信号 channel，缓冲区为1即可
      handshake_signal_(stream_->get_executor(), 1),
      // 所有异步对象都使用同一个 executor，确保它们在同一个上下文中执行
      flow_timer_(stream_->get_executor()),
      write_timer_(stream_->get_executor()),
      max_concurrent_streams_(max_concurrent_streams),
      last_used_timestamp_(std::chrono::steady_clock::now()) {
    SPDLOG_DEBUG("Create a connection [{}]-[{}]", id_, pool_key_);
}

template <typename Stream>
Http2Connection<Stream>::~Http2Connection() {
    // 确保 nghttp2 会话资源被释放
    if (session_) {
        nghttp2_session_del(session_);
        session_ = nullptr;
    }
    SPDLOG_DEBUG("销毁连接 [{}]-[{}]", id_, pool_key_);
}

/**
 * @brief 启动读协程和 Actor 协程，并等待握手完成
 */
template <typename Stream>
asio::awaitable<void> Http2Connection<Stream>::run() {
    auto ex = stream_->get_executor();
    auto self = this->shared_from_this();

    // Actor 独立运行，直到连接关闭或出错。捕获 self 保证协程运行期间对象存活
    asio::co_spawn(
        ex,
        [self]() -> asio::awaitable<void> {
            try {
                co_await self->actor_loop();
            } catch (const std::exception& e) {
                SPDLOG_WARN("H2 连接 [{}] 的主循环因异常退出: {}", self->id_, e.what());
                self->is_closing_ = true;
                self->terminate_all(courier_error::network::connection_lost, e.what());
                self->abort();
                self->actor_channel_.close();
                self->handshake_signal_.close();
            }
        },
        asio::detached);

    asio::co_spawn(
        ex,
        [self]() -> asio::awaitable<void> {
            co_await self->reader_loop();
        },
        asio::detached);

    // 握手要在连接超时内完成，否则整个连接作废
    asio::steady_timer timer(ex);
    timer.expires_after(timeouts_.connect);
    auto result = co_await (
        handshake_signal_.async_receive(asio::as_tuple(asio::use_awaitable)) ||
        timer.async_wait(asio::as_tuple(asio::use_awaitable))
    );

    if (!handshake_completed_) {
        abort();
        if (result.index() == 1) {
            throw boost::system::system_error(courier_error::network::connect_timeout,
                                              "HTTP/2 handshake with [" + pool_key_ + "] timed out");
        }
        throw boost::system::system_error(courier_error::network::connect_failed,
                                          "HTTP/2 handshake with [" + pool_key_ + "] failed: " + terminal_message_);
    }
    SPDLOG_DEBUG("{}: 握手已完成, max_concurrent_streams = {}", pool_key_, max_concurrent_streams_.load());
}

/**
 * @brief 外部接口：在一个新的流上发送请求并等待完整响应
 */
template <typename Stream>
asio::awaitable<Response> Http2Connection<Stream>::send(const Request& request) {
    update_last_used_time();
    auto h2_stream = co_await open_stream(request);
    Response response = co_await await_response(std::move(h2_stream));
    update_last_used_time();
    co_return response;
}

template <typename Stream>
asio::awaitable<std::shared_ptr<H2Stream>> Http2Connection<Stream>::open_stream(const Request& request) {
    // 如果连接已关闭或收到服务器的 GOAWAY，则拒绝新请求
    if (remote_goaway_received_) {
        throw boost::system::system_error(courier_error::protocol::goaway_received,
                                          "H2 connection [" + id_ + "] received GOAWAY, rejecting new streams");
    }
    if (is_closing_ || !handshake_completed_) {
        throw boost::system::system_error(courier_error::network::connection_lost,
                                          "H2 connection [" + id_ + "] is not usable");
    }

    // 先占用名额，超过并发上限立即失败，已有的流不受影响
    const std::size_t limit = max_concurrent_streams_.load();
    if (reserved_streams_.fetch_add(1) >= limit) {
        --reserved_streams_;
        throw boost::system::system_error(courier_error::protocol::too_many_streams,
                                          "H2 connection [" + id_ + "] reached max concurrent streams (" +
                                          std::to_string(limit) + ")");
    }

    auto h2_stream = std::make_shared<H2Stream>(stream_->get_executor(), request);

    // 异步地将消息发送到 actor_loop 的邮箱
    auto [send_ec] = co_await actor_channel_.async_send(boost::system::error_code{}, H2ActorMessage{H2OpenMessage{h2_stream}},
                                                        asio::as_tuple(asio::use_awaitable));
    if (send_ec) {
        --reserved_streams_;
        throw boost::system::system_error(courier_error::network::connection_lost,
                                          "H2 connection [" + id_ + "] is closed: " + send_ec.message());
    }

    // 提前离开时：还没提交的让 Actor 丢弃，已经提交的发送 RST_STREAM(CANCEL)
    auto guard = make_finally([self = this->shared_from_this(), h2_stream]() noexcept {
        if (!h2_stream->open_settled) {
            h2_stream->abandoned = true;
        } else if (!h2_stream->open_error) {
            self->actor_channel_.try_send(boost::system::error_code{},
                                          H2ActorMessage{H2CancelMessage{h2_stream->id, asio::error::operation_aborted}});
        }
    });

    // 等待 Actor 分配流 ID。Actor 卡住时不能无限等下去
    asio::steady_timer timer(stream_->get_executor());
    timer.expires_after(timeouts_.read);
    co_await (
        h2_stream->opened.async_receive(asio::as_tuple(asio::use_awaitable)) ||
        timer.async_wait(asio::as_tuple(asio::use_awaitable))
    );

    if (!h2_stream->open_settled) {
        // 消息还在邮箱里，Actor 取到时直接丢弃并归还名额
        if ((co_await asio::this_coro::cancellation_state).cancelled() != asio::cancellation_type::none) {
            throw boost::system::system_error(asio::error::operation_aborted, "H2 connection [" + id_ + "] open cancelled");
        }
        throw boost::system::system_error(courier_error::network::read_timeout,
                                          "H2 connection [" + id_ + "] did not open a stream within " +
                                          std::to_string(timeouts_.read.count()) + "ms");
    }
    if (h2_stream->open_error) {
        throw boost::system::system_error(h2_stream->open_error,
                                          "H2 connection [" + id_ + "] failed to open stream: " + h2_stream->error_message);
    }
    guard.disarm();
    co_return h2_stream;
}

template <typename Stream>
asio::awaitable<Response> Http2Connection<Stream>::await_response(std::shared_ptr<H2Stream> h2_stream) {
    // 调用者中途放弃 (异常、协程被销毁) 时取消这个流，连接继续服务其他流
    auto guard = make_finally([self = this->shared_from_this(), h2_stream]() noexcept {
        if (h2_stream->state != H2Stream::State::closed) {
            self->actor_channel_.try_send(boost::system::error_code{},
                                          H2ActorMessage{H2CancelMessage{h2_stream->id, asio::error::operation_aborted}});
        }
    });

    asio::steady_timer timer(stream_->get_executor());
    while (true) {
        // 读超时从流的最近一次活动算起；发送窗口耗尽期间由流控超时负责
        const auto now = std::chrono::steady_clock::now();
        timer.expires_at(h2_stream->blocked_since ? now + timeouts_.read : h2_stream->last_activity + timeouts_.read);

        auto result = co_await (
            h2_stream->response.async_receive(asio::as_tuple(asio::use_awaitable)) ||
            timer.async_wait(asio::as_tuple(asio::use_awaitable))
        );

        // 结果以流上记录的为准，不管赛跑谁赢
        if (h2_stream->finished) {
            guard.disarm();
            if (h2_stream->outcome_error) {
                if (h2_stream->body_error) {
                    std::rethrow_exception(h2_stream->body_error);
                }
                SPDLOG_DEBUG("H2 [{}] stream {} failed: {}", id_, h2_stream->id, h2_stream->outcome_error.message());
                throw boost::system::system_error(h2_stream->outcome_error, h2_stream->error_message);
            }
            SPDLOG_DEBUG("[{}] stream {} 收到响应，状态码 {}, 当前活动的stream = {}", id_, h2_stream->id,
                         h2_stream->outcome.status(), reserved_streams_.load());
            co_return std::move(h2_stream->outcome);
        }

        // 调用者放弃：guard 负责发送 RST_STREAM(CANCEL)
        if ((co_await asio::this_coro::cancellation_state).cancelled() != asio::cancellation_type::none) {
            throw boost::system::system_error(asio::error::operation_aborted,
                                              "H2 stream " + std::to_string(h2_stream->id) + " on [" + id_ + "] was abandoned");
        }
        if (result.index() == 0) {
            auto [ec] = std::get<0>(result);
            throw boost::system::system_error(ec ? ec : courier_error::network::connection_lost,
                                              "H2 stream " + std::to_string(h2_stream->id) + " on [" + id_ + "] lost its response");
        }

        if (h2_stream->blocked_since ||
            std::chrono::steady_clock::now() < h2_stream->last_activity + timeouts_.read) {
            continue;
        }

        guard.disarm();
        SPDLOG_WARN("H2 [{}] stream {} read timed out after {}ms", id_, h2_stream->id, timeouts_.read.count());
        actor_channel_.try_send(boost::system::error_code{},
                                H2ActorMessage{H2CancelMessage{h2_stream->id, courier_error::network::read_timeout}});
        throw boost::system::system_error(courier_error::network::read_timeout,
                                          "H2 stream " + std::to_string(h2_stream->id) + " on [" + id_ +
                                          "] received nothing for " + std::to_string(timeouts_.read.count()) + "ms");
    }
}

template <typename Stream>
bool Http2Connection<Stream>::is_reusable() const {
    // 综合多个条件判断连接是否健康可用
    if (is_closing_ || remote_goaway_received_ || !handshake_completed_ || !stream_) return false;
    return boost::beast::get_lowest_layer(*stream_).socket().is_open();
}

/**
 * @brief 优雅地关闭连接：由 Actor 发送 GOAWAY 后关闭套接字
 */
template <typename Stream>
asio::awaitable<void> Http2Connection<Stream>::close() {
    if (is_closing_.exchange(true)) {
        abort();
        co_return;
    }
    SPDLOG_DEBUG("Http2Connection [{}]-[{}] 发送关闭消息给 Actor.", id_, pool_key_);
    // channel 已满或已关闭时 Actor 无法及时处理，直接关闭套接字
    if (!actor_channel_.try_send(boost::system::error_code{}, H2ActorMessage{H2CloseMessage{}})) {
        abort();
    }
    co_return;
}

template <typename Stream>
void Http2Connection<Stream>::abort() noexcept {
    is_closing_ = true;
    if (!stream_) {
        return;
    }
    auto& socket = boost::beast::get_lowest_layer(*stream_).socket();
    if (socket.is_open()) {
        boost::system::error_code ec;
        socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket.close(ec);
    }
}

template <typename Stream>
void Http2Connection<Stream>::update_last_used_time() {
    last_used_timestamp_.store(std::chrono::steady_clock::now());
}

/**
 * @brief 读协程：把网络数据原样投递给 Actor，读出错时投递错误后退出
 */
template <typename Stream>
asio::awaitable<void> Http2Connection<Stream>::reader_loop() {
    while (true) {
        auto [ec, n] = co_await stream_->async_read_some(asio::buffer(read_buffer_), asio::as_tuple(asio::use_awaitable));
        H2ReadMessage msg{ec, ec ? std::string{} : std::string(read_buffer_.data(), n)};

        // co_await 提供了天然的背压：Actor 处理不过来时读协程在这里暂停
        auto [send_ec] = co_await actor_channel_.async_send(boost::system::error_code{}, H2ActorMessage{std::move(msg)},
                                                            asio::as_tuple(asio::use_awaitable));
        if (ec || send_ec) {
            SPDLOG_TRACE("[{}]-[{}] 读协程退出: {}", id_, pool_key_, ec ? ec.message() : send_ec.message());
            co_return;
        }
    }
}

/**
 * @brief [Actor] 执行所有待发送数据的写操作。
 */
template <typename Stream>
asio::awaitable<void> Http2Connection<Stream>::do_write() {
    // 只要 nghttp2 引擎有数据待发送，就循环写入。
    while (session_ && nghttp2_session_want_write(session_)) {
        const uint8_t* data = nullptr;
        // 从 nghttp2 获取待发送数据块的指针和长度（零拷贝）。
        const ssize_t len = nghttp2_session_mem_send(session_, &data);
        if (len < 0) {
            fail_connection(courier_error::protocol::protocol_error,
                            std::string("nghttp2_session_mem_send failed: ") + nghttp2_strerror(static_cast<int>(len)));
            co_return;
        }
        if (len == 0) break;

        // 看门狗：写超时直接关闭套接字，让挂起的写操作以错误返回
        write_timer_.expires_after(timeouts_.write);
        write_timer_.async_wait([weak = this->weak_from_this()](const boost::system::error_code& ec) {
            if (ec) return;
            if (auto self = weak.lock()) {
                self->write_timed_out_ = true;
                self->abort();
            }
        });

        auto [ec, _] = co_await asio::async_write(*stream_, asio::buffer(data, static_cast<std::size_t>(len)),
                                                  asio::as_tuple(asio::use_awaitable));
        write_timer_.cancel();
        if (ec) {
            if (write_timed_out_) {
                fail_connection(courier_error::network::write_timeout, "H2 write timed out");
            } else {
                fail_connection(courier_error::network::connection_lost, "H2 write failed: " + ec.message());
            }
            co_return;
        }
    }
}

template <typename Stream>
void Http2Connection<Stream>::init_session() {
    nghttp2_session_callbacks* callbacks;
    nghttp2_session_callbacks_new(&callbacks);
    auto cb_guard = make_finally([&]() noexcept { nghttp2_session_callbacks_del(callbacks); }); // 使用 RAII guard 确保 callbacks 结构被释放
    // 设置所有必要的 nghttp2 回调函数
    nghttp2_session_callbacks_set_on_header_callback(callbacks, &on_header_callback);
    nghttp2_session_callbacks_set_on_data_chunk_recv_callback(callbacks, &on_data_chunk_recv_callback);
    nghttp2_session_callbacks_set_on_stream_close_callback(callbacks, &on_stream_close_callback);
    nghttp2_session_callbacks_set_on_frame_recv_callback(callbacks, &on_frame_recv_callback);
    nghttp2_session_callbacks_set_on_frame_send_callback(callbacks, &on_frame_send_callback);
    if (const int rv = nghttp2_session_client_new(&session_, callbacks, this); rv != 0) {
        throw std::runtime_error(std::string("nghttp2_session_client_new failed: ") + nghttp2_strerror(rv));
    }

    // 准备并提交客户端的 SETTINGS 帧，连接前言由 nghttp2 在第一次 mem_send 时带上
    const nghttp2_settings_entry iv[] = {
        {NGHTTP2_SETTINGS_MAX_CONCURRENT_STREAMS, static_cast<uint32_t>(configured_max_streams_)},
        {NGHTTP2_SETTINGS_INITIAL_WINDOW_SIZE, 65535},
        {NGHTTP2_SETTINGS_ENABLE_PUSH, 0}
    };
    nghttp2_submit_settings(session_, NGHTTP2_FLAG_NONE, iv, std::size(iv));
}

/**
 * @brief [Actor] 核心 Actor 协程，管理此连接的整个生命周期。
 *
 * 所有对 nghttp2 会话和 streams_ 的访问都在这个协程中串行执行，
 * 不需要 strand 或 mutex。每轮循环处理一条消息 (或一次流控超时)，然后统一写出。
 */
template <typename Stream>
asio::awaitable<void> Http2Connection<Stream>::actor_loop() {
    // 无论以何种方式退出，握手信号都会被关闭，run() 不会永久阻塞
    auto guard = make_finally([this]() noexcept { handshake_signal_.close(); });

    SPDLOG_DEBUG("[{}]-[{}]: 开始握手", id_, pool_key_);
    init_session();
    // 立即发送连接前言 (Magic string) 和 SETTINGS 帧
    co_await do_write();

    while (!terminal_error_) {
        // 邮箱是唯一的等待点，流控到期也以消息的形式到达，消息不会在赛跑中丢失
        auto [ec, msg_variant] = co_await actor_channel_.async_receive(asio::as_tuple(asio::use_awaitable));
        if (ec) {
            fail_connection(courier_error::network::connection_lost, "actor channel closed: " + ec.message());
            break;
        }

        // 使用 std::visit 处理 variant 消息
        std::visit([&]<typename T0>(T0&& msg) {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, H2OpenMessage>) {
                handle_open(msg.stream);
            } else if constexpr (std::is_same_v<T, H2CancelMessage>) {
                handle_cancel(msg.stream_id, msg.reason);
            } else if constexpr (std::is_same_v<T, H2ReadMessage>) {
                handle_read(msg);
            } else if constexpr (std::is_same_v<T, H2CloseMessage>) {
                is_closing_ = true;
                if (session_ && !remote_goaway_received_) {
                    nghttp2_submit_goaway(session_, NGHTTP2_FLAG_NONE, nghttp2_session_get_last_proc_stream_id(session_),
                                          NGHTTP2_NO_ERROR, nullptr, 0);
                }
                terminal_error_ = courier_error::network::connection_lost;
                terminal_message_ = "H2 connection [" + id_ + "] closed locally";
            } else if constexpr (std::is_same_v<T, H2FlowCheckMessage>) {
                // 定时器已经触发，下面需要重新设置
                flow_deadline_ = std::chrono::steady_clock::time_point::max();
            }
        }, msg_variant);

        // 邮箱很忙时 H2FlowCheckMessage 可能投递失败，所以每轮都检查一次
        expire_blocked_streams();

        // 处理完消息后，nghttp2 可能需要发送 HEADERS / DATA / ACK / RST_STREAM，统一写出。
        // 致命错误之前排队的 GOAWAY 也在这里尽力发出
        co_await do_write();
        update_flow_control_state();
        arm_flow_timer();

        // 检查是否已收到远程的 SETTINGS，以此作为握手成功的标志
        if (!handshake_completed_ && remote_settings_received_) {
            handshake_completed_ = true;
            SPDLOG_TRACE("[{}]-[{}] 握手完成.", id_, pool_key_);
            handshake_signal_.close();
        }
    }

    // --- 最终清理 ---
    SPDLOG_DEBUG("[{}]-[{}] actor_loop 结束: {} ({}), active_streams = {}", id_, pool_key_,
                 terminal_error_.message(), terminal_message_, reserved_streams_.load());
    is_closing_ = true;
    flow_timer_.cancel();
    terminate_all(terminal_error_ ? terminal_error_ : courier_error::network::connection_lost, terminal_message_);
    abort();
    actor_channel_.close();
}

template <typename Stream>
void Http2Connection<Stream>::handle_open(const std::shared_ptr<H2Stream>& h2_stream) {
    if (h2_stream->abandoned) {
        --reserved_streams_;
        return;
    }
    if (is_closing_ || remote_goaway_received_ || terminal_error_) {
        --reserved_streams_;
        h2_stream->error_message = "H2 connection [" + id_ + "] is closing";
        h2_stream->settle_open(remote_goaway_received_ ? courier_error::protocol::goaway_received
                                                       : courier_error::network::connection_lost);
        return;
    }

    update_last_used_time();

    std::vector<nghttp2_nv> nva;
    prepare_headers(nva, *h2_stream);

    const RequestBody& body = h2_stream->request.body();
    h2_stream->has_body = body.is_streaming() || !body.empty();

    nghttp2_data_provider provider{};
    provider.source.ptr = h2_stream.get();
    provider.read_callback = &read_request_body_callback;

    const int32_t stream_id = nghttp2_submit_request(session_, nullptr, nva.data(), nva.size(),
                                                     h2_stream->has_body ? &provider : nullptr, h2_stream.get());
    if (stream_id < 0) {
        SPDLOG_ERROR("[{}]-[{}] 提交请求失败: {}", id_, pool_key_, nghttp2_strerror(stream_id));
        --reserved_streams_;
        h2_stream->error_message = std::string("nghttp2_submit_request failed: ") + nghttp2_strerror(stream_id);
        h2_stream->settle_open(courier_error::protocol::protocol_error);
        return;
    }

    h2_stream->id = stream_id;
    h2_stream->state = H2Stream::State::open;
    h2_stream->last_activity = std::chrono::steady_clock::now();
    streams_.emplace(stream_id, h2_stream);
    h2_stream->settle_open(boost::system::error_code{});
    SPDLOG_DEBUG("[{}]-[{}] 成功提交请求: stream_id = {}, target = {}，当前活跃streams数量 = {}", id_, pool_key_, stream_id,
                 h2_stream->request.target(), reserved_streams_.load());
}

template <typename Stream>
void Http2Connection<Stream>::handle_cancel(const int32_t stream_id, const boost::system::error_code& reason) {
    const auto it = streams_.find(stream_id);
    if (it == streams_.end() || it->second->state == H2Stream::State::closed) {
        return;
    }
    SPDLOG_DEBUG("[{}] cancelling stream {}: {}", id_, stream_id, reason.message());
    it->second->local_error = reason;
    it->second->error_message = "H2 stream " + std::to_string(stream_id) + " cancelled: " + reason.message();
    nghttp2_submit_rst_stream(session_, NGHTTP2_FLAG_NONE, stream_id, NGHTTP2_CANCEL);
}

template <typename Stream>
void Http2Connection<Stream>::handle_read(const H2ReadMessage& msg) {
    if (msg.ec) {
        SPDLOG_TRACE("[{}]-[{}] 网络读取失败: {}", id_, pool_key_, msg.ec.message());
        fail_connection(courier_error::network::connection_lost, "H2 connection [" + id_ + "] read failed: " + msg.ec.message());
        return;
    }

    // 将数据喂给 nghttp2
    const ssize_t rv = nghttp2_session_mem_recv(session_, reinterpret_cast<const uint8_t*>(msg.data.data()), msg.data.size());
    if (rv < 0) {
        SPDLOG_WARN("[{}]-[{}] 处理网络数据失败: {}", id_, pool_key_, nghttp2_strerror(static_cast<int>(rv)));
        fail_connection(courier_error::protocol::protocol_error,
                        "H2 connection [" + id_ + "] protocol violation: " + nghttp2_strerror(static_cast<int>(rv)));
        return;
    }

    if (remote_goaway_received_) {
        fail_connection(courier_error::protocol::goaway_received, "H2 connection [" + id_ + "] received GOAWAY");
    }
}

template <typename Stream>
void Http2Connection<Stream>::update_flow_control_state() {
    if (!session_) {
        return;
    }
    const auto now = std::chrono::steady_clock::now();
    const bool connection_blocked = nghttp2_session_get_remote_window_size(session_) <= 0;

    for (const auto& [stream_id, h2_stream] : streams_) {
        if (!h2_stream->has_body || h2_stream->body_eof || h2_stream->state != H2Stream::State::open) {
            h2_stream->blocked_since.reset();
            continue;
        }
        const bool blocked = connection_blocked || nghttp2_session_get_stream_remote_window_size(session_, stream_id) <= 0;
        if (blocked) {
            if (!h2_stream->blocked_since) {
                SPDLOG_DEBUG("[{}] stream {} is blocked by flow control", id_, stream_id);
                h2_stream->blocked_since = now;
            }
        } else if (h2_stream->blocked_since) {
            h2_stream->blocked_since.reset();
            h2_stream->last_activity = now;
        }
    }
}

template <typename Stream>
std::chrono::steady_clock::time_point Http2Connection<Stream>::next_flow_deadline() const {
    auto deadline = std::chrono::steady_clock::time_point::max();
    for (const auto& h2_stream : streams_ | std::views::values) {
        if (h2_stream->blocked_since) {
            deadline = std::min(deadline, *h2_stream->blocked_since + timeouts_.flow_control);
        }
    }
    return deadline;
}

template <typename Stream>
void Http2Connection<Stream>::expire_blocked_streams() {
    const auto now = std::chrono::steady_clock::now();
    for (const auto& [stream_id, h2_stream] : streams_) {
        if (!h2_stream->blocked_since || now < *h2_stream->blocked_since + timeouts_.flow_control) {
            continue;
        }
        SPDLOG_WARN("[{}] stream {} waited {}ms for WINDOW_UPDATE, resetting", id_, stream_id, timeouts_.flow_control.count());
        h2_stream->blocked_since.reset();
        h2_stream->local_error = courier_error::protocol::flow_control_timeout;
        h2_stream->error_message = "H2 stream " + std::to_string(stream_id) + " timed out waiting for WINDOW_UPDATE";
        nghttp2_submit_rst_stream(session_, NGHTTP2_FLAG_NONE, stream_id, NGHTTP2_CANCEL);
    }
}

template <typename Stream>
void Http2Connection<Stream>::arm_flow_timer() {
    const auto deadline = next_flow_deadline();
    if (deadline == flow_deadline_) {
        return;
    }
    flow_deadline_ = deadline;
    // 重新设置期限会以 operation_aborted 取消之前的等待
    flow_timer_.expires_at(deadline);
    if (deadline == std::chrono::steady_clock::time_point::max()) {
        return;
    }
    flow_timer_.async_wait([weak = this->weak_from_this()](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        if (const auto self = weak.lock()) {
            self->actor_channel_.try_send(boost::system::error_code{}, H2ActorMessage{H2FlowCheckMessage{}});
        }
    });
}

template <typename Stream>
void Http2Connection<Stream>::fail_connection(const boost::system::error_code& ec, const std::string& message) {
    is_closing_ = true;
    if (!terminal_error_) {
        terminal_error_ = ec;
        terminal_message_ = message;
    }
}

template <typename Stream>
void Http2Connection<Stream>::terminate_all(const boost::system::error_code& ec, const std::string& message) {
    for (const auto& h2_stream : streams_ | std::views::values) {
        if (h2_stream->state == H2Stream::State::closed) {
            continue;
        }
        h2_stream->state = H2Stream::State::closed;
        h2_stream->error_message = message;
        h2_stream->finish(ec, Response{});
        --reserved_streams_;
    }
    streams_.clear();

    // 邮箱里还没处理的 open 请求同样以连接错误结束
    while (actor_channel_.try_receive([&](boost::system::error_code, H2ActorMessage msg) {
        if (auto* open = std::get_if<H2OpenMessage>(&msg)) {
            --reserved_streams_;
            open->stream->error_message = message;
            if (open->stream->abandoned) {
                return;
            }
            open->stream->settle_open(ec);
        }
    })) {
    }
}

// --- 回调函数 & 私有辅助函数 ---

template <typename Stream>
void Http2Connection<Stream>::prepare_headers(std::vector<nghttp2_nv>& nva, H2Stream& h2_stream) const {
    const Request& req = h2_stream.request;
    const RequestBody& body = req.body();

    // --- 阶段一: 收集头部并计算总大小 ---
    const std::string method(http::to_string(req.method()));
    const auto host_it = req.headers().find(http::field::host);
    const std::string authority = host_it != req.headers().end() ? std::string(host_it->value()) : req.origin().authority();
    std::string_view path_sv = req.target();
    if (path_sv.empty()) path_sv = "/";

    std::vector<std::pair<std::string, std::string>> fields;
    for (const auto& field : req.headers()) {
        if (is_connection_specific(field.name())) {
            continue;
        }
        // 长度已知的请求体由这里重新计算 content-length
        if (!body.is_streaming() && field.name() == http::field::content_length) {
            continue;
        }
        fields.emplace_back(boost::algorithm::to_lower_copy(std::string(field.name_string())), std::string(field.value()));
    }
    if (!body.is_streaming() && !body.empty()) {
        fields.emplace_back("content-length", std::to_string(*body.content_length()));
    }

    size_t total_size = H2_METHOD_SV.length() + method.length() +
                        H2_SCHEME_SV.length() + req.origin().scheme().length() +
                        H2_AUTHORITY_SV.length() + authority.length() +
                        H2_PATH_SV.length() + path_sv.length();
    for (const auto& [name, value] : fields) {
        total_size += name.length() + value.length();
    }

    // --- 阶段二: 一次性分配内存 ---
    h2_stream.header_arena.resize(total_size);
    char* current_ptr = h2_stream.header_arena.data();
    nva.reserve(4 + fields.size());

    // --- 阶段三: 填充 Arena 并构造 nghttp2_nv ---
    auto fill_nv = [&](const std::string_view name_sv, const std::string_view value_sv) {
        char* name_start = current_ptr;
        std::memcpy(name_start, name_sv.data(), name_sv.length());
        current_ptr += name_sv.length();

        char* value_start = current_ptr;
        std::memcpy(value_start, value_sv.data(), value_sv.length());
        current_ptr += value_sv.length();

        nva.push_back({
            reinterpret_cast<uint8_t*>(name_start),
            reinterpret_cast<uint8_t*>(value_start),
            name_sv.length(),
            value_sv.length(),
            NGHTTP2_NV_FLAG_NONE
        });
    };

    // 伪头部必须在最前面
    fill_nv(H2_METHOD_SV, method);
    fill_nv(H2_SCHEME_SV, req.origin().scheme());
    fill_nv(H2_AUTHORITY_SV, authority);
    fill_nv(H2_PATH_SV, path_sv);
    for (const auto& [name, value] : fields) {
        fill_nv(name, value);
    }
}

template <typename Stream>
void Http2Connection<Stream>::handle_stream_close(const int32_t stream_id, const uint32_t error_code) {
    const auto it = streams_.find(stream_id);
    if (it == streams_.end()) {
        return;
    }
    const std::shared_ptr<H2Stream> h2_stream = it->second;
    streams_.erase(it);
    --reserved_streams_;
    h2_stream->state = H2Stream::State::closed;
    update_last_used_time();

    if (h2_stream->local_error) {
        h2_stream->finish(h2_stream->local_error, Response{});
        return;
    }
    if (error_code != NGHTTP2_NO_ERROR || h2_stream->status == 0) {
        h2_stream->error_message = "H2 stream " + std::to_string(stream_id) + " on [" + id_ + "] was reset: " +
                                   nghttp2_http2_strerror(error_code);
        SPDLOG_DEBUG("{}", h2_stream->error_message);
        h2_stream->finish(courier_error::protocol::stream_reset, Response{});
        return;
    }

    SPDLOG_DEBUG("[{}]-[{}] stream {} closed, status {}, body {} bytes", id_, pool_key_, stream_id, h2_stream->status,
                 h2_stream->body.size());
    std::string reason(http::obsolete_reason(static_cast<http::status>(h2_stream->status)));
    Response response(h2_stream->status, std::move(reason), HttpVersion::http_2, std::move(h2_stream->headers),
                      std::make_unique<BufferedBodyStream>(std::move(h2_stream->body)));
    h2_stream->finish(boost::system::error_code{}, std::move(response));
}

template <typename Stream>
int Http2Connection<Stream>::on_header_callback(nghttp2_session* session, const nghttp2_frame* frame, const uint8_t* name,
                                                const size_t name_len, const uint8_t* value, const size_t value_len,
                                                uint8_t, void*) {
    if (frame->hd.type != NGHTTP2_HEADERS) {
        return 0;
    }
    auto* h2_stream = static_cast<H2Stream*>(nghttp2_session_get_stream_user_data(session, frame->hd.stream_id));
    if (!h2_stream) {
        return 0;
    }
    h2_stream->last_activity = std::chrono::steady_clock::now();

    const std::string_view key(reinterpret_cast<const char*>(name), name_len);
    const std::string_view val(reinterpret_cast<const char*>(value), value_len);
    if (key == ":status") {
        unsigned status = 0;
        std::from_chars(val.data(), val.data() + val.size(), status);
        // 1xx 中间响应之后还会有最终响应，之前收集的头部作废
        if (h2_stream->status >= 100 && h2_stream->status < 200) {
            h2_stream->headers.clear();
        }
        h2_stream->status = status;
        return 0;
    }
    if (!key.empty() && key.front() == ':') {
        return 0;
    }
    h2_stream->headers.insert(key, val);
    return 0;
}

template <typename Stream>
int Http2Connection<Stream>::on_data_chunk_recv_callback(nghttp2_session* session, uint8_t, const int32_t stream_id,
                                                         const uint8_t* data, const size_t len, void*) {
    if (auto* h2_stream = static_cast<H2Stream*>(nghttp2_session_get_stream_user_data(session, stream_id))) {
        h2_stream->body.append(reinterpret_cast<const char*>(data), len);
        h2_stream->last_activity = std::chrono::steady_clock::now();
    }
    return 0;
}

template <typename Stream>
int Http2Connection<Stream>::on_stream_close_callback(nghttp2_session*, const int32_t stream_id, const uint32_t error_code,
                                                      void* user_data) {
    static_cast<Http2Connection*>(user_data)->handle_stream_close(stream_id, error_code);
    return 0;
}

template <typename Stream>
int Http2Connection<Stream>::on_frame_recv_callback(nghttp2_session* session, const nghttp2_frame* frame, void* user_data) {
    auto* self = static_cast<Http2Connection*>(user_data);
    switch (frame->hd.type) {
        case NGHTTP2_GOAWAY:
            SPDLOG_DEBUG("[{}] received GOAWAY, last_stream_id = {}, error = {}", self->id_, frame->goaway.last_stream_id,
                         nghttp2_http2_strerror(frame->goaway.error_code));
            self->remote_goaway_received_ = true;
            break;
        case NGHTTP2_SETTINGS:
            if (!(frame->hd.flags & NGHTTP2_FLAG_ACK)) {
                // 服务器的上限优先于本地配置
                const uint32_t remote_max = nghttp2_session_get_remote_settings(session, NGHTTP2_SETTINGS_MAX_CONCURRENT_STREAMS);
                self->max_concurrent_streams_ = std::min<std::size_t>(self->configured_max_streams_, remote_max);
                self->remote_settings_received_ = true;
            }
            break;
        default:
            break;
    }
    return 0;
}

template <typename Stream>
int Http2Connection<Stream>::on_frame_send_callback(nghttp2_session* session, const nghttp2_frame* frame, void* user_data) {
    if (frame->hd.type == NGHTTP2_GOAWAY && frame->goaway.error_code != NGHTTP2_NO_ERROR) {
        // nghttp2 检测到对端违反协议时自己发出 GOAWAY 并停止读取，整个连接随之作废
        auto* self = static_cast<Http2Connection*>(user_data);
        SPDLOG_WARN("[{}] connection error, sent GOAWAY: {}", self->id_, nghttp2_http2_strerror(frame->goaway.error_code));
        self->fail_connection(courier_error::protocol::protocol_error,
                              "H2 connection [" + self->id_ + "] protocol violation by peer: " +
                              nghttp2_http2_strerror(frame->goaway.error_code));
        return 0;
    }
    if (frame->hd.stream_id == 0) {
        return 0;
    }
    auto* h2_stream = static_cast<H2Stream*>(nghttp2_session_get_stream_user_data(session, frame->hd.stream_id));
    if (!h2_stream) {
        return 0;
    }
    h2_stream->last_activity = std::chrono::steady_clock::now();
    const bool data_or_headers = frame->hd.type == NGHTTP2_HEADERS || frame->hd.type == NGHTTP2_DATA;
    if (data_or_headers && (frame->hd.flags & NGHTTP2_FLAG_END_STREAM) && h2_stream->state == H2Stream::State::open) {
        h2_stream->state = H2Stream::State::half_closed_local;
    }
    return 0;
}

/**
 * @brief 按 nghttp2 给出的窗口大小拷贝请求体。流式请求体在这里按需拉取下一块。
 */
template <typename Stream>
ssize_t Http2Connection<Stream>::read_request_body_callback(nghttp2_session*, const int32_t stream_id, uint8_t* buf,
                                                            const size_t length, uint32_t* data_flags,
                                                            nghttp2_data_source* source, void* user_data) {
    auto* h2_stream = static_cast<H2Stream*>(source->ptr);
    const RequestBody& body = h2_stream->request.body();

    if (!body.is_streaming()) {
        const std::string& data = body.data();
        const size_t to_copy = std::min(length, data.size() - h2_stream->body_offset);
        std::memcpy(buf, data.data() + h2_stream->body_offset, to_copy);
        h2_stream->body_offset += to_copy;
        if (h2_stream->body_offset == data.size()) {
            *data_flags |= NGHTTP2_DATA_FLAG_EOF;
            h2_stream->body_eof = true;
        }
        return static_cast<ssize_t>(to_copy);
    }

    if (h2_stream->pending_offset == h2_stream->pending_chunk.size()) {
        std::optional<std::string> chunk;
        try {
            chunk = body.next_chunk();
        } catch (const std::exception& e) {
            // 生产者的异常不能穿过 C 回调，记下来交给 await_response 重新抛出
            SPDLOG_WARN("[{}] stream {} request body producer failed: {}",
                        static_cast<Http2Connection*>(user_data)->id_, stream_id, e.what());
            h2_stream->body_error = std::current_exception();
            h2_stream->local_error = courier_error::adapter::request_body_unavailable;
            h2_stream->error_message = e.what();
            return NGHTTP2_ERR_TEMPORAL_CALLBACK_FAILURE;
        }
        if (!chunk) {
            *data_flags |= NGHTTP2_DATA_FLAG_EOF;
            h2_stream->body_eof = true;
            return 0;
        }
        h2_stream->pending_chunk = std::move(*chunk);
        h2_stream->pending_offset = 0;
    }

    const size_t to_copy = std::min(length, h2_stream->pending_chunk.size() - h2_stream->pending_offset);
    std::memcpy(buf, h2_stream->pending_chunk.data() + h2_stream->pending_offset, to_copy);
    h2_stream->pending_offset += to_copy;
    return static_cast<ssize_t>(to_copy);
}

template class Http2Connection<PlainStream>;
template class Http2Connection<TlsStream>;

} // namespace courier
