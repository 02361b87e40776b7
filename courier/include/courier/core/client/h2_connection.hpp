//
// Created by ubuntu on 2025/11/8.
//

#ifndef COURIER_H2_CONNECTION_HPP
#define COURIER_H2_CONNECTION_HPP

#include <array>
#include <atomic>
#include <boost/asio/experimental/channel.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <nghttp2/nghttp2.h>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <courier/core/client/iconnection.hpp>
#include <courier/core/client/transport.hpp>
#include <courier/utils/config/CourierConfig.hpp>

namespace courier {

/**
 * @brief HTTP/2 的一个逻辑流，即一次请求 / 响应交换。
 *
 * 由父连接在流关闭时销毁。nghttp2 的 stream_user_data 指向这里。
 */
struct H2Stream {
    enum class State {
        idle,               // 还没有提交给 nghttp2
        open,               // HEADERS 已提交
        half_closed_local,  // 请求方向已发送 END_STREAM，等待响应
        closed              // 响应完整收到，或被 RST_STREAM / 连接级错误终止
    };

    using SignalChannel = boost::asio::experimental::channel<void(boost::system::error_code)>;

    H2Stream(const boost::asio::any_io_executor& executor, Request req)
        : request(std::move(req)), opened(executor, 1), response(executor, 1) {}

    /// [Actor] 记录提交结果并唤醒 open_stream
    void settle_open(const boost::system::error_code& ec) {
        if (open_settled) {
            return;
        }
        open_settled = true;
        open_error = ec;
        opened.try_send(ec);
    }

    /// [Actor] 记录最终结果并唤醒 await_response，只有第一次生效
    void finish(const boost::system::error_code& ec, Response result) {
        if (finished) {
            return;
        }
        finished = true;
        outcome_error = ec;
        outcome = std::move(result);
        response.try_send(ec);
    }

    int32_t id = 0;
    State state = State::idle;
    Request request;

    // 提交结果与最终响应。结果先记在流上，channel 只负责唤醒：
    // 等待方和定时器赛跑输掉时，已经送出的信号会丢，结果不会
    SignalChannel opened;
    SignalChannel response;
    bool open_settled = false;
    boost::system::error_code open_error;
    bool finished = false;
    boost::system::error_code outcome_error;
    Response outcome;
    /// 调用者在提交之前就放弃了，Actor 不再提交它
    bool abandoned = false;

    // 接收过程中逐步构建的响应
    unsigned status = 0;
    Headers headers;
    std::string body;

    // nghttp2_nv 只保存裸指针，header 字符串的内存放在这里
    std::vector<char> header_arena;

    // 请求体发送进度
    bool has_body = false;
    bool body_eof = false;
    std::size_t body_offset = 0;
    std::string pending_chunk;
    std::size_t pending_offset = 0;

    /// 本地主动终止的原因 (流控超时、读超时、请求体生产者失败)
    boost::system::error_code local_error;
    std::string error_message;
    /// 请求体生产者抛出的异常，原样交还给调用者
    std::exception_ptr body_error;
    /// 发送窗口耗尽的起始时间，窗口恢复后清空
    std::optional<std::chrono::steady_clock::time_point> blocked_since;
    std::chrono::steady_clock::time_point last_activity = std::chrono::steady_clock::now();
};

// Actor 的消息类型
struct H2OpenMessage {
    std::shared_ptr<H2Stream> stream;
};

struct H2CancelMessage {
    int32_t stream_id;
    boost::system::error_code reason;
};

/// 读协程收到的数据或读错误
struct H2ReadMessage {
    boost::system::error_code ec;
    std::string data;
};

struct H2CloseMessage {};

/// 流控定时器到期，由定时器的回调投递
struct H2FlowCheckMessage {};

using H2ActorMessage = std::variant<H2OpenMessage, H2CancelMessage, H2ReadMessage, H2CloseMessage, H2FlowCheckMessage>;

// Actor 的"邮箱"，协程安全的消息队列。
using H2ActorChannel = boost::asio::experimental::channel<void(boost::system::error_code, H2ActorMessage)>;

/**
 * @class Http2Connection
 * @brief 管理一个到远程服务器的 HTTP/2 客户端连接。
 *
 * 连接实现为 Actor 模型：actor_loop() 协程独占 nghttp2 会话和所有流的状态，
 * 负责 HPACK、帧的收发顺序和全部写操作，帧只会整帧交错。
 * 一个独立的读协程只负责把网络上读到的字节投递到 Actor 的邮箱里。
 *
 * 连接级错误 (收到 GOAWAY、报文违反协议、传输断开) 会以同一个错误终止所有打开的流，
 * 连接随后不再可复用，由连接池移除。
 *
 * @tparam Stream PlainStream (h2c prior knowledge) 或 TlsStream (ALPN h2)。
 */
template <typename Stream>
class Http2Connection final : public IConnection, public std::enable_shared_from_this<Http2Connection<Stream>> {
public:
    Http2Connection(std::shared_ptr<Stream> stream, std::string pool_key, const TimeoutConfig& timeouts,
                    std::size_t max_concurrent_streams);
    ~Http2Connection() override;

    // 禁止拷贝和赋值，因为每个连接都是唯一的。
    Http2Connection(const Http2Connection&) = delete;
    Http2Connection& operator=(const Http2Connection&) = delete;

    /**
     * @brief 启动 Actor，发送连接前言和 SETTINGS，并等待服务器的 SETTINGS。
     * @throws system_error connect_timeout 在连接超时内没有完成握手；connect_failed 握手失败。
     */
    boost::asio::awaitable<void> run();

    /**
     * @brief 分配下一个奇数流 ID 并提交请求头 (以及请求体)。
     * @throws system_error too_many_streams 已达到并发流上限，现有的流不受影响。
     */
    boost::asio::awaitable<std::shared_ptr<H2Stream>> open_stream(const Request& request);

    /**
     * @brief 等待一个已打开的流的完整响应。
     * 超过读超时没有任何进展时，发送 RST_STREAM(CANCEL) 并抛出 read_timeout，连接本身保持可用。
     */
    boost::asio::awaitable<Response> await_response(std::shared_ptr<H2Stream> stream);

    // --- IConnection 接口实现 ---
    boost::asio::awaitable<Response> send(const Request& request) override;
    [[nodiscard]] bool is_reusable() const override;
    boost::asio::awaitable<void> close() override;
    void abort() noexcept override;

    [[nodiscard]] const std::string& id() const override { return id_; }
    [[nodiscard]] const std::string& get_pool_key() const override { return pool_key_; }
    [[nodiscard]] HttpVersion version() const override { return HttpVersion::http_2; }
    [[nodiscard]] std::size_t get_active_streams() const override { return reserved_streams_.load(); }
    [[nodiscard]] std::size_t get_max_concurrent_streams() const override { return max_concurrent_streams_.load(); }
    [[nodiscard]] bool supports_multiplexing() const override { return true; }
    void update_last_used_time() override;
    [[nodiscard]] std::chrono::steady_clock::time_point get_last_used_time() const override { return last_used_timestamp_.load(); }

    /// 服务器是否发送过 GOAWAY
    [[nodiscard]] bool goaway_received() const { return remote_goaway_received_.load(); }

private:
    boost::asio::awaitable<void> actor_loop();
    boost::asio::awaitable<void> reader_loop();
    boost::asio::awaitable<void> do_write();

    void init_session();
    void handle_open(const std::shared_ptr<H2Stream>& stream);
    void handle_cancel(int32_t stream_id, const boost::system::error_code& reason);
    void handle_read(const H2ReadMessage& msg);

    /// 发送窗口耗尽的流开始计时，恢复的流清除计时
    void update_flow_control_state();
    [[nodiscard]] std::chrono::steady_clock::time_point next_flow_deadline() const;
    void expire_blocked_streams();
    /// 按最早的流控期限重新设置定时器，到期时往邮箱里投递 H2FlowCheckMessage
    void arm_flow_timer();

    /// 以同一个错误终止所有流，并拒绝邮箱里尚未处理的 open 请求
    void terminate_all(const boost::system::error_code& ec, const std::string& message);
    void fail_connection(const boost::system::error_code& ec, const std::string& message);

    void prepare_headers(std::vector<nghttp2_nv>& nva, H2Stream& stream) const;
    void handle_stream_close(int32_t stream_id, uint32_t error_code);

    // --- nghttp2 C-style 静态回调函数 ---
    static int on_header_callback(nghttp2_session* session, const nghttp2_frame* frame, const uint8_t* name, size_t name_len,
                                  const uint8_t* value, size_t value_len, uint8_t flags, void* user_data);
    static int on_data_chunk_recv_callback(nghttp2_session* session, uint8_t flags, int32_t stream_id, const uint8_t* data,
                                           size_t len, void* user_data);
    static int on_stream_close_callback(nghttp2_session* session, int32_t stream_id, uint32_t error_code, void* user_data);
    static int on_frame_recv_callback(nghttp2_session* session, const nghttp2_frame* frame, void* user_data);
    static int on_frame_send_callback(nghttp2_session* session, const nghttp2_frame* frame, void* user_data);
    static ssize_t read_request_body_callback(nghttp2_session* session, int32_t stream_id, uint8_t* buf, size_t length,
                                              uint32_t* data_flags, nghttp2_data_source* source, void* user_data);

    // --- 成员变量 ---
    std::shared_ptr<Stream> stream_;
    std::string pool_key_;
    std::string id_;
    TimeoutConfig timeouts_;
    std::size_t configured_max_streams_;

    H2ActorChannel actor_channel_; // Actor 的“邮箱”
    boost::asio::experimental::channel<void(boost::system::error_code)> handshake_signal_; // 握手完成 (或失败) 时关闭
    boost::asio::steady_timer flow_timer_;
    std::chrono::steady_clock::time_point flow_deadline_ = std::chrono::steady_clock::time_point::max();
    boost::asio::steady_timer write_timer_; // 写超时看门狗，超时直接关闭套接字
    bool write_timed_out_ = false;
    std::array<char, 16384> read_buffer_{}; // 网络读取缓冲区，只由读协程使用

    nghttp2_session* session_ = nullptr; // nghttp2 的会话状态机
    std::unordered_map<int32_t, std::shared_ptr<H2Stream>> streams_; // 所有已提交的流

    boost::system::error_code terminal_error_;
    std::string terminal_message_;

    std::atomic<bool> is_closing_{false};
    std::atomic<bool> handshake_completed_{false};
    std::atomic<bool> remote_settings_received_{false};
    std::atomic<bool> remote_goaway_received_{false};
    std::atomic<std::size_t> max_concurrent_streams_;
    std::atomic<std::size_t> reserved_streams_{0}; // 已占用的流名额，包括正在提交的
    std::atomic<std::chrono::steady_clock::time_point> last_used_timestamp_;
};

using PlainHttp2Connection = Http2Connection<PlainStream>;
using TlsHttp2Connection = Http2Connection<TlsStream>;

} // namespace courier

#endif //COURIER_H2_CONNECTION_HPP
