//
// Created by ubuntu on 2025/11/9.
//

#ifndef COURIER_CONNECTION_POOL_HPP
#define COURIER_CONNECTION_POOL_HPP

#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/experimental/channel.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <courier/core/client/iconnection.hpp>
#include <courier/core/client/transport.hpp>
#include <courier/utils/config/CourierConfig.hpp>

namespace courier {

/**
 * @struct PooledConnection
 * @brief 从连接池借出的连接。
 *
 * 借出的连接必须通过 ConnectionPool::release() 归还，重复归还是安全的。
 */
struct PooledConnection {
    /// @brief 指向获取到的连接对象的共享指针。
    std::shared_ptr<IConnection> connection;
    /// @brief 如果连接是从池中复用的，则为 true；如果是新创建的，则为 false。
    bool is_reused = false;
};

/**
 * @brief 响应体包装：响应体读完、关闭或析构时调用一次 on_done，把借出的连接还给连接池。
 */
class ReleasingBodyStream final : public IBodyStream {
public:
    ReleasingBodyStream(std::unique_ptr<IBodyStream> inner, std::function<void()> on_done)
        : inner_(std::move(inner)), on_done_(std::move(on_done)) {}

    ~ReleasingBodyStream() override {
        // 先让内层流处理放弃交换 (HTTP/1.1 会关闭连接)，再归还
        inner_.reset();
        finish();
    }

    boost::asio::awaitable<std::optional<std::string>> next() override {
        std::optional<std::string> chunk = co_await inner_->next();
        if (!chunk) {
            finish();
        }
        co_return chunk;
    }

    boost::asio::awaitable<void> close() override {
        co_await inner_->close();
        finish();
    }

    [[nodiscard]] bool is_complete() const override { return inner_ && inner_->is_complete(); }

private:
    void finish() {
        if (on_done_) {
            auto on_done = std::move(on_done_);
            on_done_ = nullptr;
            on_done();
        }
    }

    std::unique_ptr<IBodyStream> inner_;
    std::function<void()> on_done_;
};

/**
 * @class ConnectionPool
 * @brief HTTP/1.1 和 HTTP/2 客户端连接池。
 *
 * 连接池拥有所有连接，按 Origin (加上代理路由和 CA 文件) 分组，负责连接的创建、复用、
 * 容量限制、保活过期和清理。所有对内部状态的读写都通过 `post` 到 strand_ 上执行；
 * 协程每次挂起之后都会重新回到 strand_，因此状态修改是串行化的。
 *
 * acquire() 是唯一的背压点：达到每个 Origin 的连接上限时，调用者挂起在自己的等待 channel 上，
 * 直到有连接被归还或者 pool 超时。
 *
 * @note 生命周期由 std::shared_ptr 管理，后台维护任务只持有 weak_ptr。
 */
class ConnectionPool : public std::enable_shared_from_this<ConnectionPool> {
public:
    ConnectionPool(boost::asio::any_io_executor executor, std::shared_ptr<ITransport> transport, const ClientConfig& config);

    /**
     * @brief 析构时立即关闭所有剩余连接的套接字。正常的停机流程应当先 `co_await close()`。
     */
    ~ConnectionPool();

    // 禁止拷贝和移动，连接池是唯一的、管理状态的服务。
    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /**
     * @brief 启动后台维护任务 (maintenance_interval_ms 为 0 时什么都不做)。
     * 需要 shared_from_this()，所以不能在构造函数里调用。
     */
    void start();

    /**
     * @brief 异步地获取一个到指定目标的健康连接。
     *
     * 1. 复用负载最低、还有空余流的 HTTP/2 连接；
     * 2. 复用最近一次使用的空闲 HTTP/1.1 连接；
     * 3. 已知目标说 HTTP/2 且已有连接正在创建时，等待那个连接而不是再开一个套接字；
     * 4. 未达到 max_connections_per_origin 时创建新连接；
     * 5. 否则挂起等待，超过 pool 超时抛出 pool_timeout。
     *
     * 在交出任何连接之前都会先清理过期的空闲连接。
     *
     * @throws system_error connect_failed (带底层原因) / connect_timeout / pool_timeout / pool_closed。
     *         调用者被取消时抛出 operation_aborted，占用的名额和排队位置会先归还。
     */
    boost::asio::awaitable<PooledConnection> acquire(const Origin& origin, const ConnectOptions& options = {});

    /**
     * @brief 归还一个借出的连接，并唤醒一个等待者。
     *
     * 可以复用的 HTTP/1.1 连接回到空闲集合 (全局空闲数未达到 max_keepalive_connections 时)，
     * 其他情况直接关闭。归还一个已经空闲的连接什么也不做。
     *
     * @note 非阻塞操作，实际工作被 post 到 strand_ 上执行，可以从任意线程调用。
     */
    void release(const std::shared_ptr<IConnection>& conn);

    /**
     * @brief 借出连接、发送请求，并把连接的归还挂在响应体的生命周期上。
     *
     * 代理和 CA 文件取自请求上的路由提示。响应体已经完整在内存里时连接立即归还，
     * 否则在响应体读完、Response::close() 或响应析构时归还。
     */
    boost::asio::awaitable<Response> send(const Request& request);

    /**
     * @brief 停止维护任务，以 pool_closed 唤醒所有等待者，并行关闭所有连接。
     */
    boost::asio::awaitable<void> close();

    /// 某个 Origin 当前存在的连接数 (活跃 + 空闲)
    boost::asio::awaitable<std::size_t> connection_count(const Origin& origin, const ConnectOptions& options = {});

    /// 全局空闲连接数
    boost::asio::awaitable<std::size_t> idle_count();

    /// 已知某个 Origin 说的协议 (来自 ALPN 或 h2c prior knowledge)，缓存过期后返回 std::nullopt
    boost::asio::awaitable<std::optional<HttpVersion>> known_protocol(const Origin& origin, const ConnectOptions& options = {});

    /**
     * @brief 连接池键：Origin::key() 加上代理路由和 CA 文件。
     * 走不同代理或信任不同 CA 的连接不能互相复用。
     */
    static std::string make_pool_key(const Origin& origin, const ConnectOptions& options);

    /// 从请求的路由提示 (代理、CA 文件) 得到建立连接的选项
    static ConnectOptions options_for(const Request& request);

private:
    using SignalChannel = boost::asio::experimental::channel<void(boost::system::error_code)>;

    struct PoolEntry {
        std::shared_ptr<IConnection> connection;
        /// 借出次数。HTTP/1.1 只会是 0 或 1，HTTP/2 可以同时借给多个调用者
        std::size_t borrowers = 0;
        std::chrono::steady_clock::time_point idle_since = std::chrono::steady_clock::now();
    };

    /// 排队等待名额的调用者。信号先记在这里再送进 channel，channel 只负责唤醒
    struct Waiter {
        explicit Waiter(const boost::asio::any_io_executor& executor) : channel(executor, 1) {}

        void notify(const boost::system::error_code& ec) {
            signal = ec;
            channel.try_send(ec);
        }

        SignalChannel channel;
        std::optional<boost::system::error_code> signal;
    };

    struct OriginState {
        std::vector<PoolEntry> entries;
        /// 正在创建的连接数，同样占用 max_connections_per_origin 的名额
        std::size_t pending_creations = 0;
        /// 按到达顺序排队的等待者
        std::deque<std::shared_ptr<Waiter>> waiters;
        /// 已知说 HTTP/2 的 Origin 上正在进行的连接创建，完成时 channel 被关闭
        std::shared_ptr<SignalChannel> h2_creation;
    };

    struct ProtocolKnowledge {
        HttpVersion version;
        std::chrono::steady_clock::time_point expires_at;
    };

    /// 连接创建的结果。不抛异常，这样在和定时器赛跑时失败不会被当成"没有完成"
    struct ConnectAttempt {
        std::shared_ptr<IConnection> connection;
        std::exception_ptr error;
    };

    boost::asio::awaitable<PooledConnection> acquire_slot(const Origin& origin, const ConnectOptions& options);

    /// 当前协程是否已经收到取消请求
    static boost::asio::awaitable<bool> cancelled();

    boost::asio::awaitable<std::shared_ptr<IConnection>> create_connection(const std::string& key, const Origin& origin,
                                                                           const ConnectOptions& options);
    boost::asio::awaitable<ConnectAttempt> attempt_connect(std::string key, Origin origin, ConnectOptions options);

    template <typename Stream>
    boost::asio::awaitable<std::shared_ptr<IConnection>> make_connection(std::shared_ptr<Stream> stream, const std::string& key,
                                                                         HttpVersion version, bool via_forward_proxy);

    // --- 以下函数必须在 strand_ 上调用 ---
    PoolEntry* find_reusable(OriginState& state);
    PoolEntry* find_entry(const std::shared_ptr<IConnection>& conn);
    void sweep_expired();
    void wake_one(OriginState& state);
    void wake_all(OriginState& state);
    [[nodiscard]] std::size_t idle_count_locked() const;
    [[nodiscard]] bool known_h2(const std::string& key) const;
    void close_detached(std::shared_ptr<IConnection> conn);

    static boost::asio::awaitable<void> maintenance_loop(std::weak_ptr<ConnectionPool> weak,
                                                         std::shared_ptr<boost::asio::steady_timer> timer,
                                                         std::chrono::milliseconds interval);

    boost::asio::any_io_executor executor_;

    /// @brief 核心同步原语。所有对 origins_ 和 protocols_ 的读写都必须在这个 strand 上执行。
    boost::asio::strand<boost::asio::any_io_executor> strand_;

    std::shared_ptr<ITransport> transport_;
    PoolLimits limits_;
    TimeoutConfig timeouts_;
    std::size_t http2_max_concurrent_streams_;
    /// 明文 Origin 直接说 HTTP/2，第一条连接就按已知 HTTP/2 处理
    bool http2_prior_knowledge_;
    std::chrono::milliseconds protocol_cache_ttl_;
    std::chrono::milliseconds maintenance_interval_;

    std::unordered_map<std::string, OriginState> origins_;
    /// 每个池键的协议协商历史结果
    std::unordered_map<std::string, ProtocolKnowledge> protocols_;

    // --- 后台维护任务相关 ---
    std::shared_ptr<boost::asio::steady_timer> maintenance_timer_;

    /// @brief 标志位，用于在关闭时安全地停止后台循环和拒绝新的 acquire。
    std::atomic<bool> closed_{false};
};

} // namespace courier

#endif //COURIER_CONNECTION_POOL_HPP
