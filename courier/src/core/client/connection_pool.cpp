//
// Created by ubuntu on 2025/11/9.
//

#include <courier/core/client/connection_pool.hpp>
#include <courier/core/client/h2_connection.hpp>
#include <courier/core/client/http1_connection.hpp>
#include <courier/error/courier_error.hpp>

#include <algorithm>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <limits>
#include <ranges>
#include <spdlog/spdlog.h>

namespace asio = boost::asio;
using namespace boost::asio::experimental::awaitable_operators;

namespace courier {

ConnectionPool::ConnectionPool(asio::any_io_executor executor, std::shared_ptr<ITransport> transport, const ClientConfig& config)
    : executor_(std::move(executor)),
      strand_(asio::make_strand(executor_)),
      transport_(std::move(transport)),
      limits_(config.limits()),
      timeouts_(config.timeouts()),
      http2_max_concurrent_streams_(config.http2_max_concurrent_streams),
      http2_prior_knowledge_(config.http2_enabled && config.http2_prior_knowledge),
      protocol_cache_ttl_(config.protocol_cache_ttl_ms),
      maintenance_interval_(config.maintenance_interval_ms) {
}

/**
 * @brief 析构函数。停止后台任务，并立即关闭剩余连接的套接字。
 */
ConnectionPool::~ConnectionPool() {
    if (maintenance_timer_) {
        maintenance_timer_->cancel();
    }
    for (const auto& state : origins_ | std::views::values) {
        for (const auto& entry : state.entries) {
            entry.connection->abort();
        }
    }
}

void ConnectionPool::start() {
    if (maintenance_interval_.count() == 0 || maintenance_timer_) {
        return;
    }
    maintenance_timer_ = std::make_shared<asio::steady_timer>(executor_);
    asio::co_spawn(executor_, maintenance_loop(weak_from_this(), maintenance_timer_, maintenance_interval_), asio::detached);
}

std::string ConnectionPool::make_pool_key(const Origin& origin, const ConnectOptions& options) {
    std::string key = origin.key();
    if (options.proxy) {
        key += " via " + options.proxy->key();
    }
    if (options.ca_bundle && !options.ca_bundle->empty()) {
        key += " ca=" + *options.ca_bundle;
    }
    return key;
}

ConnectOptions ConnectionPool::options_for(const Request& request) {
    ConnectOptions options;
    if (request.proxy() && !request.proxy()->empty()) {
        options.proxy = Origin::from_url(*request.proxy());
    }
    if (request.ca_bundle() && !request.ca_bundle()->empty()) {
        options.ca_bundle = *request.ca_bundle();
    }
    return options;
}

/**
 * @brief 异步地获取一个到指定目标的健康连接，包含完整的连接池管理和背压逻辑。
 *
 * 调用者被取消时 (例如在 `||` 中输给了定时器)，名额、等待队列和创建信号的记账
 * 仍然要在 strand_ 上做完，之后才以 operation_aborted 结束。所以 acquire_slot
 * 运行期间关闭 throw_if_cancelled，由它自己检查取消状态。
 */
asio::awaitable<PooledConnection> ConnectionPool::acquire(const Origin& origin, const ConnectOptions& options) {
    const bool throw_if_cancelled = co_await asio::this_coro::throw_if_cancelled();
    co_await asio::this_coro::throw_if_cancelled(false);

    PooledConnection pooled;
    std::exception_ptr error;
    try {
        pooled = co_await acquire_slot(origin, options);
    } catch (const std::exception&) {
        error = std::current_exception();
    }

    co_await asio::this_coro::throw_if_cancelled(throw_if_cancelled);
    if (error) {
        std::rethrow_exception(error);
    }
    co_return pooled;
}

/**
 * @brief acquire 的主体。每次挂起 (创建连接、等待) 之后都会重新 post 到 strand_，并重新查找状态。
 */
asio::awaitable<PooledConnection> ConnectionPool::acquire_slot(const Origin& origin, const ConnectOptions& options) {
    const std::string key = make_pool_key(origin, options);
    const auto deadline = std::chrono::steady_clock::now() + timeouts_.pool;
    SPDLOG_DEBUG("获取连接 [{}]", key);

    while (true) {
        // --- 进入 strand 以保证对所有共享状态的访问都是串行的 ---
        co_await asio::post(strand_, asio::use_awaitable);
        if (closed_) {
            throw boost::system::system_error(courier_error::network::pool_closed, "Connection pool is closed");
        }
        if (co_await cancelled()) {
            throw boost::system::system_error(asio::error::operation_aborted, "Acquire of '" + key + "' was cancelled");
        }

        // 交出任何连接之前先清理过期和失效的空闲连接
        sweep_expired();
        OriginState& state = origins_[key];

        // --- 阶段 1: 复用现有连接 ---
        if (PoolEntry* entry = find_reusable(state)) {
            ++entry->borrowers;
            entry->connection->update_last_used_time();
            SPDLOG_DEBUG("复用{}连接 [{}]-[{}] (借出 {} 次)", to_string(entry->connection->version()), entry->connection->id(),
                         key, entry->borrowers);
            co_return PooledConnection{entry->connection, true};
        }

        std::shared_ptr<SignalChannel> wait_on;
        if (state.h2_creation) {
            // --- 阶段 2: 惊群处理，目标已知说 HTTP/2，等正在创建的那个连接 ---
            SPDLOG_DEBUG("等待 '{}' 的 HTTP/2 连接创建完成...", key);
            wait_on = state.h2_creation;
        } else if (state.entries.size() + state.pending_creations < limits_.max_connections_per_origin) {
            // --- 阶段 3: 创建新连接 ---
            ++state.pending_creations;
            std::shared_ptr<SignalChannel> creation;
            if (known_h2(key) || (http2_prior_knowledge_ && !origin.is_tls() && !options.proxy)) {
                creation = std::make_shared<SignalChannel>(executor_, 1);
                state.h2_creation = creation;
            }
            SPDLOG_DEBUG("连接池里没有可用连接 '{}'，发起新的创建任务 ({} + {} / {})", key, state.entries.size(),
                         state.pending_creations - 1, limits_.max_connections_per_origin);

            std::shared_ptr<IConnection> conn;
            std::exception_ptr error;
            try {
                conn = co_await create_connection(key, origin, options);
            } catch (const std::exception&) {
                error = std::current_exception();
            }

            // 回到 strand 来"记录结果、广播信号、释放名额"，在同一序列中完成
            co_await asio::post(strand_, asio::use_awaitable);
            if (closed_) {
                if (conn) {
                    close_detached(conn);
                }
                if (error) {
                    std::rethrow_exception(error);
                }
                throw boost::system::system_error(courier_error::network::pool_closed, "Connection pool is closed");
            }

            OriginState& current = origins_[key];
            --current.pending_creations;
            if (creation) {
                creation->close();
                if (current.h2_creation == creation) {
                    current.h2_creation.reset();
                }
            }
            const bool abandoned = co_await cancelled();
            if (!conn) {
                // 名额空出来了，让下一个等待者去尝试
                wake_one(current);
                if (abandoned) {
                    throw boost::system::system_error(asio::error::operation_aborted, "Acquire of '" + key + "' was cancelled");
                }
                std::rethrow_exception(error);
            }

            const auto now = std::chrono::steady_clock::now();
            protocols_[key] = ProtocolKnowledge{conn->version(), now + protocol_cache_ttl_};
            // 调用者已经走了，建好的连接作为空闲连接留给别人
            current.entries.push_back(PoolEntry{conn, abandoned ? 0u : 1u, now});
            SPDLOG_DEBUG("新连接 [{}] 加入连接池 [{}]，当前连接数量 {}", conn->id(), key, current.entries.size());
            if (conn->supports_multiplexing()) {
                // 多路复用的连接还有空余的流，所有等待者都可以来试一次
                wake_all(current);
            } else if (abandoned) {
                wake_one(current);
            }
            if (abandoned) {
                throw boost::system::system_error(asio::error::operation_aborted, "Acquire of '" + key + "' was cancelled");
            }
            co_return PooledConnection{conn, false};
        }

        // --- 阶段 4: 达到上限，排队等待 (背压) ---
        if (std::chrono::steady_clock::now() >= deadline) {
            throw boost::system::system_error(courier_error::network::pool_timeout,
                                              "Timed out after " + std::to_string(timeouts_.pool.count()) +
                                              "ms waiting for a connection to '" + key + "'");
        }
        std::shared_ptr<Waiter> waiter;
        if (!wait_on) {
            waiter = std::make_shared<Waiter>(executor_);
            state.waiters.push_back(waiter);
            SPDLOG_DEBUG("'{}' 已达到连接上限 {}，排队等待 (前面还有 {} 个)", key, limits_.max_connections_per_origin,
                         state.waiters.size() - 1);
        }
        SignalChannel& channel = wait_on ? *wait_on : waiter->channel;

        asio::steady_timer timer(executor_);
        timer.expires_at(deadline);
        auto result = co_await (
            channel.async_receive(asio::as_tuple(asio::use_awaitable)) ||
            timer.async_wait(asio::as_tuple(asio::use_awaitable))
        );

        co_await asio::post(strand_, asio::use_awaitable);
        if (closed_) {
            throw boost::system::system_error(courier_error::network::pool_closed, "Connection pool is closed");
        }

        OriginState& current = origins_[key];
        // 没被 wake_one 取走的等待者 (超时、取消) 不能留在队列里吞掉后面的唤醒
        std::erase(current.waiters, waiter);
        // 以等待者上记录的信号为准：定时器赢了赛跑时，channel 交出的信号会被丢弃
        const bool woken = waiter && waiter->signal && !*waiter->signal;
        if (co_await cancelled()) {
            if (woken) {
                // 唤醒已经送到，转交给下一个等待者
                wake_one(current);
            }
            throw boost::system::system_error(asio::error::operation_aborted, "Acquire of '" + key + "' was cancelled");
        }
        if (result.index() == 1 && !woken) {
            SPDLOG_WARN("等待 '{}' 的连接超时 ({}ms)", key, timeouts_.pool.count());
            throw boost::system::system_error(courier_error::network::pool_timeout,
                                              "Timed out after " + std::to_string(timeouts_.pool.count()) +
                                              "ms waiting for a connection to '" + key + "'");
        }
        // 被唤醒 (包括和超时同时到达的唤醒)，或者等待的创建任务结束了，重新走一遍流程
    }
}

/**
 * @brief 将一个使用完毕的连接释放回池中，并唤醒一个等待者
 */
void ConnectionPool::release(const std::shared_ptr<IConnection>& conn) {
    if (!conn) {
        return;
    }

    // 将操作 post 到 strand 上以保证线程安全。
    asio::post(strand_, [weak = weak_from_this(), conn] {
        const auto self = weak.lock();
        if (!self) {
            conn->abort();
            return;
        }

        PoolEntry* entry = self->find_entry(conn);
        // 已经空闲 (或已经被移除) 的连接再次归还，什么也不做
        if (!entry || entry->borrowers == 0) {
            return;
        }

        --entry->borrowers;
        OriginState& state = self->origins_[conn->get_pool_key()];
        if (entry->borrowers == 0) {
            entry->idle_since = std::chrono::steady_clock::now();
            // idle_count_locked() 已经包含这个连接
            const bool keep = !self->closed_ && conn->is_reusable() &&
                              self->idle_count_locked() <= self->limits_.max_keepalive_connections;
            if (keep) {
                SPDLOG_DEBUG("连接 [{}] 归还到连接池 [{}]，空闲连接 {} 个", conn->id(), conn->get_pool_key(), self->idle_count_locked());
            } else {
                SPDLOG_DEBUG("连接 [{}] 不能复用或超过空闲上限，直接关闭", conn->id());
                std::erase_if(state.entries, [&](const PoolEntry& e) { return e.connection == conn; });
                self->close_detached(conn);
            }
        }

        self->wake_one(state);
        self->sweep_expired();
    });
}

asio::awaitable<Response> ConnectionPool::send(const Request& request) {
    const ConnectOptions options = options_for(request);
    const PooledConnection pooled = co_await acquire(request.origin(), options);
    const std::shared_ptr<IConnection> conn = pooled.connection;

    Response response;
    std::exception_ptr error;
    try {
        response = co_await conn->send(request);
    } catch (const std::exception&) {
        error = std::current_exception();
    }
    if (error) {
        // HTTP/1.1 连接此时已经关闭，HTTP/2 连接只损失了一个流
        release(conn);
        std::rethrow_exception(error);
    }

    if (conn->supports_multiplexing() || conn->get_active_streams() == 0) {
        // 响应体已经完整在内存里，连接不再被这个响应占用
        release(conn);
    } else {
        response.wrap_body([weak = weak_from_this(), conn](std::unique_ptr<IBodyStream> inner) -> std::unique_ptr<IBodyStream> {
            return std::make_unique<ReleasingBodyStream>(std::move(inner), [weak, conn] {
                if (const auto self = weak.lock()) {
                    self->release(conn);
                }
            });
        });
    }
    co_return response;
}

/**
 * @brief 异步地关闭所有连接池中的连接并停止后台任务。
 */
asio::awaitable<void> ConnectionPool::close() {
    // 1. 切换到 strand，以保证对所有内部状态的访问都是串行的。
    co_await asio::post(strand_, asio::use_awaitable);

    // 2. 确保关闭逻辑只执行一次。
    if (closed_.exchange(true)) {
        co_return;
    }

    // 3. 立即取消后台维护计时器。
    if (maintenance_timer_) {
        maintenance_timer_->cancel();
    }

    // 4. 唤醒所有等待者，收集所有连接准备并行关闭。
    std::vector<std::shared_ptr<IConnection>> all_conns_to_close;
    for (auto& state : origins_ | std::views::values) {
        for (const auto& waiter : state.waiters) {
            waiter->notify(courier_error::network::pool_closed);
        }
        state.waiters.clear();
        if (state.h2_creation) {
            state.h2_creation->close();
        }
        for (const auto& entry : state.entries) {
            all_conns_to_close.push_back(entry.connection);
        }
    }
    origins_.clear();
    protocols_.clear();

    if (all_conns_to_close.empty()) {
        SPDLOG_DEBUG("连接池里没有要关闭的连接");
        co_return;
    }
    SPDLOG_DEBUG("正在并发关闭 {} 个连接...", all_conns_to_close.size());

    // 5. 使用 co_spawn + channel 并行等待
    auto completion_channel = std::make_shared<SignalChannel>(executor_, all_conns_to_close.size());
    for (auto& conn : all_conns_to_close) {
        asio::co_spawn(
            executor_,
            [conn, channel_ptr = completion_channel]() -> asio::awaitable<void> {
                try {
                    co_await conn->close();
                } catch (const std::exception& e) {
                    // 关闭时的异常只记录，不影响其他连接的关闭
                    SPDLOG_WARN("[{}]-[{}] 关闭时出现异常：{}", conn->id(), conn->get_pool_key(), e.what());
                }
                co_await channel_ptr->async_send(boost::system::error_code{}, asio::as_tuple(asio::use_awaitable));
            },
            asio::detached);
    }

    // 6. 等待所有关闭任务的完成信号。
    for (std::size_t i = 0; i < all_conns_to_close.size(); ++i) {
        co_await completion_channel->async_receive(asio::as_tuple(asio::use_awaitable));
    }
    SPDLOG_DEBUG("所有连接已成功关闭");
}

asio::awaitable<std::size_t> ConnectionPool::connection_count(const Origin& origin, const ConnectOptions& options) {
    const std::string key = make_pool_key(origin, options);
    co_await asio::post(strand_, asio::use_awaitable);
    const auto it = origins_.find(key);
    co_return it == origins_.end() ? 0 : it->second.entries.size();
}

asio::awaitable<std::size_t> ConnectionPool::idle_count() {
    co_await asio::post(strand_, asio::use_awaitable);
    co_return idle_count_locked();
}

asio::awaitable<std::optional<HttpVersion>> ConnectionPool::known_protocol(const Origin& origin, const ConnectOptions& options) {
    const std::string key = make_pool_key(origin, options);
    co_await asio::post(strand_, asio::use_awaitable);
    const auto it = protocols_.find(key);
    if (it == protocols_.end() || it->second.expires_at <= std::chrono::steady_clock::now()) {
        co_return std::nullopt;
    }
    co_return it->second.version;
}

/**
 * @brief 创建一个新连接，内置了总的连接超时
 *
 * 连接创建 (DNS、TCP、代理隧道、TLS、ALPN、HTTP/2 握手) 与超时定时器赛跑。
 * 创建本身不抛异常，而是把异常放进 ConnectAttempt：`||` 只认成功完成的一方，
 * 抛异常的一方会输给定时器，失败就会被误报成超时。
 */
asio::awaitable<std::shared_ptr<IConnection>> ConnectionPool::create_connection(const std::string& key, const Origin& origin,
                                                                                const ConnectOptions& options) {
    asio::steady_timer timer(executor_);
    timer.expires_after(timeouts_.connect);

    auto result = co_await (
        attempt_connect(key, origin, options) ||
        timer.async_wait(asio::as_tuple(asio::use_awaitable))
    );

    if (result.index() == 1) {
        SPDLOG_WARN("Connecting to {} timed out after {}ms", key, timeouts_.connect.count());
        throw boost::system::system_error(courier_error::network::connect_timeout,
                                          "Connection to '" + key + "' timed out after " +
                                          std::to_string(timeouts_.connect.count()) + "ms");
    }

    ConnectAttempt attempt = std::get<0>(std::move(result));
    if (attempt.connection) {
        co_return attempt.connection;
    }

    try {
        std::rethrow_exception(attempt.error);
    } catch (const boost::system::system_error& e) {
        if (e.code() == courier_error::network::connect_timeout) {
            throw;
        }
        SPDLOG_ERROR("Failed to create new connection to {}: {}", key, e.what());
        throw boost::system::system_error(courier_error::network::connect_failed,
                                          "Connection failed for key '" + key + "'. Underlying cause: " + e.what());
    } catch (const std::exception& e) {
        SPDLOG_ERROR("Failed to create new connection to {}: {}", key, e.what());
        throw boost::system::system_error(courier_error::network::connect_failed,
                                          "Connection failed for key '" + key + "'. Underlying cause: " + e.what());
    }
}

asio::awaitable<ConnectionPool::ConnectAttempt> ConnectionPool::attempt_connect(std::string key, Origin origin,
                                                                                ConnectOptions options) {
    std::exception_ptr error;
    try {
        TransportStream transport_stream = co_await transport_->connect(origin, options, timeouts_.connect);
        std::shared_ptr<IConnection> conn;
        if (auto* tls = std::get_if<std::shared_ptr<TlsStream>>(&transport_stream.stream)) {
            conn = co_await make_connection(*tls, key, transport_stream.version, transport_stream.via_forward_proxy);
        } else {
            conn = co_await make_connection(std::get<std::shared_ptr<PlainStream>>(transport_stream.stream), key,
                                            transport_stream.version, transport_stream.via_forward_proxy);
        }
        co_return ConnectAttempt{std::move(conn), nullptr};
    } catch (const std::exception&) {
        error = std::current_exception();
    }
    co_return ConnectAttempt{nullptr, error};
}

template <typename Stream>
asio::awaitable<std::shared_ptr<IConnection>> ConnectionPool::make_connection(std::shared_ptr<Stream> stream, const std::string& key,
                                                                              const HttpVersion version, const bool via_forward_proxy) {
    if (version == HttpVersion::http_2) {
        auto conn = std::make_shared<Http2Connection<Stream>>(std::move(stream), key, timeouts_, http2_max_concurrent_streams_);
        // 等待 H2 握手完成。
        co_await conn->run();
        co_return conn;
    }
    co_return std::make_shared<Http1Connection<Stream>>(std::move(stream), key, timeouts_, via_forward_proxy);
}

asio::awaitable<bool> ConnectionPool::cancelled() {
    const asio::cancellation_state state = co_await asio::this_coro::cancellation_state;
    co_return state.cancelled() != asio::cancellation_type::none;
}

ConnectionPool::PoolEntry* ConnectionPool::find_reusable(OriginState& state) {
    // 策略 1: 负载最低、还有空余流的 HTTP/2 连接
    PoolEntry* best = nullptr;
    std::size_t min_load = std::numeric_limits<std::size_t>::max();
    for (auto& entry : state.entries) {
        const auto& conn = entry.connection;
        if (!conn->supports_multiplexing() || !conn->is_reusable()) {
            continue;
        }
        // 借出但还没打开流的调用者同样占用名额
        const std::size_t load = std::max(entry.borrowers, conn->get_active_streams());
        if (load < conn->get_max_concurrent_streams() && load < min_load) {
            best = &entry;
            min_load = load;
        }
    }
    if (best) {
        return best;
    }

    // 策略 2: 最近一次使用的空闲 HTTP/1.1 连接
    PoolEntry* most_recent = nullptr;
    for (auto& entry : state.entries) {
        if (entry.connection->supports_multiplexing() || entry.borrowers != 0 || !entry.connection->is_reusable()) {
            continue;
        }
        if (!most_recent || entry.idle_since > most_recent->idle_since) {
            most_recent = &entry;
        }
    }
    return most_recent;
}

ConnectionPool::PoolEntry* ConnectionPool::find_entry(const std::shared_ptr<IConnection>& conn) {
    const auto it = origins_.find(conn->get_pool_key());
    if (it == origins_.end()) {
        return nullptr;
    }
    for (auto& entry : it->second.entries) {
        if (entry.connection == conn) {
            return &entry;
        }
    }
    return nullptr;
}

/**
 * @brief 关闭并移除过期或失效的连接：
 * 1. 空闲时间超过 keepalive_expiry 的连接；
 * 2. 空闲但已经不能复用的连接 (对端关闭、Connection: close)；
 * 3. 不能再开新流的 HTTP/2 连接 (GOAWAY、连接级错误)，它上面的流已经全部终止。
 */
void ConnectionPool::sweep_expired() {
    const auto now = std::chrono::steady_clock::now();
    for (auto it = origins_.begin(); it != origins_.end();) {
        OriginState& state = it->second;
        std::size_t removed = 0;
        std::erase_if(state.entries, [&](const PoolEntry& entry) {
            const auto& conn = entry.connection;
            const bool idle = entry.borrowers == 0;
            const bool dead_h2 = conn->supports_multiplexing() && !conn->is_reusable();
            const bool broken = idle && !conn->is_reusable();
            const bool expired = idle && now - entry.idle_since >= limits_.keepalive_expiry;
            if (!dead_h2 && !broken && !expired) {
                return false;
            }
            SPDLOG_DEBUG("移除{}连接 [{}]-[{}]", expired ? "过期的" : "失效的", conn->id(), it->first);
            close_detached(conn);
            ++removed;
            return true;
        });
        for (std::size_t i = 0; i < removed; ++i) {
            wake_one(state);
        }

        if (state.entries.empty() && state.pending_creations == 0 && state.waiters.empty() && !state.h2_creation) {
            it = origins_.erase(it);
        } else {
            ++it;
        }
    }
}

void ConnectionPool::wake_one(OriginState& state) {
    if (state.waiters.empty()) {
        return;
    }
    const auto waiter = std::move(state.waiters.front());
    state.waiters.pop_front();
    waiter->notify(boost::system::error_code{});
}

void ConnectionPool::wake_all(OriginState& state) {
    for (const auto& waiter : state.waiters) {
        waiter->notify(boost::system::error_code{});
    }
    state.waiters.clear();
}

std::size_t ConnectionPool::idle_count_locked() const {
    std::size_t count = 0;
    for (const auto& state : origins_ | std::views::values) {
        count += std::ranges::count_if(state.entries, [](const PoolEntry& entry) { return entry.borrowers == 0; });
    }
    return count;
}

bool ConnectionPool::known_h2(const std::string& key) const {
    const auto it = protocols_.find(key);
    return it != protocols_.end() && it->second.version == HttpVersion::http_2 &&
           it->second.expires_at > std::chrono::steady_clock::now();
}

void ConnectionPool::close_detached(std::shared_ptr<IConnection> conn) {
    asio::co_spawn(
        executor_,
        // 这个 lambda 会捕获 conn 的拷贝，延长其生命周期
        [conn = std::move(conn)]() -> asio::awaitable<void> {
            try {
                co_await conn->close();
            } catch (const std::exception& e) {
                SPDLOG_WARN("[{}] 关闭时出现异常：{}", conn->id(), e.what());
            }
        },
        asio::detached);
}

/**
 * @brief 后台维护任务：按 maintenance_interval 定期清理过期连接。
 * 只持有 weak_ptr，连接池销毁或关闭后自动退出。
 */
asio::awaitable<void> ConnectionPool::maintenance_loop(std::weak_ptr<ConnectionPool> weak,
                                                       std::shared_ptr<asio::steady_timer> timer,
                                                       const std::chrono::milliseconds interval) {
    while (true) {
        timer->expires_after(interval);
        auto [ec] = co_await timer->async_wait(asio::as_tuple(asio::use_awaitable));
        if (ec) {
            co_return;
        }
        const auto self = weak.lock();
        if (!self || self->closed_) {
            co_return;
        }
        co_await asio::post(self->strand_, asio::use_awaitable);
        self->sweep_expired();
    }
}

} // namespace courier
