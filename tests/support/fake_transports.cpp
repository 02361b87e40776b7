//
// Created by ubuntu on 2025/11/13.
//

#include "support/test_support.hpp"

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/error.hpp>

namespace courier::test {

namespace asio = boost::asio;

asio::awaitable<TransportStream> HangingTransport::connect(const Origin&, const ConnectOptions&,
                                                           std::chrono::milliseconds) {
    // 等到被取消为止 (连接池的超时赛跑会取消它)
    asio::steady_timer timer(co_await asio::this_coro::executor);
    timer.expires_after(std::chrono::hours(1));
    co_await timer.async_wait(asio::use_awaitable);
    throw boost::system::system_error(asio::error::timed_out, "hanging transport gave up");
}

asio::awaitable<TransportStream> StallingTransport::connect(const Origin& origin, const ConnectOptions& options,
                                                            const std::chrono::milliseconds timeout) {
    if (++attempts <= stalls_) {
        HangingTransport hanging;
        co_return co_await hanging.connect(origin, options, timeout);
    }
    co_return co_await inner_->connect(origin, options, timeout);
}

asio::awaitable<TransportStream> FailingTransport::connect(const Origin& origin, const ConnectOptions&,
                                                           std::chrono::milliseconds) {
    ++attempts;
    throw boost::system::system_error(asio::error::connection_refused, "refused by test transport for " + origin.key());
    co_return TransportStream{};
}

} // namespace courier::test
