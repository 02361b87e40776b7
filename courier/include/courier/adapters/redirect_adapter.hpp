//
// Created by ubuntu on 2025/11/10.
//

#ifndef COURIER_REDIRECT_ADAPTER_HPP
#define COURIER_REDIRECT_ADAPTER_HPP

#include <boost/system/system_error.hpp>
#include <cstddef>
#include <string>
#include <vector>

#include <courier/adapters/adapter.hpp>

namespace courier {

/**
 * @brief 超过最大重定向次数时抛出，error code 为 too_many_redirects。
 * history() 按时间顺序保存了已经收到的所有重定向响应。
 */
class RedirectError : public boost::system::system_error {
public:
    RedirectError(std::vector<Response> history, const std::string& message);

    [[nodiscard]] const std::vector<Response>& history() const { return history_; }

private:
    std::vector<Response> history_;
};

/**
 * @brief 跟随 3xx + Location 的重定向。
 *
 * - 303 改为 GET (HEAD 保持 HEAD)，301 / 302 把 POST 改为 GET，307 / 308 保留方法和请求体；
 * - 丢弃请求体时同时丢弃 Content-* 头；
 * - 跨 Origin 时去掉 Authorization (同主机从 http 升级到 https 除外)；
 * - 需要重放的流式请求体已经被消费时抛出 request_body_unavailable；
 * - 请求的 allow_redirects 为 false 时直接返回 3xx 响应。
 *
 * 重定向响应的响应体会被读完，这样连接可以回到连接池。最终响应的 history() 不包含它自己。
 */
class RedirectAdapter final : public Adapter {
public:
    explicit RedirectAdapter(std::size_t max_redirects);

    boost::asio::awaitable<Response> handle(Request request, Next next) override;

    [[nodiscard]] std::string_view name() const override { return "redirect"; }

    /**
     * @brief 根据重定向响应构造下一跳请求。
     * @throws system_error request_body_unavailable 需要重放的流式请求体已经被消费。
     * @throws std::invalid_argument Location 不是受支持的 http / https URL。
     */
    static Request build_redirect_request(const Request& request, unsigned status, const std::string& location);

private:
    std::size_t max_redirects_;
};

} // namespace courier

#endif //COURIER_REDIRECT_ADAPTER_HPP
