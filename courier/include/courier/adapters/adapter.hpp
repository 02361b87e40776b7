//
// Created by ubuntu on 2025/11/10.
//

#ifndef COURIER_ADAPTER_HPP
#define COURIER_ADAPTER_HPP

#include <boost/asio/awaitable.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <courier/http/request.hpp>
#include <courier/http/response.hpp>

namespace courier {

/**
 * @brief 链上的"下一跳"。
 *
 * 适配器通过调用 Next 把请求交给内层，可以调用零次 (短路)、一次或多次 (重定向、认证重试)。
 * 它可以包装任何可调用对象，只要签名匹配。
 */
using Next = std::function<boost::asio::awaitable<Response>(Request)>;

/**
 * @interface Adapter
 * @brief 请求 / 响应中间件。
 *
 * 适配器从不修改传进来的 Request，需要改动时用 with_* 生成新的副本交给 next。
 */
class Adapter {
public:
    virtual ~Adapter() = default;

    virtual boost::asio::awaitable<Response> handle(Request request, Next next) = 0;

    /// 日志和调试使用的名字
    [[nodiscard]] virtual std::string_view name() const = 0;
};

/**
 * @brief 固定顺序的适配器链，最内层是连接池发送函数。
 *
 * adapters[0] 在最外层，先看到请求、最后看到响应。
 */
class AdapterPipeline {
public:
    AdapterPipeline(std::vector<std::shared_ptr<Adapter>> adapters, Next terminal);

    boost::asio::awaitable<Response> send(Request request) const;

    /// 由外到内的适配器名字
    [[nodiscard]] std::vector<std::string> names() const;

private:
    boost::asio::awaitable<Response> dispatch(std::size_t index, Request request) const;

    std::vector<std::shared_ptr<Adapter>> adapters_;
    Next terminal_;
};

} // namespace courier

#endif //COURIER_ADAPTER_HPP
