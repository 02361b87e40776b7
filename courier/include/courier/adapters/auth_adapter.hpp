//
// Created by ubuntu on 2025/11/11.
//

#ifndef COURIER_AUTH_ADAPTER_HPP
#define COURIER_AUTH_ADAPTER_HPP

#include <cstddef>
#include <memory>

#include <courier/adapters/adapter.hpp>
#include <courier/adapters/auth.hpp>

namespace courier {

/**
 * @brief 收到 401 时向认证策略要一个 Authorization 头，并通过 next 重试。
 *
 * 最多重试 max_retries 次，之后的 401 原样返回给调用者。
 * 没有配置策略时直接透传。
 *
 * @throws system_error auth_failed 策略无法回应给出的质询；
 *         request_body_unavailable 需要重放的流式请求体已经被消费。
 */
class AuthAdapter final : public Adapter {
public:
    AuthAdapter(std::shared_ptr<IAuthStrategy> strategy, std::size_t max_retries);

    boost::asio::awaitable<Response> handle(Request request, Next next) override;

    [[nodiscard]] std::string_view name() const override { return "auth"; }

private:
    std::shared_ptr<IAuthStrategy> strategy_;
    std::size_t max_retries_;
};

} // namespace courier

#endif //COURIER_AUTH_ADAPTER_HPP
