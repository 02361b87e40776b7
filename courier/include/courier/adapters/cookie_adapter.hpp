//
// Created by ubuntu on 2025/11/10.
//

#ifndef COURIER_COOKIE_ADAPTER_HPP
#define COURIER_COOKIE_ADAPTER_HPP

#include <memory>

#include <courier/adapters/adapter.hpp>
#include <courier/adapters/cookie_jar.hpp>

namespace courier {

/**
 * @brief 把 cookie 存储里匹配的 cookie 合并进 Cookie 头，并保存响应里的 Set-Cookie。
 * 请求上原有的 Cookie 头保留在前面。
 */
class CookieAdapter final : public Adapter {
public:
    explicit CookieAdapter(std::shared_ptr<ICookieStore> store);

    boost::asio::awaitable<Response> handle(Request request, Next next) override;

    [[nodiscard]] std::string_view name() const override { return "cookie"; }

    [[nodiscard]] const std::shared_ptr<ICookieStore>& store() const { return store_; }

private:
    std::shared_ptr<ICookieStore> store_;
};

} // namespace courier

#endif //COURIER_COOKIE_ADAPTER_HPP
