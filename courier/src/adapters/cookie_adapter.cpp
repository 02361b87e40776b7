//
// Created by ubuntu on 2025/11/10.
//

#include <courier/adapters/cookie_adapter.hpp>

#include <stdexcept>

namespace courier {

namespace {

/// target 去掉 query 之后的路径部分
std::string_view path_of(const std::string& target) {
    const std::string_view view(target);
    return view.substr(0, view.find('?'));
}

} // namespace

CookieAdapter::CookieAdapter(std::shared_ptr<ICookieStore> store)
    : store_(std::move(store)) {
    if (!store_) {
        throw std::invalid_argument("CookieAdapter requires a cookie store");
    }
}

boost::asio::awaitable<Response> CookieAdapter::handle(Request request, Next next) {
    const std::string_view path = path_of(request.target());

    Request outgoing = request;
    if (const std::string jar_cookies = store_->cookie_header(request.origin(), path); !jar_cookies.empty()) {
        const std::string_view existing = request.headers()[http::field::cookie];
        outgoing = request.with_header(http::field::cookie,
                                       existing.empty() ? jar_cookies : std::string(existing) + "; " + jar_cookies);
    }

    Response response = co_await next(std::move(outgoing));

    const auto [first, last] = response.headers().equal_range(http::field::set_cookie);
    for (auto it = first; it != last; ++it) {
        store_->store(request.origin(), path, it->value());
    }
    co_return response;
}

} // namespace courier
