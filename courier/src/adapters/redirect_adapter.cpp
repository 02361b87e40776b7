//
// Created by ubuntu on 2025/11/10.
//

#include <courier/adapters/redirect_adapter.hpp>

#include <courier/error/courier_error.hpp>
#include <courier/http/origin.hpp>
#include <spdlog/spdlog.h>

namespace courier {

namespace {

/// 同一个 Origin，或者同主机、默认端口下从 http 升级到 https
bool keeps_credentials(const Origin& from, const Origin& to) {
    if (from == to) {
        return true;
    }
    return from.host() == to.host() && from.scheme() == "http" && to.scheme() == "https" &&
           from.is_default_port() && to.is_default_port();
}

} // namespace

RedirectError::RedirectError(std::vector<Response> history, const std::string& message)
    : boost::system::system_error(courier_error::adapter::too_many_redirects, message),
      history_(std::move(history)) {
}

RedirectAdapter::RedirectAdapter(const std::size_t max_redirects)
    : max_redirects_(max_redirects) {
}

Request RedirectAdapter::build_redirect_request(const Request& request, const unsigned status, const std::string& location) {
    Request next = request.with_url(location);

    // 1. 方法变换
    http::verb method = request.method();
    if (status == 303 && method != http::verb::head) {
        method = http::verb::get;
    } else if ((status == 301 || status == 302) && method == http::verb::post) {
        method = http::verb::get;
    }

    // 2. 请求体：改成 GET 的请求不再携带请求体，307 / 308 原样重放
    if (method != request.method() || status == 303) {
        next = next.with_method(method)
                   .with_body(RequestBody{})
                   .without_header(http::field::content_length)
                   .without_header(http::field::content_type)
                   .without_header(http::field::content_encoding)
                   .without_header(http::field::transfer_encoding);
    } else if (!request.body().is_replayable()) {
        throw boost::system::system_error(courier_error::adapter::request_body_unavailable,
                                          "Cannot follow " + std::to_string(status) + " redirect to '" + location +
                                          "': streamed request body was already consumed");
    }

    // 3. Host 由连接按新的 Origin 重新生成；凭据不跨 Origin
    next = next.without_header(http::field::host);
    if (!keeps_credentials(request.origin(), next.origin())) {
        next = next.without_header(http::field::authorization);
    }
    return next;
}

boost::asio::awaitable<Response> RedirectAdapter::handle(Request request, Next next) {
    std::vector<Response> history;
    Request current = std::move(request);

    while (true) {
        Response response = co_await next(current);
        if (!current.allow_redirects() || !response.is_redirect()) {
            response.set_history(std::move(history));
            co_return response;
        }

        // 读完重定向响应的响应体，连接随之归还
        co_await response.read();

        if (history.size() >= max_redirects_) {
            SPDLOG_WARN("Too many redirects ({}), last location '{}'", max_redirects_,
                        std::string(response.headers()[http::field::location]));
            history.push_back(std::move(response));
            throw RedirectError(std::move(history),
                                "Exceeded maximum of " + std::to_string(max_redirects_) + " redirects");
        }

        const std::string location = resolve_url(current.url(), std::string(response.headers()[http::field::location]));
        SPDLOG_DEBUG("Following {} redirect: {} -> {}", response.status(), current.url(), location);
        Request redirected = build_redirect_request(current, response.status(), location);

        history.push_back(std::move(response));
        current = std::move(redirected);
    }
}

} // namespace courier
