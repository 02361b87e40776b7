//
// Created by ubuntu on 2025/11/11.
//

#include <courier/adapters/auth_adapter.hpp>

#include <courier/error/courier_error.hpp>
#include <spdlog/spdlog.h>

namespace courier {

AuthAdapter::AuthAdapter(std::shared_ptr<IAuthStrategy> strategy, const std::size_t max_retries)
    : strategy_(std::move(strategy)),
      max_retries_(max_retries) {
}

boost::asio::awaitable<Response> AuthAdapter::handle(Request request, Next next) {
    Response response = co_await next(request);
    if (!strategy_) {
        co_return response;
    }

    for (std::size_t attempt = 0; response.status() == 401 && attempt < max_retries_; ++attempt) {
        std::optional<std::string> authorization = strategy_->respond(request, response);
        if (!authorization) {
            const std::string challenge(response.headers()[http::field::www_authenticate]);
            SPDLOG_WARN("Auth strategy cannot answer challenge '{}' from {}", challenge, request.origin().key());
            co_await response.close();
            throw boost::system::system_error(courier_error::adapter::auth_failed,
                                              "Cannot answer authentication challenge '" + challenge + "' from " +
                                              request.origin().key());
        }
        if (!request.body().is_replayable()) {
            co_await response.close();
            throw boost::system::system_error(courier_error::adapter::request_body_unavailable,
                                              "Cannot retry " + request.url() +
                                              " with credentials: streamed request body was already consumed");
        }

        // 读完 401 的响应体，连接随之归还
        co_await response.read();
        SPDLOG_DEBUG("Retrying {} with credentials (attempt {}/{})", request.url(), attempt + 1, max_retries_);
        response = co_await next(request.with_header(http::field::authorization, *authorization));
    }
    co_return response;
}

} // namespace courier
