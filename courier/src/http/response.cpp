//
// Created by ubuntu on 2025/11/7.
//

#include <courier/http/response.hpp>

#include <boost/system/system_error.hpp>
#include <courier/error/courier_error.hpp>
#include <spdlog/spdlog.h>

namespace courier {

Response::Response(const unsigned status, std::string reason, const HttpVersion version, Headers headers,
                   std::unique_ptr<IBodyStream> body)
    : status_(status),
      reason_(std::move(reason)),
      version_(version),
      headers_(std::move(headers)),
      body_(std::make_shared<BodyState>()) {
    body_->stream = body ? std::move(body) : std::make_unique<BufferedBodyStream>(std::string{});
}

boost::asio::awaitable<std::optional<std::string>> Response::read_some() {
    if (!body_) {
        co_return std::nullopt;
    }
    if (body_->closed) {
        throw boost::system::system_error(courier_error::response::response_closed);
    }
    if (body_->content || body_->exhausted) {
        throw boost::system::system_error(courier_error::response::stream_consumed);
    }

    body_->started = true;
    std::optional<std::string> chunk = co_await body_->stream->next();
    if (!chunk) {
        body_->exhausted = true;
    }
    co_return chunk;
}

boost::asio::awaitable<std::string> Response::read() {
    if (!body_) {
        co_return std::string{};
    }
    if (body_->content) {
        co_return *body_->content;
    }
    if (body_->closed) {
        throw boost::system::system_error(courier_error::response::response_closed);
    }
    if (body_->started) {
        throw boost::system::system_error(courier_error::response::stream_consumed,
                                          "response body was partially streamed with read_some()");
    }

    body_->started = true;
    std::string content;
    while (std::optional<std::string> chunk = co_await body_->stream->next()) {
        content.append(*chunk);
    }
    body_->exhausted = true;
    body_->content = std::move(content);
    SPDLOG_TRACE("Response body read, {} bytes", body_->content->size());
    co_return *body_->content;
}

const std::string& Response::content() const {
    if (!body_ || !body_->content) {
        throw boost::system::system_error(courier_error::response::response_not_read,
                                          "call read() before accessing content()");
    }
    return *body_->content;
}

bool Response::is_read() const {
    return body_ && body_->content.has_value();
}

boost::asio::awaitable<void> Response::close() {
    if (!body_ || body_->closed) {
        co_return;
    }
    body_->closed = true;
    co_await body_->stream->close();
}

bool Response::is_closed() const {
    return body_ && body_->closed;
}

bool Response::is_redirect() const {
    switch (status_) {
        case 301:
        case 302:
        case 303:
        case 307:
        case 308:
            return headers_.find(http::field::location) != headers_.end();
        default:
            return false;
    }
}

void Response::raise_for_status() const {
    if (status_ < 400) {
        return;
    }
    const char* kind = status_ < 500 ? "Client error" : "Server error";
    std::string message = std::string(kind) + " '" + std::to_string(status_) + " " + reason_ + "'";
    if (request_) {
        message += " for url '" + request_->url() + "'";
    }
    throw boost::system::system_error(courier_error::response::http_status, message);
}

} // namespace courier
