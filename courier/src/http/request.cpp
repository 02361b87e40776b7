//
// Created by ubuntu on 2025/11/6.
//

#include <courier/http/request.hpp>

namespace courier {

namespace {
const std::string empty_body_data;
}

RequestBody::RequestBody(std::string data)
    : data_(std::make_shared<const std::string>(std::move(data))) {
}

RequestBody RequestBody::stream(Producer producer) {
    RequestBody body;
    body.stream_ = std::make_shared<StreamState>();
    body.stream_->producer = std::move(producer);
    return body;
}

std::optional<std::size_t> RequestBody::content_length() const {
    if (stream_) {
        return std::nullopt;
    }
    return data_ ? data_->size() : 0;
}

bool RequestBody::empty() const {
    return !stream_ && (!data_ || data_->empty());
}

bool RequestBody::is_replayable() const {
    return !stream_ || !stream_->started;
}

const std::string& RequestBody::data() const {
    return data_ ? *data_ : empty_body_data;
}

std::optional<std::string> RequestBody::next_chunk() const {
    if (!stream_ || stream_->finished) {
        return std::nullopt;
    }
    stream_->started = true;
    if (!stream_->producer) {
        stream_->finished = true;
        return std::nullopt;
    }
    // 空分块在 chunked 编码里表示结束，这里直接跳过，只有 nullopt 才算结束
    while (true) {
        std::optional<std::string> chunk = stream_->producer();
        if (!chunk) {
            stream_->finished = true;
            return std::nullopt;
        }
        if (!chunk->empty()) {
            return chunk;
        }
    }
}

Request::Request(const http::verb method, std::string url, Headers headers, RequestBody body)
    : method_(method),
      url_(std::move(url)),
      headers_(std::move(headers)),
      body_(std::move(body)) {
    ParsedUrl parsed = parse_url(url_);
    origin_ = std::move(parsed.origin);
    target_ = std::move(parsed.target);
}

Request Request::with_url(std::string url) const {
    Request copy = *this;
    ParsedUrl parsed = parse_url(url);
    copy.url_ = std::move(url);
    copy.origin_ = std::move(parsed.origin);
    copy.target_ = std::move(parsed.target);
    return copy;
}

Request Request::with_method(const http::verb method) const {
    Request copy = *this;
    copy.method_ = method;
    return copy;
}

Request Request::with_headers(Headers headers) const {
    Request copy = *this;
    copy.headers_ = std::move(headers);
    return copy;
}

Request Request::with_header(const http::field name, const std::string_view value) const {
    Request copy = *this;
    copy.headers_.set(name, value);
    return copy;
}

Request Request::with_header(const std::string_view name, const std::string_view value) const {
    Request copy = *this;
    copy.headers_.set(name, value);
    return copy;
}

Request Request::without_header(const http::field name) const {
    Request copy = *this;
    copy.headers_.erase(name);
    return copy;
}

Request Request::with_body(RequestBody body) const {
    Request copy = *this;
    copy.body_ = std::move(body);
    return copy;
}

Request Request::with_proxy(std::optional<std::string> proxy_url) const {
    Request copy = *this;
    copy.proxy_ = std::move(proxy_url);
    return copy;
}

Request Request::with_ca_bundle(std::optional<std::string> path) const {
    Request copy = *this;
    copy.ca_bundle_ = std::move(path);
    return copy;
}

Request Request::with_allow_redirects(const bool allow) const {
    Request copy = *this;
    copy.allow_redirects_ = allow;
    return copy;
}

} // namespace courier
