//
// Created by ubuntu on 2025/11/12.
//

#include <courier/client/blocking_client.hpp>

#include <boost/asio/post.hpp>
#include <courier/utils/thread_utils.hpp>
#include <spdlog/spdlog.h>

namespace courier {

namespace detail {

IoRuntime::IoRuntime()
    : work(boost::asio::make_work_guard(context)) {
    thread = std::thread([this] {
        ThreadUtils::set_current_thread_name("courier-io");
        SPDLOG_DEBUG("Blocking client I/O thread started");
        context.run();
        SPDLOG_DEBUG("Blocking client I/O thread stopped");
    });
}

IoRuntime::~IoRuntime() {
    work.reset();
    context.stop();
    if (thread.joinable()) {
        thread.join();
    }
}

} // namespace detail

// ------------------------------------------------
// BlockingResponse
// ------------------------------------------------
BlockingResponse::BlockingResponse(std::shared_ptr<detail::IoRuntime> runtime, Response response)
    : runtime_(std::move(runtime)),
      response_(std::make_unique<Response>(std::move(response))) {
}

BlockingResponse::~BlockingResponse() {
    if (!response_ || !runtime_) {
        return;
    }
    // 响应体的析构会归还 / 关闭连接，必须发生在 I/O 线程上
    boost::asio::post(runtime_->context, [response = std::shared_ptr<Response>(std::move(response_))] {});
}

std::optional<std::string> BlockingResponse::read_some() {
    return runtime_->block_on(response_->read_some());
}

std::string BlockingResponse::read() {
    return runtime_->block_on(response_->read());
}

void BlockingResponse::close() {
    runtime_->block_on(response_->close());
}

// ------------------------------------------------
// BlockingClient
// ------------------------------------------------
BlockingClient::BlockingClient(ClientOptions options)
    : runtime_(std::make_shared<detail::IoRuntime>()),
      client_(std::make_unique<HttpClient>(runtime_->context.get_executor(), std::move(options))) {
}

/**
 * @brief 关闭连接池，然后在 I/O 线程上销毁客户端。
 * 仍然存活的 BlockingResponse 会让 I/O 线程继续运行，直到它们被销毁。
 */
BlockingClient::~BlockingClient() {
    try {
        close();
        boost::asio::post(runtime_->context, boost::asio::use_future([this] { client_.reset(); })).get();
    } catch (const std::exception& e) {
        SPDLOG_WARN("Shutting down blocking client failed: {}", e.what());
    }
}

BlockingResponse BlockingClient::send(Request request) {
    Response response = runtime_->block_on(client_->send(std::move(request)));
    return BlockingResponse(runtime_, std::move(response));
}

BlockingResponse BlockingClient::request(const http::verb method, const std::string& url, Headers headers, RequestBody body) {
    return send(Request(method, url, std::move(headers), std::move(body)));
}

BlockingResponse BlockingClient::get(const std::string& url, Headers headers) {
    return request(http::verb::get, url, std::move(headers));
}

BlockingResponse BlockingClient::post(const std::string& url, RequestBody body, Headers headers) {
    return request(http::verb::post, url, std::move(headers), std::move(body));
}

BlockingResponse BlockingClient::put(const std::string& url, RequestBody body, Headers headers) {
    return request(http::verb::put, url, std::move(headers), std::move(body));
}

BlockingResponse BlockingClient::patch(const std::string& url, RequestBody body, Headers headers) {
    return request(http::verb::patch, url, std::move(headers), std::move(body));
}

BlockingResponse BlockingClient::del(const std::string& url, Headers headers) {
    return request(http::verb::delete_, url, std::move(headers));
}

BlockingResponse BlockingClient::head(const std::string& url, Headers headers) {
    return request(http::verb::head, url, std::move(headers));
}

BlockingResponse BlockingClient::options(const std::string& url, Headers headers) {
    return request(http::verb::options, url, std::move(headers));
}

void BlockingClient::close() {
    if (client_) {
        runtime_->block_on(client_->close());
    }
}

} // namespace courier
