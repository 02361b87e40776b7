//
// Created by ubuntu on 2025/11/12.
//

#ifndef COURIER_IHTTP_CLIENT_HPP
#define COURIER_IHTTP_CLIENT_HPP

#include <boost/asio/awaitable.hpp>
#include <string>

#include <courier/http/http_common_types.hpp>
#include <courier/http/request.hpp>
#include <courier/http/response.hpp>

namespace courier {

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // 1. 核心虚函数接口

    /// 发送一个完整描述的请求，经过整个适配器链
    virtual boost::asio::awaitable<Response> send(Request request) = 0;

    /// 按方法 + URL 构造请求并发送
    virtual boost::asio::awaitable<Response> request(http::verb method, std::string url, Headers headers, RequestBody body) = 0;

    // 2. 与 HTTP 方法一一对应的便捷版本，实现是固定的，所以是非虚的

    boost::asio::awaitable<Response> get(std::string url, Headers headers = {}) {
        return request(http::verb::get, std::move(url), std::move(headers), {});
    }

    boost::asio::awaitable<Response> post(std::string url, RequestBody body = {}, Headers headers = {}) {
        return request(http::verb::post, std::move(url), std::move(headers), std::move(body));
    }

    boost::asio::awaitable<Response> put(std::string url, RequestBody body = {}, Headers headers = {}) {
        return request(http::verb::put, std::move(url), std::move(headers), std::move(body));
    }

    boost::asio::awaitable<Response> patch(std::string url, RequestBody body = {}, Headers headers = {}) {
        return request(http::verb::patch, std::move(url), std::move(headers), std::move(body));
    }

    boost::asio::awaitable<Response> del(std::string url, Headers headers = {}) {
        return request(http::verb::delete_, std::move(url), std::move(headers), {});
    }

    boost::asio::awaitable<Response> head(std::string url, Headers headers = {}) {
        return request(http::verb::head, std::move(url), std::move(headers), {});
    }

    boost::asio::awaitable<Response> options(std::string url, Headers headers = {}) {
        return request(http::verb::options, std::move(url), std::move(headers), {});
    }
};

} // namespace courier

#endif //COURIER_IHTTP_CLIENT_HPP
