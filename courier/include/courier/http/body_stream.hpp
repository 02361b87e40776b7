//
// Created by ubuntu on 2025/11/7.
//

#ifndef COURIER_BODY_STREAM_HPP
#define COURIER_BODY_STREAM_HPP

#include <boost/asio/awaitable.hpp>
#include <optional>
#include <string>

namespace courier {

/**
 * @interface IBodyStream
 * @brief 一次性的响应体流。
 *
 * next() 依次返回响应体的分块，std::nullopt 表示结束。
 * 在结束之前 close() 或析构，表示调用者放弃了这次交换，实现必须让底层连接回到合法状态。
 */
class IBodyStream {
public:
    virtual ~IBodyStream() = default;

    virtual boost::asio::awaitable<std::optional<std::string>> next() = 0;

    virtual boost::asio::awaitable<void> close() = 0;

    /// 响应体是否已经读到结尾
    [[nodiscard]] virtual bool is_complete() const = 0;
};

/**
 * @brief 已经完整缓存在内存里的响应体 (HTTP/2 响应、无响应体的响应)。
 */
class BufferedBodyStream final : public IBodyStream {
public:
    explicit BufferedBodyStream(std::string data) : data_(std::move(data)), done_(data_.empty()) {}

    boost::asio::awaitable<std::optional<std::string>> next() override {
        if (done_) {
            co_return std::nullopt;
        }
        done_ = true;
        co_return std::move(data_);
    }

    boost::asio::awaitable<void> close() override {
        done_ = true;
        data_.clear();
        co_return;
    }

    [[nodiscard]] bool is_complete() const override { return done_; }

private:
    std::string data_;
    bool done_;
};

} // namespace courier

#endif //COURIER_BODY_STREAM_HPP
