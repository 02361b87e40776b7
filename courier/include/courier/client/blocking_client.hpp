//
// Created by ubuntu on 2025/11/12.
//

#ifndef COURIER_BLOCKING_CLIENT_HPP
#define COURIER_BLOCKING_CLIENT_HPP

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <courier/client/http_client.hpp>

namespace courier {

namespace detail {

/**
 * @brief 阻塞客户端自己的 I/O 线程。最后一个引用释放时停止并回收线程。
 */
struct IoRuntime {
    IoRuntime();
    ~IoRuntime();

    IoRuntime(const IoRuntime&) = delete;
    IoRuntime& operator=(const IoRuntime&) = delete;

    /// 在 I/O 线程上运行 task，阻塞调用线程直到完成
    template <typename T>
    T block_on(boost::asio::awaitable<T> task) {
        if (context.get_executor().running_in_this_thread()) {
            throw std::logic_error("blocking call made from the I/O thread would deadlock");
        }
        return boost::asio::co_spawn(context, std::move(task), boost::asio::use_future).get();
    }

    boost::asio::io_context context{1};
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work;
    std::thread thread;
};

} // namespace detail

/**
 * @brief 阻塞客户端返回的响应，读取响应体会阻塞调用线程。
 *
 * 只能移动。析构时底层响应被交给 I/O 线程销毁，借用的连接在那里归还。
 */
class BlockingResponse {
public:
    BlockingResponse(std::shared_ptr<detail::IoRuntime> runtime, Response response);
    ~BlockingResponse();

    BlockingResponse(BlockingResponse&&) noexcept = default;
    BlockingResponse& operator=(BlockingResponse&&) noexcept = default;
    BlockingResponse(const BlockingResponse&) = delete;
    BlockingResponse& operator=(const BlockingResponse&) = delete;

    [[nodiscard]] unsigned status() const { return response_->status(); }
    [[nodiscard]] const std::string& reason() const { return response_->reason(); }
    [[nodiscard]] std::string_view protocol() const { return response_->protocol(); }
    [[nodiscard]] const Headers& headers() const { return response_->headers(); }
    [[nodiscard]] const std::vector<Response>& history() const { return response_->history(); }
    [[nodiscard]] const std::shared_ptr<const Request>& request() const { return response_->request(); }
    [[nodiscard]] bool is_redirect() const { return response_->is_redirect(); }
    void raise_for_status() const { response_->raise_for_status(); }

    /// 阻塞读取下一个响应体分块，结尾返回 std::nullopt
    std::optional<std::string> read_some();
    /// 阻塞读取完整响应体
    std::string read();
    [[nodiscard]] const std::string& content() const { return response_->content(); }
    /// 阻塞关闭响应
    void close();

    /// 底层的协程响应，只能在 I/O 线程上读取
    [[nodiscard]] const Response& response() const { return *response_; }

private:
    std::shared_ptr<detail::IoRuntime> runtime_;
    std::unique_ptr<Response> response_;
};

/**
 * @brief 阻塞客户端。
 *
 * 一个自有的 I/O 线程驱动协程核心，调用线程通过 future 阻塞等待结果。
 * 多个调用线程可以共享同一个客户端 (以及它的连接池)。
 * 不能在 I/O 线程上 (例如请求体生产者内部) 调用阻塞方法。
 */
class BlockingClient {
public:
    explicit BlockingClient(ClientOptions options = {});
    ~BlockingClient();

    BlockingClient(const BlockingClient&) = delete;
    BlockingClient& operator=(const BlockingClient&) = delete;

    BlockingResponse send(Request request);
    BlockingResponse request(http::verb method, const std::string& url, Headers headers = {}, RequestBody body = {});

    BlockingResponse get(const std::string& url, Headers headers = {});
    BlockingResponse post(const std::string& url, RequestBody body = {}, Headers headers = {});
    BlockingResponse put(const std::string& url, RequestBody body = {}, Headers headers = {});
    BlockingResponse patch(const std::string& url, RequestBody body = {}, Headers headers = {});
    BlockingResponse del(const std::string& url, Headers headers = {});
    BlockingResponse head(const std::string& url, Headers headers = {});
    BlockingResponse options(const std::string& url, Headers headers = {});

    /// 关闭连接池。可重复调用
    void close();

    [[nodiscard]] HttpClient& client() { return *client_; }

private:
    std::shared_ptr<detail::IoRuntime> runtime_;
    std::unique_ptr<HttpClient> client_;
};

} // namespace courier

#endif //COURIER_BLOCKING_CLIENT_HPP
