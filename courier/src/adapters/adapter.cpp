//
// Created by ubuntu on 2025/11/10.
//

#include <courier/adapters/adapter.hpp>

#include <stdexcept>

namespace courier {

AdapterPipeline::AdapterPipeline(std::vector<std::shared_ptr<Adapter>> adapters, Next terminal)
    : adapters_(std::move(adapters)),
      terminal_(std::move(terminal)) {
    if (!terminal_) {
        throw std::invalid_argument("AdapterPipeline requires a terminal sender");
    }
    for (const auto& adapter : adapters_) {
        if (!adapter) {
            throw std::invalid_argument("AdapterPipeline does not accept null adapters");
        }
    }
}

boost::asio::awaitable<Response> AdapterPipeline::send(Request request) const {
    co_return co_await dispatch(0, std::move(request));
}

std::vector<std::string> AdapterPipeline::names() const {
    std::vector<std::string> names;
    names.reserve(adapters_.size());
    for (const auto& adapter : adapters_) {
        names.emplace_back(adapter->name());
    }
    return names;
}

boost::asio::awaitable<Response> AdapterPipeline::dispatch(const std::size_t index, Request request) const {
    if (index == adapters_.size()) {
        co_return co_await terminal_(std::move(request));
    }
    // 每次调用 next 都会从下一个适配器重新走一遍，重试和重定向因此能再次经过内层适配器
    Next next = [this, index](Request inner) {
        return dispatch(index + 1, std::move(inner));
    };
    co_return co_await adapters_[index]->handle(std::move(request), std::move(next));
}

} // namespace courier
