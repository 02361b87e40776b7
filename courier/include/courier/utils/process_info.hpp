//
// Created by ubuntu on 2025/11/5.
//

#ifndef COURIER_PROCESS_INFO_HPP
#define COURIER_PROCESS_INFO_HPP

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>
#include <unistd.h>

namespace courier {

/**
 * @class ProcessInfo
 * @brief 进程级别的标识，用于拼装在日志里可区分的连接 ID。
 */
class ProcessInfo {
public:
    /**
     * @brief 获取当前进程的前缀，例如 "12345-"。第一次调用时生成，之后返回缓存值。
     */
    static const std::string& get_prefix() {
        static const std::string prefix = std::to_string(getpid()) + "-";
        return prefix;
    }

    /**
     * @brief 生成连接 ID，形如 "conn-h1-12345-7"。
     * @param protocol_tag 协议标签，"h1" 或 "h2"。
     */
    static std::string next_connection_id(const std::string_view protocol_tag) {
        static std::atomic<uint64_t> counter = 0;
        std::string id = "conn-";
        id.append(protocol_tag);
        id.push_back('-');
        id.append(get_prefix());
        id.append(std::to_string(counter.fetch_add(1, std::memory_order_relaxed) + 1));
        return id;
    }
};

} // namespace courier
#endif //COURIER_PROCESS_INFO_HPP
