//
// Created by ubuntu on 2025/11/4.
//

#ifndef COURIER_VERSION_HPP
#define COURIER_VERSION_HPP

#include <string_view>

namespace courier::framework {
    constexpr std::string_view name = "courier";
    constexpr std::string_view version = "1.0.0";
    /// 默认的 User-Agent 头
    constexpr std::string_view user_agent = "courier/1.0.0";
}
#endif //COURIER_VERSION_HPP
