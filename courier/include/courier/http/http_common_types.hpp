//
// Created by ubuntu on 2025/11/6.
//

#ifndef COURIER_HTTP_COMMON_TYPES_HPP
#define COURIER_HTTP_COMMON_TYPES_HPP
#include <boost/beast/http.hpp>
#include <string_view>

namespace courier {

namespace http = boost::beast::http;

/// 大小写不敏感、允许重复字段的头部容器
using Headers = http::fields;

/// 一条连接在整个生命周期内使用的协议，由 ALPN (或 h2 prior knowledge) 决定一次，之后不再改变
enum class HttpVersion {
    http_1_1,
    http_2
};

inline std::string_view to_string(const HttpVersion version) {
    return version == HttpVersion::http_2 ? "HTTP/2" : "HTTP/1.1";
}

} // namespace courier

#endif //COURIER_HTTP_COMMON_TYPES_HPP
