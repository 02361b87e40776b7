//
// Created by ubuntu on 2025/11/7.
//

#ifndef COURIER_NETWORK_CONSTANTS_HPP
#define COURIER_NETWORK_CONSTANTS_HPP
#include <boost/asio/ssl/context.hpp>
#include <openssl/ssl.h>
#include <span>

namespace courier::network {
    namespace alpn {
        // inline constexpr 保证多个翻译单元包含时只保留一份副本

        // 同时支持H1.1 H2，h2 优先
        inline constexpr unsigned char PROTOS_H2_PREFERRED[] = {
            2, 'h', '2',
            8, 'h', 't', 't', 'p', '/', '1', '.', '1'
        };

        // 只支持 HTTP/1.1
        inline constexpr unsigned char PROTOS_H1_ONLY[] = {
            8, 'h', 't', 't', 'p', '/', '1', '.', '1'
        };

        inline std::span<const unsigned char> get_alpn_protos(const bool http2_enabled) {
            if (http2_enabled) {
                return PROTOS_H2_PREFERRED;
            }
            return PROTOS_H1_ONLY;
        }
    } // namespace alpn

    // --- TLS/SSL 相关常量 ---
    namespace ssl {

        /**
         * @brief 现代加密套件列表 (Mozilla Intermediate, TLS 1.2 & 1.3)。
         *
         * 优先 TLS 1.3 的套件，然后是支持前向保密 (ECDHE/DHE) 且使用 AES-GCM / ChaCha20-Poly1305 的 TLS 1.2 套件。
         */
        inline constexpr auto CIPHER_SUITES =
            "TLS_AES_128_GCM_SHA256:"
            "TLS_AES_256_GCM_SHA384:"
            "TLS_CHACHA20_POLY1305_SHA256:"
            "ECDHE-ECDSA-AES128-GCM-SHA256:"
            "ECDHE-RSA-AES128-GCM-SHA256:"
            "ECDHE-ECDSA-AES256-GCM-SHA384:"
            "ECDHE-RSA-AES256-GCM-SHA384:"
            "ECDHE-ECDSA-CHACHA20-POLY1305:"
            "ECDHE-RSA-CHACHA20-POLY1305:"
            "DHE-RSA-AES128-GCM-SHA256:"
            "DHE-RSA-AES256-GCM-SHA384:"
            "DHE-RSA-CHACHA20-POLY1305";

        /**
         * @brief 禁用 SSLv2 / SSLv3 / TLSv1.0 / TLSv1.1，只允许 TLSv1.2 和 TLSv1.3。
         */
        inline constexpr boost::asio::ssl::context::options CONTEXT_OPTIONS =
            // 使用 Boost.Asio 推荐的默认变通方法
            boost::asio::ssl::context::default_workarounds |
            // 禁用已被认为不安全的旧协议
            boost::asio::ssl::context::no_sslv2 |
            boost::asio::ssl::context::no_sslv3 |
            boost::asio::ssl::context::no_tlsv1 |
            boost::asio::ssl::context::no_tlsv1_1 |
            // 每次都使用新的 Diffie-Hellman 密钥
            boost::asio::ssl::context::single_dh_use;

    } // namespace ssl

} // namespace courier::network
#endif //COURIER_NETWORK_CONSTANTS_HPP
