//
// Created by ubuntu on 2025/11/11.
//

#include <courier/adapters/auth.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace courier {

namespace {

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::ranges::transform(result, result.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string to_upper(std::string_view s) {
    std::string result(s);
    std::ranges::transform(result, result.begin(), [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::string base64_encode(const std::string& input) {
    BIO* bmem = BIO_new(BIO_s_mem());
    BIO* b64 = BIO_new(BIO_f_base64());
    if (!bmem || !b64) {
        BIO_free(bmem);
        BIO_free(b64);
        throw std::runtime_error("BIO_new failed");
    }
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL); // 不换行
    b64 = BIO_push(b64, bmem);
    BIO_write(b64, input.data(), static_cast<int>(input.size()));
    BIO_flush(b64);
    BUF_MEM* bptr = nullptr;
    BIO_get_mem_ptr(b64, &bptr);
    std::string encoded(bptr->data, bptr->length);
    BIO_free_all(b64);
    return encoded;
}

std::string to_hex(const unsigned char* data, const std::size_t len) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        hex.push_back(digits[data[i] >> 4]);
        hex.push_back(digits[data[i] & 0x0F]);
    }
    return hex;
}

/// 十六进制小写摘要
std::string hex_digest(const EVP_MD* md, const std::string& data) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> out{};
    unsigned int out_len = 0;
    if (EVP_Digest(data.data(), data.size(), out.data(), &out_len, md, nullptr) != 1) {
        throw std::runtime_error("EVP_Digest failed");
    }
    return to_hex(out.data(), out_len);
}

std::string random_cnonce() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return to_hex(bytes, sizeof(bytes));
}

void parse_header_value(const std::string_view v, std::vector<AuthChallenge>& out) {
    std::size_t i = 0;
    const auto skip_ws = [&] {
        while (i < v.size() && (v[i] == ' ' || v[i] == '\t')) ++i;
    };

    while (i < v.size()) {
        while (i < v.size() && (v[i] == ',' || v[i] == ' ' || v[i] == '\t')) ++i;
        if (i >= v.size()) break;

        const std::size_t start = i;
        while (i < v.size() && v[i] != ' ' && v[i] != '\t' && v[i] != '=' && v[i] != ',') ++i;
        std::string token = to_lower(v.substr(start, i - start));
        skip_ws();

        if (i < v.size() && v[i] == '=') {
            ++i;
            skip_ws();
            std::string value;
            if (i < v.size() && v[i] == '"') {
                // quoted-string，反斜杠转义下一个字符
                ++i;
                while (i < v.size() && v[i] != '"') {
                    if (v[i] == '\\' && i + 1 < v.size()) ++i;
                    value.push_back(v[i]);
                    ++i;
                }
                if (i < v.size()) ++i;
            } else {
                const std::size_t value_start = i;
                while (i < v.size() && v[i] != ',' && v[i] != ' ' && v[i] != '\t') ++i;
                value = std::string(v.substr(value_start, i - value_start));
            }
            // 没有 scheme 的参数直接丢弃
            if (!out.empty()) {
                out.back().params[std::move(token)] = std::move(value);
            }
        } else {
            out.push_back(AuthChallenge{std::move(token), {}});
        }
    }
}

} // namespace

std::optional<std::string> AuthChallenge::param(const std::string& name) const {
    if (const auto it = params.find(name); it != params.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<AuthChallenge> parse_challenges(const Headers& headers) {
    std::vector<AuthChallenge> challenges;
    const auto [first, last] = headers.equal_range(http::field::www_authenticate);
    for (auto it = first; it != last; ++it) {
        parse_header_value(it->value(), challenges);
    }
    return challenges;
}

// ------------------------------------------------
// BasicAuth
// ------------------------------------------------
BasicAuth::BasicAuth(std::string username, std::string password)
    : username_(std::move(username)),
      password_(std::move(password)) {
}

std::string BasicAuth::authorization() const {
    return "Basic " + base64_encode(username_ + ":" + password_);
}

std::optional<std::string> BasicAuth::respond(const Request&, const Response& response) {
    const auto challenges = parse_challenges(response.headers());
    // 没有质询的 401 也用 Basic 回应
    if (challenges.empty() ||
        std::ranges::any_of(challenges, [](const AuthChallenge& c) { return c.scheme == "basic"; })) {
        return authorization();
    }
    return std::nullopt;
}

// ------------------------------------------------
// DigestAuth
// ------------------------------------------------
DigestAuth::DigestAuth(std::string username, std::string password, CnonceSource cnonce_source)
    : username_(std::move(username)),
      password_(std::move(password)),
      cnonce_source_(std::move(cnonce_source)) {
}

std::optional<std::string> DigestAuth::respond(const Request& request, const Response& response) {
    for (const auto& challenge : parse_challenges(response.headers())) {
        if (challenge.scheme != "digest") {
            continue;
        }
        if (auto authorization = answer(challenge, request.method(), request.target())) {
            return authorization;
        }
    }
    return std::nullopt;
}

std::optional<std::string> DigestAuth::answer(const AuthChallenge& challenge, const http::verb method, const std::string& uri) {
    const auto nonce = challenge.param("nonce");
    if (!nonce) {
        SPDLOG_DEBUG("Digest challenge without nonce");
        return std::nullopt;
    }
    const std::string realm = challenge.param("realm").value_or("");
    const std::string algorithm = challenge.param("algorithm").value_or("MD5");
    const std::string algorithm_upper = to_upper(algorithm);

    const EVP_MD* md = nullptr;
    bool session = false;
    if (algorithm_upper == "MD5" || algorithm_upper == "MD5-SESS") {
        md = EVP_md5();
        session = algorithm_upper == "MD5-SESS";
    } else if (algorithm_upper == "SHA-256" || algorithm_upper == "SHA-256-SESS") {
        md = EVP_sha256();
        session = algorithm_upper == "SHA-256-SESS";
    } else {
        SPDLOG_DEBUG("Unsupported digest algorithm '{}'", algorithm);
        return std::nullopt;
    }

    // qop 只支持 auth，服务器只提供 auth-int 时无法回应
    std::optional<std::string> qop;
    if (const auto offered = challenge.param("qop")) {
        std::string_view rest = *offered;
        while (!rest.empty()) {
            const auto comma = rest.find(',');
            std::string option = to_lower(rest.substr(0, comma));
            std::erase_if(option, [](const char c) { return c == ' ' || c == '\t'; });
            if (option == "auth") {
                qop = "auth";
                break;
            }
            rest = comma == std::string_view::npos ? std::string_view{} : rest.substr(comma + 1);
        }
        if (!qop) {
            SPDLOG_DEBUG("Digest challenge offers no supported qop: '{}'", *offered);
            return std::nullopt;
        }
    }

    uint32_t nc = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (*nonce == last_nonce_) {
            nc = ++nonce_count_;
        } else {
            last_nonce_ = *nonce;
            nc = nonce_count_ = 1;
        }
    }
    char nc_value[9];
    std::snprintf(nc_value, sizeof(nc_value), "%08x", nc);
    const std::string cnonce = cnonce_source_ ? cnonce_source_() : random_cnonce();

    std::string ha1 = hex_digest(md, username_ + ":" + realm + ":" + password_);
    if (session) {
        ha1 = hex_digest(md, ha1 + ":" + *nonce + ":" + cnonce);
    }
    const std::string ha2 = hex_digest(md, std::string(http::to_string(method)) + ":" + uri);
    const std::string digest = qop
        ? hex_digest(md, ha1 + ":" + *nonce + ":" + nc_value + ":" + cnonce + ":" + *qop + ":" + ha2)
        : hex_digest(md, ha1 + ":" + *nonce + ":" + ha2);

    std::string header = "Digest username=\"" + username_ + "\", realm=\"" + realm + "\", nonce=\"" + *nonce +
                         "\", uri=\"" + uri + "\", response=\"" + digest + "\"";
    if (challenge.param("algorithm")) {
        header += ", algorithm=" + algorithm;
    }
    if (const auto opaque = challenge.param("opaque")) {
        header += ", opaque=\"" + *opaque + "\"";
    }
    if (qop) {
        header += ", qop=" + *qop + ", nc=" + nc_value + ", cnonce=\"" + cnonce + "\"";
    }
    return header;
}

} // namespace courier
