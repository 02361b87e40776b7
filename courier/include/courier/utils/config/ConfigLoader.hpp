//
// Created by ubuntu on 2025/11/6.
//

#ifndef COURIER_CONFIG_LOADER_HPP
#define COURIER_CONFIG_LOADER_HPP

#include <string>
#include <string_view>

#include <courier/utils/config/CourierConfig.hpp>
#include <toml++/toml.hpp>

namespace courier {

class ConfigLoader {
public:
    /**
     * @brief 从指定的 TOML 文件路径加载配置。
     *
     * @param filepath 配置文件的路径。
     * @return CourierConfig 填充了配置数据的结构体，缺失的字段使用默认值。
     * @throws std::runtime_error 如果文件不存在、解析失败或配置值不合理。
     */
    static CourierConfig load(const std::string& filepath);

    /**
     * @brief 从 TOML 文本加载配置，主要用于内嵌配置和测试。
     */
    static CourierConfig load_from_string(std::string_view toml_text);

private:
    static CourierConfig from_table(const toml::table& root_tbl);
    static ClientConfig parse_client(const toml::table& client_tb);
    static LoggingConfig parse_logging(const toml::table& log_tb);
};

} // namespace courier

#endif //COURIER_CONFIG_LOADER_HPP
