//
// Created by ubuntu on 2025/11/6.
//

#ifndef COURIER_LOGGER_MANAGER_HPP
#define COURIER_LOGGER_MANAGER_HPP
#include <chrono>
#include <cstdio>
#include <memory>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/async.h>                   // 异步模式需要
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h> // 用于彩色控制台输出

#include <courier/utils/config/CourierConfig.hpp>

namespace courier {
    /**
     * @brief 进程级日志初始化。库本身只通过 SPDLOG_* 宏写默认 logger，
     *        是否、何时安装异步 logger 由应用决定。
     */
    class LoggerManager {
    public:
        static void init(const LoggingConfig& config) {
            try {
                // 1. 初始化线程池 (队列大小 8192，线程数 1)
                spdlog::init_thread_pool(8192, 1);

                std::vector<spdlog::sink_ptr> sinks;

                // 2. 配置 Sinks
                if (config.output_type == "console" || config.output_type == "all") {
                    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
                }

                if (config.output_type == "file" || config.output_type == "all") {
                    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                        config.file_path, static_cast<std::size_t>(config.max_size_mb) * 1024 * 1024, config.max_files));
                }

                // output 为 "off" 时使用 null_sink
                if (sinks.empty()) {
                    sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
                    spdlog::set_level(spdlog::level::off);
                }

                // 3. 创建异步 Logger
                const auto async_logger_ptr = std::make_shared<spdlog::async_logger>(
                    "courier",
                    sinks.begin(), sinks.end(),
                    spdlog::thread_pool(),
                    spdlog::async_overflow_policy::overrun_oldest
                );

                // 4. 设置级别
                const spdlog::level::level_enum log_level = spdlog::level::from_str(config.level);
                async_logger_ptr->set_level(log_level);

                // 5. 全局注册 (移交所有权)
                spdlog::set_default_logger(async_logger_ptr);
                spdlog::set_level(log_level);

                // 6. 自动刷盘策略，异步日志崩溃时会丢失最近几秒的日志
                using namespace std::chrono_literals;
                spdlog::flush_every(10s);
                spdlog::flush_on(spdlog::level::err);

                // 7. 设置日志格式
                spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e %z] [thread %t] [%s:%#] [%^%l%$] %v");

                SPDLOG_INFO("Logger level : {}", spdlog::level::to_string_view(spdlog::default_logger()->level()));
            } catch (const spdlog::spdlog_ex& ex) {
                // 如果日志初始化失败，只能打印到 stderr
                std::fprintf(stderr, "Log init failed: %s\n", ex.what());
            }
        }

        // 在 main 退出前调用
        static void shutdown() {
            spdlog::shutdown();
        }

        LoggerManager() = delete;
    };
}
#endif //COURIER_LOGGER_MANAGER_HPP
