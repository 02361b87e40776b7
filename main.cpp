
#include <filesystem>
#include <iostream>

#include <courier/client/blocking_client.hpp>
#include <courier/utils/config/ConfigLoader.hpp>
#include <courier/utils/logger_manager.hpp>


int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <url> [config.toml]" << std::endl;
        return 2;
    }

    try {
        courier::CourierConfig config;
        if (const std::filesystem::path path = argc > 2 ? argv[2] : "../config.toml"; std::filesystem::exists(path)) {
            config = courier::ConfigLoader::load(path.string());
        }
        courier::LoggerManager::init(config.logging);

        int exit_code = 0;
        {
            courier::BlockingClient client(courier::ClientOptions{config.client});
            courier::BlockingResponse response = client.get(argv[1]);

            for (const auto& hop : response.history()) {
                std::cout << hop.status() << " -> " << hop.headers()[courier::http::field::location] << "\n";
            }
            std::cout << response.protocol() << " " << response.status() << " " << response.reason() << "\n";
            for (const auto& field : response.headers()) {
                std::cout << field.name_string() << ": " << field.value() << "\n";
            }
            std::cout << "\n" << response.read() << std::endl;
            exit_code = response.status() >= 400 ? 1 : 0;
        }

        courier::LoggerManager::shutdown();
        return exit_code;
    } catch (const std::exception& e) {
        // 捕获配置加载、请求过程中的错误
        std::cerr << "Request failed: " << e.what() << std::endl;
        return 1;
    }
}
