#include <filesystem>
#include <iostream>

#include "sysrand/random.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"

// Prints a few random integers, bytes and base64 strings drawn from the OS
// source. Usage: sysrand_demo [config.json]
int main(int argc, char** argv) {
    try {
        sysrand::utils::Config config;
        if (argc > 1) {
            if (!std::filesystem::exists(argv[1])) {
                std::cerr << "Config file not found: " << argv[1] << std::endl;
                return 1;
            }
            config = sysrand::utils::Config::load_from_file(argv[1]);
        }

        auto settings = sysrand::utils::DemoSettings::from_config(config);
        sysrand::utils::Logger::init(settings.log_level, settings.log_to_file);

        SYSRAND_LOG_INFO("sysrand demo v{}", SYSRAND_VERSION_STRING);

        std::cout << "Generating " << settings.int_count << " random unsigned integers:" << std::endl;
        for (size_t i = 0; i < settings.int_count; ++i) {
            std::cout << "Random int: " << sysrand::random_uint32() << std::endl;
        }

        if (auto kind = sysrand::default_source().kind()) {
            SYSRAND_LOG_INFO("Random source: {}", sysrand::strategy_kind_to_string(*kind));
        }

        std::cout << "\nGenerating " << settings.byte_count << " random bytes:" << std::endl;
        auto raw = sysrand::random_bytes(settings.byte_count);
        for (auto b : raw) {
            std::cout << "Random byte: " << static_cast<int>(b) << std::endl;
        }

        std::cout << "\nGenerating " << settings.string_count << " random "
                  << settings.string_bytes * 8 << " bit strings:" << std::endl;
        for (size_t i = 0; i < settings.string_count; ++i) {
            std::cout << "Random string: " << sysrand::random_string(settings.string_bytes) << std::endl;
        }

        sysrand::close_random();
        return 0;
    } catch (const sysrand::SysrandException& e) {
        SYSRAND_LOG_CRITICAL("{}", e.to_error().to_string());
        return 1;
    } catch (const std::exception& e) {
        SYSRAND_LOG_CRITICAL("Fatal error: {}", e.what());
        return 1;
    }
}
