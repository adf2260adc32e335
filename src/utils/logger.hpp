#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace sysrand::utils {

/**
 * Library-wide spdlog logger.
 *
 * The library never configures logging on its own beyond a lazily created
 * console logger; host programs call init() to pick a level or add the
 * rotating file sink.
 */
class Logger {
public:
    /**
     * Initialize the logging system
     * @param level Log level (trace, debug, info, warn, error, critical, off)
     * @param log_to_file Also write to sysrand.log (rotating)
     */
    static void init(const std::string& level = "info", bool log_to_file = false);

    /**
     * Get the logger instance, creating a console logger on first use
     */
    static std::shared_ptr<spdlog::logger> get();

    /**
     * Change the level of an already initialized logger
     */
    static void set_level(const std::string& level);

private:
    static spdlog::level::level_enum parse_level(const std::string& level);

    static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace sysrand::utils

#define SYSRAND_LOG_TRACE(...)    sysrand::utils::Logger::get()->trace(__VA_ARGS__)
#define SYSRAND_LOG_DEBUG(...)    sysrand::utils::Logger::get()->debug(__VA_ARGS__)
#define SYSRAND_LOG_INFO(...)     sysrand::utils::Logger::get()->info(__VA_ARGS__)
#define SYSRAND_LOG_WARN(...)     sysrand::utils::Logger::get()->warn(__VA_ARGS__)
#define SYSRAND_LOG_ERROR(...)    sysrand::utils::Logger::get()->error(__VA_ARGS__)
#define SYSRAND_LOG_CRITICAL(...) sysrand::utils::Logger::get()->critical(__VA_ARGS__)
