#include "logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <mutex>
#include <vector>

namespace sysrand::utils {

std::shared_ptr<spdlog::logger> Logger::logger_;

namespace {
// Guards creation of logger_; random sources may log from several threads
// on their first call.
std::mutex logger_mutex;

constexpr size_t LOG_FILE_MAX_SIZE = 1024 * 1024 * 5;  // 5MB
constexpr size_t LOG_FILE_COUNT = 2;
}

spdlog::level::level_enum Logger::parse_level(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

void Logger::init(const std::string& level, bool log_to_file) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [sysrand] %v");
    sinks.push_back(console_sink);

    if (log_to_file) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            "sysrand.log", LOG_FILE_MAX_SIZE, LOG_FILE_COUNT);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("sysrand", sinks.begin(), sinks.end());
    logger->set_level(parse_level(level));
    logger->flush_on(spdlog::level::err);

    std::lock_guard<std::mutex> lock(logger_mutex);
    logger_ = std::move(logger);
}

std::shared_ptr<spdlog::logger> Logger::get() {
    {
        std::lock_guard<std::mutex> lock(logger_mutex);
        if (logger_) {
            return logger_;
        }
    }
    init();
    std::lock_guard<std::mutex> lock(logger_mutex);
    return logger_;
}

void Logger::set_level(const std::string& level) {
    get()->set_level(parse_level(level));
}

} // namespace sysrand::utils
