#include "config.hpp"
#include <fstream>
#include <stdexcept>

namespace sysrand::utils {

Config Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    Config config;
    try {
        file >> config.data_;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + e.what());
    }
    if (!config.data_.is_object()) {
        throw std::runtime_error("Config file " + path + " must contain a JSON object");
    }
    return config;
}

Config Config::load_from_json(const std::string& json_str) {
    Config config;
    try {
        config.data_ = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse JSON: " + std::string(e.what()));
    }
    if (!config.data_.is_object()) {
        throw std::runtime_error("Configuration must be a JSON object");
    }
    return config;
}

DemoSettings DemoSettings::from_config(const Config& config) {
    DemoSettings settings;
    settings.log_level = config.get_or<std::string>("log_level", settings.log_level);
    settings.log_to_file = config.get_or<bool>("log_to_file", settings.log_to_file);
    settings.int_count = config.get_or<size_t>("int_count", settings.int_count);
    settings.byte_count = config.get_or<size_t>("byte_count", settings.byte_count);
    settings.string_count = config.get_or<size_t>("string_count", settings.string_count);
    settings.string_bytes = config.get_or<size_t>("string_bytes", settings.string_bytes);
    return settings;
}

} // namespace sysrand::utils
