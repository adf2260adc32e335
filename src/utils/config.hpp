#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace sysrand::utils {

using json = nlohmann::json;

/**
 * JSON configuration for the demo program.
 * The library itself takes no configuration.
 */
class Config {
public:
    Config() = default;

    /**
     * Load configuration from a JSON file
     */
    static Config load_from_file(const std::string& path);

    /**
     * Load configuration from a JSON string
     */
    static Config load_from_json(const std::string& json_str);

    /**
     * Get a value, nullopt if missing or of the wrong type
     */
    template<typename T>
    std::optional<T> get(const std::string& key) const {
        if (!data_.is_object() || !data_.contains(key)) {
            return std::nullopt;
        }
        try {
            return data_.at(key).get<T>();
        } catch (const json::type_error&) {
            return std::nullopt;
        }
    }

    template<typename T>
    T get_or(const std::string& key, const T& default_value) const {
        return get<T>(key).value_or(default_value);
    }

    template<typename T>
    void set(const std::string& key, const T& value) {
        data_[key] = value;
    }

    bool has(const std::string& key) const {
        return data_.is_object() && data_.contains(key);
    }

private:
    json data_ = json::object();
};

/**
 * What sysrand_demo prints and how it logs
 */
struct DemoSettings {
    std::string log_level = "warn";
    bool log_to_file = false;
    size_t int_count = 5;
    size_t byte_count = 5;
    size_t string_count = 5;
    size_t string_bytes = 32;  // 256 bit strings

    static DemoSettings from_config(const Config& config);
};

} // namespace sysrand::utils
