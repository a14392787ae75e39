#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>

#include "geohash/logging.hpp"
#include "geohash/types.hpp"

namespace geohash {

/**
 * Process configuration for the front ends (CLI, benchmarks). The library
 * operations never consult it: precision and direction are per-call
 * arguments.
 */
class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Load configuration from environment variables and optional config file
    bool load(const std::string& config_file = "") {
        {
            std::lock_guard<std::mutex> lock(mutex_);

            load_from_env();

            if (!config_file.empty() && std::filesystem::exists(config_file)) {
                load_from_file(config_file);
            }
        }

        return validate();
    }

    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        try {
            if constexpr (std::is_same_v<T, int>) {
                size_t pos = 0;
                int value = std::stoi(it->second, &pos);
                if (pos != it->second.size()) throw std::invalid_argument(it->second);
                return value;
            } else if constexpr (std::is_same_v<T, double>) {
                return std::stod(it->second);
            } else if constexpr (std::is_same_v<T, bool>) {
                std::string val = it->second;
                std::transform(val.begin(), val.end(), val.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                return val == "true" || val == "1" || val == "yes" || val == "on";
            } else {
                return it->second;
            }
        } catch (const std::exception&) {
            LOG_WARN("Failed to parse config value for key '", key, "', using default");
            return default_value;
        }
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.count(key) != 0;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
    }

    void print() const {
        std::lock_guard<std::mutex> lock(mutex_);

        LOG_INFO("Current configuration:");
        for (const auto& [key, value] : values_) {
            LOG_INFO("  ", key, " = ", value);
        }
    }

    Precision default_precision() const {
        return static_cast<Precision>(get<int>("geohash.default_precision", DEFAULT_PRECISION));
    }

    bool validate() {
        bool valid = true;

        int precision = get<int>("geohash.default_precision", DEFAULT_PRECISION);
        if (!is_valid(static_cast<Precision>(precision))) {
            LOG_ERROR("Invalid default precision: ", precision, " (expected 1..12)");
            valid = false;
        }

        std::string output = get<std::string>("geohash.output", "text");
        if (output != "text" && output != "csv") {
            LOG_WARN("Unknown output format '", output, "', defaulting to 'text'");
            set("geohash.output", "text");
        }

        std::string log_level = get<std::string>("log.level", "info");
        LogLevel parsed;
        if (!parse_log_level(log_level, parsed)) {
            LOG_WARN("Unknown log level '", log_level, "', defaulting to 'info'");
            set("log.level", "info");
        }

        return valid;
    }

    static constexpr int DEFAULT_PRECISION = static_cast<int>(Precision::House);

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void load_from_env() {
        set_if_env("log.level", "GH_LOG_LEVEL", "info");
        set_if_env("log.file", "GH_LOG_FILE", "");

        set_if_env("geohash.default_precision", "GH_DEFAULT_PRECISION",
                   std::to_string(DEFAULT_PRECISION));
        set_if_env("geohash.output", "GH_OUTPUT", "text");
    }

    void set_if_env(const std::string& key, const std::string& env_var, const std::string& default_value) {
        const char* env_value = std::getenv(env_var.c_str());
        if (env_value && *env_value) {
            values_[key] = env_value;
        } else {
            values_[key] = default_value;
        }
    }

    void load_from_file(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            LOG_WARN("Could not open config file: ", filename);
            return;
        }

        auto not_space = [](int ch) { return !std::isspace(ch); };

        std::string line;
        while (std::getline(file, line)) {
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            size_t equals_pos = line.find('=');
            if (equals_pos != std::string::npos) {
                std::string key = line.substr(0, equals_pos);
                std::string value = line.substr(equals_pos + 1);

                key.erase(key.begin(), std::find_if(key.begin(), key.end(), not_space));
                key.erase(std::find_if(key.rbegin(), key.rend(), not_space).base(), key.end());

                value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
                value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());

                if (!key.empty()) {
                    values_[key] = value;
                }
            }
        }

        LOG_INFO("Loaded configuration from file: ", filename);
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

// Initialize configuration on startup and apply the logging settings
inline bool init_config(const std::string& config_file = "geohash.env") {
    Config& config = Config::getInstance();

    if (!config.load(config_file)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }

    LogLevel level = LogLevel::INFO;
    if (parse_log_level(config.get<std::string>("log.level", "info"), level)) {
        set_log_level(level);
    }

    std::string log_file = config.get<std::string>("log.file");
    if (!log_file.empty()) {
        static std::ofstream log_stream(log_file, std::ios::app);
        if (log_stream.is_open()) {
            set_log_output(log_stream);
        } else {
            LOG_ERROR("Could not open log file: ", log_file);
        }
    }

    LOG_DEBUG("Configuration loaded successfully");
    return true;
}

} // namespace geohash
