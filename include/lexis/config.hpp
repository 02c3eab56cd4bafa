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
#include "lexis/logging.hpp"

namespace lexis {

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

            // Load from environment variables first
            load_from_env();

            // Load from config file if specified
            if (!config_file.empty()) {
                if (!std::filesystem::exists(config_file)) {
                    LOG_WARN("Config file not found: ", config_file);
                } else {
                    load_from_file(config_file);
                }
            }
        }

        // Validate configuration (takes the lock itself)
        return validate();
    }

    // Get configuration value with default
    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::string raw;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = values_.find(key);
            if (it == values_.end()) {
                return default_value;
            }
            raw = it->second;
        }

        try {
            if constexpr (std::is_same_v<T, int>) {
                return std::stoi(raw);
            } else if constexpr (std::is_same_v<T, double>) {
                return std::stod(raw);
            } else if constexpr (std::is_same_v<T, bool>) {
                std::transform(raw.begin(), raw.end(), raw.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                return raw == "true" || raw == "1" || raw == "yes" || raw == "on";
            } else {
                return raw;
            }
        } catch (const std::exception&) {
            LOG_WARN("Failed to parse config value for key '", key, "', using default");
            return default_value;
        }
    }

    // Set configuration value
    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.count(key) != 0;
    }

    // Pushes log.level and log.file into the Logger
    void apply_logging() const {
        set_log_level(Logger::parse_level(get<std::string>("log.level", "info")));

        std::string log_file = get<std::string>("log.file");
        if (!log_file.empty() && !Logger::getInstance().setOutputFile(log_file)) {
            LOG_ERROR("Could not open log file: ", log_file);
        }
    }

    // Print current configuration (for debugging)
    void print() const {
        std::unordered_map<std::string, std::string> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot = values_;
        }

        LOG_INFO("Current configuration:");
        for (const auto& [key, value] : snapshot) {
            LOG_INFO("  ", key, " = ", value);
        }
    }

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void load_from_env() {
        // Logging configuration
        set_if_env("log.level", "LEXIS_LOG_LEVEL", "info");
        set_if_env("log.file", "LEXIS_LOG_FILE", "");

        // Base directory for relative vector and vocabulary paths
        set_if_env("data.dir", "LEXIS_DATA_DIR", "");
    }

    void set_if_env(const std::string& key, const std::string& env_var, const std::string& default_value) {
        const char* env_value = std::getenv(env_var.c_str());
        if (env_value && *env_value) {
            values_[key] = env_value;
        } else if (values_.count(key) == 0) {
            values_[key] = default_value;
        }
    }

    void load_from_file(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            LOG_WARN("Could not open config file: ", filename);
            return;
        }

        std::string line;
        while (std::getline(file, line)) {
            // Skip comments and empty lines
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            // Parse key=value
            size_t equals_pos = line.find('=');
            if (equals_pos != std::string::npos) {
                std::string key = trim(line.substr(0, equals_pos));
                std::string value = trim(line.substr(equals_pos + 1));
                if (!key.empty()) {
                    values_[key] = value;
                }
            }
        }

        LOG_INFO("Loaded configuration from file: ", filename);
    }

    // Trim whitespace
    static std::string trim(std::string s) {
        auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
        s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
        return s;
    }

    bool validate() {
        // Validate log level
        std::string log_level = get<std::string>("log.level");
        std::transform(log_level.begin(), log_level.end(), log_level.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (log_level != "debug" && log_level != "info" && log_level != "warn" &&
            log_level != "warning" && log_level != "error" && log_level != "fatal") {
            LOG_WARN("Unknown log level '", log_level, "', defaulting to 'info'");
            set("log.level", "info");
        }

        // Validate data directory
        std::string data_dir = get<std::string>("data.dir");
        if (!data_dir.empty() && !std::filesystem::is_directory(data_dir)) {
            LOG_ERROR("data.dir is not a directory: ", data_dir);
            return false;
        }
        return true;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

// Initialize configuration on startup
inline bool init_config(const std::string& config_file = "") {
    Config& config = Config::getInstance();
    if (!config.load(config_file)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }
    // Set log level and output file from the loaded values
    config.apply_logging();
    LOG_DEBUG("Configuration loaded");
    return true;
}

} // namespace lexis
