#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <filesystem>
#include <fstream>
#include <mutex>
#include "logging.hpp"

namespace promptmap {

class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Load configuration from environment variables and optional config file
    bool load(const std::string& config_file = "") {
        std::lock_guard<std::mutex> lock(mutex_);

        load_from_env();

        if (!config_file.empty()) {
            if (std::filesystem::exists(config_file)) {
                load_from_file(config_file);
            } else {
                LOG_WARN("Config file not found: ", config_file);
            }
        }

        return validate();
    }

    // Get configuration value with default
    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = values_.find(key);
        if (it == values_.end() || it->second.empty()) {
            return default_value;
        }

        try {
            if constexpr (std::is_same_v<T, int>) {
                return std::stoi(it->second);
            } else if constexpr (std::is_same_v<T, size_t>) {
                return static_cast<size_t>(std::stoull(it->second));
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

    void print() const {
        std::lock_guard<std::mutex> lock(mutex_);

        LOG_INFO("Current configuration:");
        for (const auto& [key, value] : values_) {
            LOG_INFO("  ", key, " = ", value);
        }
    }

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void load_from_env() {
        // Logging
        set_if_env("log.level", "PM_LOG_LEVEL", "info");
        set_if_env("log.file", "PM_LOG_FILE", "");

        // Parser
        set_if_env("parse.streaming_threshold", "PM_STREAMING_THRESHOLD", "2097152");
        set_if_env("parse.chunk_size", "PM_CHUNK_SIZE", "65536");

        // Tokenizer
        set_if_env("tokenizer.vocab_dir", "PM_VOCAB_DIR", "");
        set_if_env("tokenizer.batch_interval_ms", "PM_BATCH_INTERVAL_MS", "16");

        // Transformer defaults used by the CLI
        set_if_env("transform.aggregation_threshold", "PM_AGGREGATION_THRESHOLD", "0.0075");
        set_if_env("transform.max_visible_nodes", "PM_MAX_VISIBLE_NODES", "2000");
    }

    void set_if_env(const std::string& key, const std::string& env_var, const std::string& default_value) {
        const char* env_value = std::getenv(env_var.c_str());
        if (env_value && *env_value) {
            values_[key] = env_value;
        } else if (values_.find(key) == values_.end()) {
            values_[key] = default_value;
        }
    }

    void load_from_file(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            LOG_WARN("Could not open config file: ", filename);
            return;
        }

        auto trim = [](std::string& s) {
            s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](int ch) { return !std::isspace(ch); }));
            s.erase(std::find_if(s.rbegin(), s.rend(), [](int ch) { return !std::isspace(ch); }).base(), s.end());
        };

        std::string line;
        while (std::getline(file, line)) {
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            size_t equals_pos = line.find('=');
            if (equals_pos != std::string::npos) {
                std::string key = line.substr(0, equals_pos);
                std::string value = line.substr(equals_pos + 1);
                trim(key);
                trim(value);

                if (!key.empty()) {
                    values_[key] = value;
                }
            }
        }

        LOG_INFO("Loaded configuration from file: ", filename);
    }

    // Called with mutex_ held, so reads values_ directly
    bool validate() {
        bool valid = true;

        auto positive = [this](const std::string& key) {
            auto it = values_.find(key);
            if (it == values_.end()) return false;
            try {
                return std::stoll(it->second) > 0;
            } catch (const std::exception&) {
                return false;
            }
        };

        if (!positive("parse.chunk_size")) {
            LOG_ERROR("Invalid parse.chunk_size: ", values_["parse.chunk_size"]);
            valid = false;
        }
        if (!positive("transform.max_visible_nodes")) {
            LOG_ERROR("Invalid transform.max_visible_nodes: ", values_["transform.max_visible_nodes"]);
            valid = false;
        }

        const std::string& log_level = values_["log.level"];
        if (log_level != "debug" && log_level != "info" && log_level != "warn" &&
            log_level != "error") {
            LOG_WARN("Unknown log level '", log_level, "', defaulting to 'info'");
            values_["log.level"] = "info";
        }

        return valid;
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

    set_log_level(config.get<std::string>("log.level", "info"));

    std::string log_file = config.get<std::string>("log.file");
    if (!log_file.empty()) {
        static std::ofstream log_stream(log_file, std::ios::app);
        if (log_stream.is_open()) {
            set_log_output(log_stream);
        } else {
            LOG_ERROR("Could not open log file: ", log_file);
        }
    }

    LOG_DEBUG("Configuration loaded");
    return true;
}

} // namespace promptmap
