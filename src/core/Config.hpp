#pragma once

/**
 * Config.hpp
 *
 * Configuration management using JSON.
 * Provides type-safe access to configuration values with defaults.
 */

#include <nlohmann/json.hpp>
#include <string>
#include <mutex>
#include <fstream>
#include <filesystem>

namespace modeld::core {

using json = nlohmann::json;

/**
 * Configuration manager - Thread-safe singleton
 *
 * Values are addressed with dot notation ("downloads.maxConcurrent").
 * A loaded file is merged over the defaults, so a partial config.json
 * only needs the keys it overrides.
 */
class Config {
public:
    /**
     * Get singleton instance
     * @return Reference to Config instance
     */
    static Config& instance() {
        static Config instance;
        return instance;
    }

    /**
     * Load configuration from file and merge it over the current values
     * @param path Path to config file
     * @return true if loaded successfully
     */
    bool load(const std::string& path) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            if (!std::filesystem::exists(path)) {
                return false;
            }

            std::ifstream file(path);
            if (!file.is_open()) {
                return false;
            }

            m_config.merge_patch(json::parse(file));
            return true;

        } catch (const json::exception&) {
            return false;
        }
    }

    /**
     * Save configuration to file
     * @param savePath Path to config file
     * @return true if saved successfully
     */
    bool save(const std::string& savePath) {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (savePath.empty()) {
            return false;
        }

        try {
            auto parent = std::filesystem::path(savePath).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }

            std::ofstream file(savePath);
            if (!file.is_open()) {
                return false;
            }

            file << m_config.dump(4);
            return true;

        } catch (const std::exception&) {
            return false;
        }
    }

    /**
     * Reset to default configuration values
     */
    void setDefaults() {
        std::lock_guard<std::mutex> lock(m_mutex);

        m_config = {
            {"version", "1.0.0"},
            {"worker", {
                {"id", 0}
            }},
            {"server", {
                {"url", "http://127.0.0.1:80"},
                {"token", ""},
                {"timeout", 30000}
            }},
            {"paths", {
                {"cacheDir", ""},
                {"logDir", ""}
            }},
            {"downloads", {
                {"maxConcurrent", 5},
                {"progressInterval", 2000},
                {"cancelGracePeriod", 5000},
                {"isolation", "process"}
            }},
            {"watch", {
                {"retryDelay", 5000}
            }},
            {"sources", {
                {"huggingface", {
                    {"endpoint", "https://huggingface.co"},
                    {"token", ""}
                }},
                {"modelscope", {
                    {"endpoint", "https://modelscope.cn"}
                }},
                {"ollama", {
                    {"registry", "https://registry.ollama.ai"}
                }}
            }}
        };
    }

    /**
     * Get configuration value with dot notation
     * @param key Key path (e.g., "downloads.maxConcurrent")
     * @param defaultValue Default value if key not found or mistyped
     * @return Configuration value
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            if (m_config.contains(ptr)) {
                return m_config.at(ptr).get<T>();
            }
        } catch (const json::exception&) {
            // Fall through to default
        }

        return defaultValue;
    }

    /**
     * Set configuration value with dot notation
     * @param key Key path
     * @param value Value to set
     * @return false if the key path is invalid
     */
    template<typename T>
    bool set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            m_config[ptr] = value;
            return true;
        } catch (const json::exception&) {
            return false;
        }
    }

private:
    Config() {
        setDefaults();
    }

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    static json::json_pointer toJsonPointer(const std::string& key) {
        std::string pointer = "/";
        for (char c : key) {
            pointer += (c == '.') ? '/' : c;
        }
        return json::json_pointer(pointer);
    }

private:
    mutable std::mutex m_mutex;
    json m_config;
};

} // namespace modeld::core
