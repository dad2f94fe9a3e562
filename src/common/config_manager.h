#ifndef MARIONETTE_CONFIG_MANAGER_H
#define MARIONETTE_CONFIG_MANAGER_H

#include <string>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "types.h"

namespace marionette {

class ConfigManager {
public:
    static ConfigManager& getInstance();

    // Missing or malformed files leave the defaults in place and return false
    bool loadConfig(const std::string& configPath = "config/marionette.json");
    void loadFromJson(const nlohmann::json& overrides);
    void resetToDefaults();

    // Converter Configuration
    /**
     * @brief Build a validated converter configuration from the "converter" section
     * @throws MarionetteException (CONFIGURATION_ERROR) on non-positive extents,
     *         negative durations or an unknown capslock mode
     */
    ConverterConfig getConverterConfig() const;

    // Parser Configuration
    std::string getParserMode() const;

    // Logging Configuration
    std::string getLogLevel() const;
    std::string getLogFile() const;
    std::string getLogFormat() const;

    /**
     * @brief Point the structured logger at the configured level, format and sinks
     */
    void applyLoggingConfig() const;

    std::string getConfigPath() const;
    const nlohmann::json& getConfig() const { return m_config; }

    // Generic getters/setters, key is a dotted path such as "converter.target_width"
    template<typename T>
    T get(const std::string& key) const;

    template<typename T>
    void set(const std::string& key, const T& value);

private:
    ConfigManager();
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    nlohmann::json m_config;
    std::string m_configPath;

    void setDefaults();
    std::string getEnvironmentVariable(const std::string& name) const;
    static nlohmann::json::json_pointer toPointer(const std::string& key);
};

// Template implementations
template<typename T>
T ConfigManager::get(const std::string& key) const {
    auto pointer = toPointer(key);
    if (m_config.contains(pointer)) {
        return m_config.at(pointer).get<T>();
    }
    throw std::runtime_error("Configuration key not found: " + key);
}

template<typename T>
void ConfigManager::set(const std::string& key, const T& value) {
    m_config[toPointer(key)] = value;
}

} // namespace marionette

#endif // MARIONETTE_CONFIG_MANAGER_H
