#include "config_manager.h"
#include "structured_logger.h"
#include "error_handler.h"
#include "json_utils.h"
#include "string_utils.h"
#include <cstdlib>
#include <memory>

namespace marionette {

ConfigManager::ConfigManager() {
    setDefaults();
}

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

bool ConfigManager::loadConfig(const std::string& configPath) {
    m_configPath = configPath;

    nlohmann::json fileConfig;
    if (!utils::JsonUtils::loadJsonFromFile(configPath, fileConfig) || !fileConfig.is_object()) {
        SLOG_WARNING().message("Config file not found or invalid, using defaults").context("config_path", configPath);
        setDefaults();
        return false;
    }

    setDefaults();
    m_config = utils::JsonUtils::mergeJsonObjects(m_config, fileConfig);
    SLOG_INFO().message("Configuration loaded").context("config_path", configPath);
    return true;
}

void ConfigManager::loadFromJson(const nlohmann::json& overrides) {
    setDefaults();
    if (overrides.is_object()) {
        m_config = utils::JsonUtils::mergeJsonObjects(m_config, overrides);
    } else if (!overrides.is_null()) {
        SLOG_WARNING().message("Configuration overrides are not an object, using defaults");
    }
}

void ConfigManager::resetToDefaults() {
    setDefaults();
    m_configPath.clear();
}

void ConfigManager::setDefaults() {
    m_config = nlohmann::json{
        {"converter", {
            {"target_width", 1920},
            {"target_height", 1080},
            {"drag_duration", 0.5},
            {"scroll_amount", 2},
            {"wait_duration", 1.0},
            {"hotkey_interval", 0.1},
            {"capslock_mode", "session"},
            {"strict_coordinate_validation", false}
        }},
        {"parser", {
            {"mode", "auto"}
        }},
        {"logging", {
            {"level", "INFO"},
            {"file", ""},
            {"format", "text"}
        }}
    };
}

std::string ConfigManager::getEnvironmentVariable(const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : "";
}

nlohmann::json::json_pointer ConfigManager::toPointer(const std::string& key) {
    return nlohmann::json::json_pointer("/" + utils::StringUtils::replaceAll(key, ".", "/"));
}

// Converter Configuration
ConverterConfig ConfigManager::getConverterConfig() const {
    nlohmann::json section;
    if (!utils::JsonUtils::getObjectField(m_config, "converter", section)) {
        section = nlohmann::json::object();
    }

    ConverterConfig defaults;
    ConverterConfig config;
    config.targetWidth = utils::JsonUtils::getIntField(section, "target_width", defaults.targetWidth);
    config.targetHeight = utils::JsonUtils::getIntField(section, "target_height", defaults.targetHeight);
    config.dragDuration = utils::JsonUtils::getDoubleField(section, "drag_duration", defaults.dragDuration);
    config.scrollAmount = utils::JsonUtils::getIntField(section, "scroll_amount", defaults.scrollAmount);
    config.waitDuration = utils::JsonUtils::getDoubleField(section, "wait_duration", defaults.waitDuration);
    config.hotkeyInterval = utils::JsonUtils::getDoubleField(section, "hotkey_interval", defaults.hotkeyInterval);
    config.strictCoordinateValidation = utils::JsonUtils::getBoolField(section, "strict_coordinate_validation",
                                                                       defaults.strictCoordinateValidation);

    if (config.targetWidth <= 0 || config.targetHeight <= 0) {
        MARIONETTE_THROW(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::HIGH,
                         "Target extents must be positive",
                         std::to_string(config.targetWidth) + "x" + std::to_string(config.targetHeight),
                         "converter");
    }
    if (config.dragDuration < 0.0 || config.waitDuration < 0.0 || config.hotkeyInterval < 0.0) {
        MARIONETTE_THROW(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::HIGH,
                         "Durations and intervals must not be negative", "", "converter");
    }

    std::string mode = utils::StringUtils::toLowerCase(
        utils::StringUtils::trim(utils::JsonUtils::getStringField(section, "capslock_mode", "session")));
    if (mode == "session") {
        config.capslockMode = CapsLockMode::SESSION;
    } else if (mode == "system") {
        config.capslockMode = CapsLockMode::SYSTEM;
    } else {
        MARIONETTE_THROW(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::HIGH,
                         "Unknown capslock mode: " + mode, "expected 'session' or 'system'", "converter");
    }

    return config;
}

// Parser Configuration
std::string ConfigManager::getParserMode() const {
    nlohmann::json section;
    if (utils::JsonUtils::getObjectField(m_config, "parser", section)) {
        return utils::JsonUtils::getStringField(section, "mode", "auto");
    }
    return "auto";
}

// Logging Configuration
std::string ConfigManager::getLogLevel() const {
    std::string envLevel = getEnvironmentVariable("MARIONETTE_LOG_LEVEL");
    if (!envLevel.empty()) {
        return envLevel;
    }

    nlohmann::json section;
    if (utils::JsonUtils::getObjectField(m_config, "logging", section)) {
        return utils::JsonUtils::getStringField(section, "level", "INFO");
    }
    return "INFO";
}

std::string ConfigManager::getLogFile() const {
    nlohmann::json section;
    if (utils::JsonUtils::getObjectField(m_config, "logging", section)) {
        return utils::JsonUtils::getStringField(section, "file", "");
    }
    return "";
}

std::string ConfigManager::getLogFormat() const {
    nlohmann::json section;
    if (utils::JsonUtils::getObjectField(m_config, "logging", section)) {
        return utils::JsonUtils::getStringField(section, "format", "text");
    }
    return "text";
}

void ConfigManager::applyLoggingConfig() const {
    auto& logger = StructuredLogger::getInstance();
    logger.setLogLevel(parseLogLevel(getLogLevel(), LogLevel::INFO));

    std::shared_ptr<ILogFormatter> formatter;
    if (utils::StringUtils::toLowerCase(getLogFormat()) == "json") {
        formatter = std::make_shared<JsonLogFormatter>();
    } else {
        formatter = std::make_shared<TextLogFormatter>();
    }

    logger.clearSinks();
    logger.addSink(std::make_shared<ConsoleLogSink>(formatter));

    std::string logFile = getLogFile();
    if (!logFile.empty()) {
        auto fileSink = std::make_shared<FileLogSink>(logFile, formatter);
        if (fileSink->isOpen()) {
            logger.addSink(fileSink);
        } else {
            SLOG_WARNING().message("Cannot open log file, console logging only").context("path", logFile);
        }
    }
}

std::string ConfigManager::getConfigPath() const {
    return m_configPath;
}

} // namespace marionette
