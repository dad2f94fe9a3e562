#include <iostream>
#include <cassert>
#include <cstdlib>
#include <fstream>
#include <filesystem>
#include "common/config_manager.h"
#include "common/error_handler.h"
#include "common/structured_logger.h"
#include "test_helpers.h"

using namespace marionette;
using marionette::test::expectThrows;

namespace fs = std::filesystem;

void testDefaults() {
    std::cout << "\n[TEST] Defaults\n";

    auto& config = ConfigManager::getInstance();
    config.resetToDefaults();

    ConverterConfig converter = config.getConverterConfig();
    assert(converter.targetWidth == 1920);
    assert(converter.targetHeight == 1080);
    assert(converter.dragDuration == 0.5);
    assert(converter.scrollAmount == 2);
    assert(converter.capslockMode == CapsLockMode::SESSION);
    assert(!converter.strictCoordinateValidation);

    assert(config.getParserMode() == "auto");
    assert(config.getLogFormat() == "text");
    assert(config.get<int>("converter.target_width") == 1920);
    assert(config.getConfigPath().empty());

    std::cout << "[PASS] An empty configuration yields 1920x1080 session defaults\n";
}

void testOverrides() {
    std::cout << "\n[TEST] JSON Overrides\n";

    auto& config = ConfigManager::getInstance();
    config.loadFromJson({
        {"converter", {
            {"target_width", 2560},
            {"capslock_mode", "System"},
            {"strict_coordinate_validation", true}
        }},
        {"parser", {{"mode", "tool-call"}}}
    });

    ConverterConfig converter = config.getConverterConfig();
    assert(converter.targetWidth == 2560);
    assert(converter.targetHeight == 1080);
    assert(converter.capslockMode == CapsLockMode::SYSTEM);
    assert(converter.strictCoordinateValidation);
    assert(config.getParserMode() == "tool-call");

    config.set("converter.scroll_amount", 5);
    assert(config.getConverterConfig().scrollAmount == 5);
    assert(expectThrows<std::runtime_error>([&config]() { config.get<int>("converter.missing"); }));

    config.resetToDefaults();
    std::cout << "[PASS] Overrides merge onto the defaults\n";
}

void testValidation() {
    std::cout << "\n[TEST] Validation\n";

    auto& config = ConfigManager::getInstance();

    config.loadFromJson({{"converter", {{"capslock_mode", "hardware"}}}});
    try {
        config.getConverterConfig();
        assert(false);
    } catch (const MarionetteException& e) {
        assert(e.getType() == ErrorType::CONFIGURATION_ERROR);
    }

    config.loadFromJson({{"converter", {{"target_height", 0}}}});
    assert(expectThrows<MarionetteException>([&config]() { config.getConverterConfig(); }));

    config.loadFromJson({{"converter", {{"drag_duration", -1.0}}}});
    assert(expectThrows<MarionetteException>([&config]() { config.getConverterConfig(); }));

    config.resetToDefaults();
    std::cout << "[PASS] Invalid settings raise CONFIGURATION errors\n";
}

void testFileLoading() {
    std::cout << "\n[TEST] File Loading\n";

    auto& config = ConfigManager::getInstance();

    assert(!config.loadConfig("does/not/exist.json"));
    assert(config.getConverterConfig().targetWidth == 1920);

    fs::path path = fs::temp_directory_path() / "marionette_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"converter": {"target_width": 1280, "target_height": 720}, "logging": {"level": "DEBUG"}})";
    }

    assert(config.loadConfig(path.string()));
    assert(config.getConfigPath() == path.string());
    ConverterConfig converter = config.getConverterConfig();
    assert(converter.targetWidth == 1280);
    assert(converter.targetHeight == 720);
    assert(converter.waitDuration == 1.0);

    fs::remove(path);
    config.resetToDefaults();
    std::cout << "[PASS] Files load over defaults, missing files fall back\n";
}

void testLoggingSettings() {
    std::cout << "\n[TEST] Logging Settings\n";

    auto& config = ConfigManager::getInstance();
    config.loadFromJson({{"logging", {{"level", "warning"}}}});

    unsetenv("MARIONETTE_LOG_LEVEL");
    assert(config.getLogLevel() == "warning");

    setenv("MARIONETTE_LOG_LEVEL", "DEBUG", 1);
    assert(config.getLogLevel() == "DEBUG");

    config.applyLoggingConfig();
    assert(StructuredLogger::getInstance().getLogLevel() == LogLevel::DEBUG);

    unsetenv("MARIONETTE_LOG_LEVEL");
    config.resetToDefaults();
    config.applyLoggingConfig();
    assert(StructuredLogger::getInstance().getLogLevel() == LogLevel::INFO);

    std::cout << "[PASS] MARIONETTE_LOG_LEVEL overrides the configured level\n";
}

int main() {
    std::cout << "=== Marionette Config Manager Test ===\n";

    try {
        testDefaults();
        testOverrides();
        testValidation();
        testFileLoading();
        testLoggingSettings();

        std::cout << "\n[SUCCESS] All config manager tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Test failed: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
