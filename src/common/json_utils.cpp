#include "json_utils.h"
#include "structured_logger.h"
#include "string_utils.h"
#include <fstream>
#include <filesystem>

namespace marionette {
namespace utils {

std::string JsonUtils::getStringField(const nlohmann::json& json, const std::string& fieldName, const std::string& defaultValue) {
    if (!json.is_object() || !json.contains(fieldName)) {
        return defaultValue;
    }

    const auto& field = json[fieldName];
    if (field.is_string()) {
        return field.get<std::string>();
    } else if (field.is_number_integer()) {
        return std::to_string(field.get<long long>());
    } else if (field.is_number()) {
        return StringUtils::formatDecimal(field.get<double>());
    } else if (field.is_boolean()) {
        return field.get<bool>() ? "true" : "false";
    }

    SLOG_DEBUG().message("Field is not a string, returning default value").context("field", fieldName);
    return defaultValue;
}

int JsonUtils::getIntField(const nlohmann::json& json, const std::string& fieldName, int defaultValue) {
    if (!json.is_object() || !json.contains(fieldName)) {
        return defaultValue;
    }

    const auto& field = json[fieldName];
    if (field.is_number_integer()) {
        return field.get<int>();
    } else if (field.is_number_float()) {
        return static_cast<int>(field.get<double>());
    } else if (field.is_string()) {
        try {
            return static_cast<int>(std::stod(field.get<std::string>()));
        } catch (const std::exception&) {
            SLOG_DEBUG().message("Cannot convert string field to integer, returning default").context("field", fieldName);
            return defaultValue;
        }
    }

    SLOG_DEBUG().message("Field is not a number, returning default value").context("field", fieldName);
    return defaultValue;
}

double JsonUtils::getDoubleField(const nlohmann::json& json, const std::string& fieldName, double defaultValue) {
    if (!json.is_object() || !json.contains(fieldName)) {
        return defaultValue;
    }

    const auto& field = json[fieldName];
    if (field.is_number()) {
        return field.get<double>();
    } else if (field.is_string()) {
        try {
            return std::stod(field.get<std::string>());
        } catch (const std::exception&) {
            SLOG_DEBUG().message("Cannot convert string field to double, returning default").context("field", fieldName);
            return defaultValue;
        }
    }

    SLOG_DEBUG().message("Field is not a number, returning default value").context("field", fieldName);
    return defaultValue;
}

bool JsonUtils::getBoolField(const nlohmann::json& json, const std::string& fieldName, bool defaultValue) {
    if (!json.is_object() || !json.contains(fieldName)) {
        return defaultValue;
    }

    const auto& field = json[fieldName];
    if (field.is_boolean()) {
        return field.get<bool>();
    } else if (field.is_string()) {
        std::string strValue = StringUtils::toLowerCase(StringUtils::trim(field.get<std::string>()));
        if (strValue == "true" || strValue == "1" || strValue == "yes") {
            return true;
        } else if (strValue == "false" || strValue == "0" || strValue == "no") {
            return false;
        }
        SLOG_DEBUG().message("Cannot convert string field to boolean, returning default").context("field", fieldName);
        return defaultValue;
    } else if (field.is_number()) {
        return field.get<double>() != 0.0;
    }

    return defaultValue;
}

bool JsonUtils::getObjectField(const nlohmann::json& json, const std::string& fieldName, nlohmann::json& result) {
    if (!json.is_object() || !json.contains(fieldName) || !json[fieldName].is_object()) {
        return false;
    }
    result = json[fieldName];
    return true;
}

bool JsonUtils::getArrayField(const nlohmann::json& json, const std::string& fieldName, nlohmann::json& result) {
    if (!json.is_object() || !json.contains(fieldName) || !json[fieldName].is_array()) {
        return false;
    }
    result = json[fieldName];
    return true;
}

nlohmann::json JsonUtils::mergeJsonObjects(const nlohmann::json& base, const nlohmann::json& overlay) {
    if (!base.is_object() || !overlay.is_object()) {
        return overlay.is_null() ? base : overlay;
    }

    nlohmann::json result = base;
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        if (result.contains(it.key()) && result[it.key()].is_object() && it.value().is_object()) {
            result[it.key()] = mergeJsonObjects(result[it.key()], it.value());
        } else {
            result[it.key()] = it.value();
        }
    }
    return result;
}

bool JsonUtils::tryParse(const std::string& text, nlohmann::json& result) {
    nlohmann::json parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return false;
    }
    result = std::move(parsed);
    return true;
}

std::string JsonUtils::safeDump(const nlohmann::json& json, int indent) {
    return json.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool JsonUtils::loadJsonFromFile(const std::string& filePath, nlohmann::json& jsonOutput) {
    if (filePath.empty()) {
        SLOG_ERROR().message("Empty file path provided to loadJsonFromFile");
        return false;
    }

    std::error_code ec;
    if (!std::filesystem::exists(filePath, ec)) {
        SLOG_WARNING().message("File not found").context("path", filePath);
        return false;
    }

    std::ifstream file(filePath);
    if (!file.is_open()) {
        SLOG_ERROR().message("Cannot open file for reading").context("path", filePath);
        return false;
    }

    try {
        file >> jsonOutput;
    } catch (const nlohmann::json::parse_error& e) {
        SLOG_ERROR().message("JSON parse error").context("path", filePath).context("error", e.what());
        return false;
    }

    return true;
}

} // namespace utils
} // namespace marionette
