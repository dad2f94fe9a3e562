#ifndef MARIONETTE_JSON_UTILS_H
#define MARIONETTE_JSON_UTILS_H

#include <string>
#include <nlohmann/json.hpp>

namespace marionette {
namespace utils {

/**
 * @brief Lenient field extraction and document helpers over nlohmann::json
 *
 * Getters never throw: a missing field, or one of an unconvertible type,
 * yields the supplied default.
 */
class JsonUtils {
public:
    /**
     * @brief Get a string field; numbers and booleans are rendered as text
     */
    static std::string getStringField(const nlohmann::json& json, const std::string& fieldName, const std::string& defaultValue = "");

    /**
     * @brief Get an integer field; floats truncate and numeric strings are parsed
     */
    static int getIntField(const nlohmann::json& json, const std::string& fieldName, int defaultValue = 0);

    static double getDoubleField(const nlohmann::json& json, const std::string& fieldName, double defaultValue = 0.0);

    /**
     * @brief Get a boolean field; accepts "true"/"false"/"1"/"0"/"yes"/"no" strings
     */
    static bool getBoolField(const nlohmann::json& json, const std::string& fieldName, bool defaultValue = false);

    static bool getObjectField(const nlohmann::json& json, const std::string& fieldName, nlohmann::json& result);
    static bool getArrayField(const nlohmann::json& json, const std::string& fieldName, nlohmann::json& result);

    /**
     * @brief Recursively merge overlay into base
     * @note Nested objects merge key by key; any other overlay value replaces the base value
     */
    static nlohmann::json mergeJsonObjects(const nlohmann::json& base, const nlohmann::json& overlay);

    /**
     * @brief Parse text without throwing
     * @return true and fills result when text is valid JSON
     */
    static bool tryParse(const std::string& text, nlohmann::json& result);

    /**
     * @brief Serialize without throwing; invalid UTF-8 becomes U+FFFD
     */
    static std::string safeDump(const nlohmann::json& json, int indent = -1);

    /**
     * @brief Read and parse a JSON file
     * @return false when the file is missing, unreadable or malformed
     */
    static bool loadJsonFromFile(const std::string& filePath, nlohmann::json& jsonOutput);
};

} // namespace utils
} // namespace marionette

#endif // MARIONETTE_JSON_UTILS_H
