#ifndef MARIONETTE_STRING_UTILS_H
#define MARIONETTE_STRING_UTILS_H

#include <string>
#include <vector>

namespace marionette {
namespace utils {

/**
 * @brief String helpers shared by the parser, converters and translator
 */
class StringUtils {
public:
    /**
     * @brief Remove leading and trailing whitespace
     */
    static std::string trim(const std::string& str);
    static std::string trimLeft(const std::string& str);
    static std::string trimRight(const std::string& str);

    /**
     * @brief Remove every leading and trailing character found in chars
     * @param str Input string
     * @param chars Set of characters to strip, e.g. "()"
     * @return Stripped string
     */
    static std::string strip(const std::string& str, const std::string& chars);

    /**
     * @brief Split on a delimiter, keeping empty fields
     * @return One element per field; an empty input yields an empty vector
     */
    static std::vector<std::string> split(const std::string& str, const std::string& delimiter);

    /**
     * @brief Split on any of the given characters, keeping empty fields
     */
    static std::vector<std::string> splitAny(const std::string& str, const std::string& delimiters);

    static bool startsWith(const std::string& str, const std::string& prefix);
    static bool endsWith(const std::string& str, const std::string& suffix);
    static bool contains(const std::string& str, const std::string& needle);

    static std::string toLowerCase(const std::string& str);
    static std::string toUpperCase(const std::string& str);

    static std::string join(const std::vector<std::string>& strings, const std::string& delimiter);

    /**
     * @brief Replace all occurrences of from with to
     * @note An empty from returns the input unchanged
     */
    static std::string replaceAll(const std::string& str, const std::string& from, const std::string& to);

    static bool isWhitespaceOnly(const std::string& str);

    /**
     * @brief Parse the whole trimmed string as a number
     * @return false on empty input or trailing garbage; out is untouched then
     */
    static bool tryParseDouble(const std::string& str, double& out);
    static bool tryParseInt(const std::string& str, long long& out);

    /**
     * @brief Truncate toward zero and saturate at the int limits; NaN gives 0
     */
    static int saturateToInt(double value);

    /**
     * @brief True when every byte is in the printable ASCII range 0x20..0x7E
     */
    static bool isPrintableAscii(const std::string& str);

    /**
     * @brief Render a string as a quoted literal the automation runtime accepts
     *
     * Single quotes are used unless the text contains a single quote and no
     * double quote. Backslash, the chosen quote, \n, \r and \t are escaped;
     * other control bytes become \xNN. Bytes >= 0x80 pass through.
     */
    static std::string quoteLiteral(const std::string& str);

    /**
     * @brief Shortest round-trip rendering of a double that always reads back as a float
     *
     * 0.5 -> "0.5", 1 -> "1.0", 1e16 -> "1e+16", 1e-05 -> "1e-05".
     */
    static std::string formatDecimal(double value);

private:
    static bool isWhitespace(char c);
};

} // namespace utils
} // namespace marionette

#endif // MARIONETTE_STRING_UTILS_H
