#include "string_utils.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <limits>

namespace marionette {
namespace utils {

namespace {
    const char* const WHITESPACE = " \t\n\r\f\v";
}

std::string StringUtils::trim(const std::string& str) {
    size_t first = str.find_first_not_of(WHITESPACE);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(WHITESPACE);
    return str.substr(first, last - first + 1);
}

std::string StringUtils::trimLeft(const std::string& str) {
    size_t first = str.find_first_not_of(WHITESPACE);
    if (first == std::string::npos) {
        return "";
    }
    return str.substr(first);
}

std::string StringUtils::trimRight(const std::string& str) {
    size_t last = str.find_last_not_of(WHITESPACE);
    if (last == std::string::npos) {
        return "";
    }
    return str.substr(0, last + 1);
}

std::string StringUtils::strip(const std::string& str, const std::string& chars) {
    if (chars.empty()) {
        return str;
    }
    size_t first = str.find_first_not_of(chars);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(chars);
    return str.substr(first, last - first + 1);
}

std::vector<std::string> StringUtils::split(const std::string& str, const std::string& delimiter) {
    std::vector<std::string> result;
    if (str.empty()) {
        return result;
    }
    if (delimiter.empty()) {
        result.push_back(str);
        return result;
    }

    size_t start = 0;
    size_t end = 0;
    while ((end = str.find(delimiter, start)) != std::string::npos) {
        result.push_back(str.substr(start, end - start));
        start = end + delimiter.length();
    }
    result.push_back(str.substr(start));
    return result;
}

std::vector<std::string> StringUtils::splitAny(const std::string& str, const std::string& delimiters) {
    std::vector<std::string> result;
    if (str.empty()) {
        return result;
    }

    std::string current;
    for (char c : str) {
        if (delimiters.find(c) != std::string::npos) {
            result.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    result.push_back(current);
    return result;
}

bool StringUtils::startsWith(const std::string& str, const std::string& prefix) {
    if (str.length() < prefix.length()) {
        return false;
    }
    return str.compare(0, prefix.length(), prefix) == 0;
}

bool StringUtils::endsWith(const std::string& str, const std::string& suffix) {
    if (str.length() < suffix.length()) {
        return false;
    }
    return str.compare(str.length() - suffix.length(), suffix.length(), suffix) == 0;
}

bool StringUtils::contains(const std::string& str, const std::string& needle) {
    return str.find(needle) != std::string::npos;
}

std::string StringUtils::toLowerCase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string StringUtils::toUpperCase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::string StringUtils::join(const std::vector<std::string>& strings, const std::string& delimiter) {
    std::stringstream result;
    for (size_t i = 0; i < strings.size(); ++i) {
        if (i > 0) {
            result << delimiter;
        }
        result << strings[i];
    }
    return result.str();
}

std::string StringUtils::replaceAll(const std::string& str, const std::string& from, const std::string& to) {
    if (from.empty()) {
        return str;
    }

    std::string result = str;
    size_t startPos = 0;
    while ((startPos = result.find(from, startPos)) != std::string::npos) {
        result.replace(startPos, from.length(), to);
        startPos += to.length();
    }
    return result;
}

bool StringUtils::isWhitespaceOnly(const std::string& str) {
    return std::all_of(str.begin(), str.end(), [](char c) { return isWhitespace(c); });
}

bool StringUtils::tryParseDouble(const std::string& str, double& out) {
    std::string trimmed = trim(str);
    if (trimmed.empty()) {
        return false;
    }
    char* end = nullptr;
    double value = std::strtod(trimmed.c_str(), &end);
    if (end == nullptr || *end != '\0') {
        return false;
    }
    out = value;
    return true;
}

bool StringUtils::tryParseInt(const std::string& str, long long& out) {
    std::string trimmed = trim(str);
    if (trimmed.empty()) {
        return false;
    }
    char* end = nullptr;
    long long value = std::strtoll(trimmed.c_str(), &end, 10);
    if (end == nullptr || *end != '\0') {
        return false;
    }
    out = value;
    return true;
}

int StringUtils::saturateToInt(double value) {
    if (std::isnan(value)) {
        return 0;
    }
    if (value >= static_cast<double>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    if (value <= static_cast<double>(std::numeric_limits<int>::min())) {
        return std::numeric_limits<int>::min();
    }
    return static_cast<int>(value);
}

bool StringUtils::isPrintableAscii(const std::string& str) {
    return std::all_of(str.begin(), str.end(), [](char c) {
        unsigned char uc = static_cast<unsigned char>(c);
        return uc >= 0x20 && uc <= 0x7E;
    });
}

std::string StringUtils::quoteLiteral(const std::string& str) {
    bool hasSingle = str.find('\'') != std::string::npos;
    bool hasDouble = str.find('"') != std::string::npos;
    char quote = (hasSingle && !hasDouble) ? '"' : '\'';

    std::string result;
    result.reserve(str.length() + 2);
    result += quote;

    for (char c : str) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (c == '\\') {
            result += "\\\\";
        } else if (c == quote) {
            result += '\\';
            result += c;
        } else if (c == '\n') {
            result += "\\n";
        } else if (c == '\r') {
            result += "\\r";
        } else if (c == '\t') {
            result += "\\t";
        } else if (uc < 0x20 || uc == 0x7F) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\x%02x", uc);
            result += buf;
        } else {
            result += c;
        }
    }

    result += quote;
    return result;
}

std::string StringUtils::formatDecimal(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value < 0 ? "-inf" : "inf";
    }
    if (value == 0.0) {
        return std::signbit(value) ? "-0.0" : "0.0";
    }

    // Shortest scientific rendering that reads back to the same double
    char buf[64];
    for (int precision = 0; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*e", precision, value);
        if (std::strtod(buf, nullptr) == value) {
            break;
        }
    }

    std::string sci(buf);
    bool negative = false;
    if (!sci.empty() && sci[0] == '-') {
        negative = true;
        sci.erase(0, 1);
    }

    size_t ePos = sci.find('e');
    std::string mantissa = sci.substr(0, ePos);
    int exponent = std::atoi(sci.c_str() + ePos + 1);

    std::string digits;
    for (char c : mantissa) {
        if (c != '.') digits += c;
    }
    while (digits.size() > 1 && digits.back() == '0') {
        digits.pop_back();
    }

    std::string out;
    if (exponent >= -4 && exponent < 16) {
        if (exponent >= 0) {
            size_t intLen = static_cast<size_t>(exponent) + 1;
            std::string intPart = digits.substr(0, std::min(intLen, digits.size()));
            if (intPart.size() < intLen) {
                intPart.append(intLen - intPart.size(), '0');
            }
            std::string fracPart = digits.size() > intLen ? digits.substr(intLen) : "0";
            out = intPart + "." + fracPart;
        } else {
            out = "0." + std::string(static_cast<size_t>(-exponent - 1), '0') + digits;
        }
    } else {
        out = digits.substr(0, 1);
        if (digits.size() > 1) {
            out += "." + digits.substr(1);
        }
        char expBuf[16];
        std::snprintf(expBuf, sizeof(expBuf), "e%c%02d", exponent < 0 ? '-' : '+', std::abs(exponent));
        out += expBuf;
    }

    return negative ? "-" + out : out;
}

bool StringUtils::isWhitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace utils
} // namespace marionette
