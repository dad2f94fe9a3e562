#ifndef MARIONETTE_ERROR_HANDLER_H
#define MARIONETTE_ERROR_HANDLER_H

#include <string>
#include <exception>
#include <vector>
#include <chrono>
#include <mutex>

namespace marionette {

enum class ErrorType {
    FORMAT_ERROR,
    UNKNOWN_ACTION_ERROR,
    COORDINATE_RANGE_ERROR,
    DUPLICATE_TERMINAL_ACTION_ERROR,
    ALL_CONVERSIONS_FAILED_ERROR,
    INVALID_KEY_ERROR,
    CONFIGURATION_ERROR,
    VALIDATION_ERROR,
    UNKNOWN_ERROR
};

enum class ErrorSeverity {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

std::string errorTypeToString(ErrorType type);
std::string errorSeverityToString(ErrorSeverity severity);

struct ErrorInfo {
    ErrorType type;
    ErrorSeverity severity;
    std::string message;
    std::string details;
    std::string context;
    std::chrono::system_clock::time_point timestamp;

    ErrorInfo(ErrorType t, ErrorSeverity s, const std::string& msg,
              const std::string& det = "", const std::string& ctx = "")
        : type(t), severity(s), message(msg), details(det), context(ctx),
          timestamp(std::chrono::system_clock::now()) {}
};

class MarionetteException : public std::exception {
public:
    explicit MarionetteException(const ErrorInfo& error) : m_errorInfo(error) {}

    const char* what() const noexcept override {
        return m_errorInfo.message.c_str();
    }

    const ErrorInfo& getErrorInfo() const { return m_errorInfo; }
    ErrorType getType() const { return m_errorInfo.type; }

private:
    ErrorInfo m_errorInfo;
};

// Input text or a command string does not have the expected shape
class FormatError : public MarionetteException {
public:
    explicit FormatError(const std::string& message, const std::string& context = "")
        : MarionetteException(ErrorInfo(ErrorType::FORMAT_ERROR, ErrorSeverity::MEDIUM,
                                         message, "", context)) {}
};

class UnknownActionError : public MarionetteException {
public:
    explicit UnknownActionError(const std::string& message, const std::string& context = "")
        : MarionetteException(ErrorInfo(ErrorType::UNKNOWN_ACTION_ERROR, ErrorSeverity::MEDIUM,
                                         message, "", context)) {}
};

// Raised only when strict coordinate validation is on
class CoordinateRangeError : public MarionetteException {
public:
    explicit CoordinateRangeError(const std::string& message, const std::string& context = "")
        : MarionetteException(ErrorInfo(ErrorType::COORDINATE_RANGE_ERROR, ErrorSeverity::MEDIUM,
                                         message, "", context)) {}
};

class DuplicateTerminalActionError : public MarionetteException {
public:
    explicit DuplicateTerminalActionError(const std::string& message, const std::string& context = "")
        : MarionetteException(ErrorInfo(ErrorType::DUPLICATE_TERMINAL_ACTION_ERROR, ErrorSeverity::HIGH,
                                         message, "", context)) {}
};

/**
 * @brief Every action of a non-empty batch failed and nothing was produced
 *
 * Carries one "<index>: <message>" line per failed action.
 */
class AllConversionsFailedError : public MarionetteException {
public:
    AllConversionsFailedError(const std::string& message, std::vector<std::string> failures)
        : MarionetteException(ErrorInfo(ErrorType::ALL_CONVERSIONS_FAILED_ERROR, ErrorSeverity::HIGH,
                                         message, joinFailures(failures))),
          m_failures(std::move(failures)) {}

    const std::vector<std::string>& getFailures() const { return m_failures; }

private:
    static std::string joinFailures(const std::vector<std::string>& failures);

    std::vector<std::string> m_failures;
};

class InvalidKeyError : public MarionetteException {
public:
    InvalidKeyError(const std::string& message, const std::string& key)
        : MarionetteException(ErrorInfo(ErrorType::INVALID_KEY_ERROR, ErrorSeverity::MEDIUM,
                                         message, "", key)),
          m_key(key) {}

    const std::string& getKey() const { return m_key; }

private:
    std::string m_key;
};

/**
 * @brief Process-wide error sink
 *
 * Logs every reported error through the structured logger and keeps a bounded
 * history. CRITICAL errors are rethrown as MarionetteException after logging.
 */
class ErrorHandler {
public:
    static ErrorHandler& getInstance();

    void handleError(const ErrorInfo& error);
    void handleException(const std::exception& e, const std::string& context = "",
                         ErrorSeverity severity = ErrorSeverity::HIGH);

    void logError(const ErrorInfo& error);
    std::vector<ErrorInfo> getRecentErrors(size_t count = 10) const;
    size_t getErrorCount() const;
    void clearErrorHistory();

    void setMaxHistory(size_t maxHistory);

private:
    ErrorHandler() = default;
    ~ErrorHandler() = default;
    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    std::vector<ErrorInfo> m_errorHistory;
    size_t m_maxHistory = 1000;
    mutable std::mutex m_mutex;
};

// Convenience macros for error handling
#define MARIONETTE_THROW(type, severity, message, details, context) \
    throw marionette::MarionetteException(marionette::ErrorInfo(type, severity, message, details, context))

#define MARIONETTE_HANDLE_ERROR(type, severity, message, details, context) \
    marionette::ErrorHandler::getInstance().handleError(marionette::ErrorInfo(type, severity, message, details, context))

} // namespace marionette

#endif // MARIONETTE_ERROR_HANDLER_H
