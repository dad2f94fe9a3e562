#include "error_handler.h"
#include "structured_logger.h"
#include <sstream>

namespace marionette {

std::string errorTypeToString(ErrorType type) {
    switch (type) {
        case ErrorType::FORMAT_ERROR: return "FORMAT";
        case ErrorType::UNKNOWN_ACTION_ERROR: return "UNKNOWN_ACTION";
        case ErrorType::COORDINATE_RANGE_ERROR: return "COORDINATE_RANGE";
        case ErrorType::DUPLICATE_TERMINAL_ACTION_ERROR: return "DUPLICATE_TERMINAL_ACTION";
        case ErrorType::ALL_CONVERSIONS_FAILED_ERROR: return "ALL_CONVERSIONS_FAILED";
        case ErrorType::INVALID_KEY_ERROR: return "INVALID_KEY";
        case ErrorType::CONFIGURATION_ERROR: return "CONFIGURATION";
        case ErrorType::VALIDATION_ERROR: return "VALIDATION";
        case ErrorType::UNKNOWN_ERROR: return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::string errorSeverityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::LOW: return "LOW";
        case ErrorSeverity::MEDIUM: return "MEDIUM";
        case ErrorSeverity::HIGH: return "HIGH";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

std::string AllConversionsFailedError::joinFailures(const std::vector<std::string>& failures) {
    std::ostringstream oss;
    for (size_t i = 0; i < failures.size(); ++i) {
        if (i > 0) oss << "; ";
        oss << failures[i];
    }
    return oss.str();
}

ErrorHandler& ErrorHandler::getInstance() {
    static ErrorHandler instance;
    return instance;
}

void ErrorHandler::handleError(const ErrorInfo& error) {
    logError(error);

    if (error.severity == ErrorSeverity::CRITICAL) {
        throw MarionetteException(error);
    }
}

void ErrorHandler::handleException(const std::exception& e, const std::string& context,
                                   ErrorSeverity severity) {
    const MarionetteException* marionetteError = dynamic_cast<const MarionetteException*>(&e);
    if (marionetteError) {
        ErrorInfo info = marionetteError->getErrorInfo();
        info.severity = severity;
        if (info.context.empty()) {
            info.context = context;
        }
        handleError(info);
    } else {
        ErrorInfo error(ErrorType::UNKNOWN_ERROR, severity, e.what(), "", context);
        handleError(error);
    }
}

void ErrorHandler::logError(const ErrorInfo& error) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_errorHistory.push_back(error);
        while (m_errorHistory.size() > m_maxHistory) {
            m_errorHistory.erase(m_errorHistory.begin());
        }
    }

    std::ostringstream logMessage;
    logMessage << "[" << errorTypeToString(error.type) << "] " << error.message;
    if (!error.details.empty()) {
        logMessage << " - Details: " << error.details;
    }
    if (!error.context.empty()) {
        logMessage << " - Context: " << error.context;
    }

    switch (error.severity) {
        case ErrorSeverity::LOW:
            SLOG_DEBUG().message(logMessage.str()).context("error_type", errorTypeToString(error.type)).context("severity", errorSeverityToString(error.severity));
            break;
        case ErrorSeverity::MEDIUM:
            SLOG_WARNING().message(logMessage.str()).context("error_type", errorTypeToString(error.type)).context("severity", errorSeverityToString(error.severity));
            break;
        case ErrorSeverity::HIGH:
            SLOG_ERROR().message(logMessage.str()).context("error_type", errorTypeToString(error.type)).context("severity", errorSeverityToString(error.severity));
            break;
        case ErrorSeverity::CRITICAL:
            SLOG_CRITICAL().message(logMessage.str()).context("error_type", errorTypeToString(error.type)).context("severity", errorSeverityToString(error.severity));
            break;
    }
}

std::vector<ErrorInfo> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t start = (m_errorHistory.size() > count) ? m_errorHistory.size() - count : 0;
    return std::vector<ErrorInfo>(m_errorHistory.begin() + static_cast<std::ptrdiff_t>(start),
                                  m_errorHistory.end());
}

size_t ErrorHandler::getErrorCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_errorHistory.size();
}

void ErrorHandler::clearErrorHistory() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_errorHistory.clear();
}

void ErrorHandler::setMaxHistory(size_t maxHistory) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_maxHistory = maxHistory == 0 ? 1 : maxHistory;
    while (m_errorHistory.size() > m_maxHistory) {
        m_errorHistory.erase(m_errorHistory.begin());
    }
}

} // namespace marionette
