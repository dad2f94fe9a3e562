#ifndef MARIONETTE_STRUCTURED_LOGGER_H
#define MARIONETTE_STRUCTURED_LOGGER_H

#include <string>
#include <memory>
#include <chrono>
#include <thread>
#include <mutex>
#include <vector>
#include <fstream>
#include <nlohmann/json.hpp>

namespace marionette {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR_LEVEL,  // ERROR collides with a Windows macro
    CRITICAL
};

std::string logLevelToString(LogLevel level);

/**
 * @brief Parse a level name ("debug", "INFO", "warn", ...)
 * @return Parsed level, or fallback when the name is not recognised
 */
LogLevel parseLogLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

/**
 * @brief One structured log record
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string message;
    std::string component;
    std::string file;
    int line;
    std::thread::id thread_id;
    nlohmann::json context;

    LogEntry() : level(LogLevel::INFO), line(0) {}
};

/**
 * @brief Log formatter interface
 */
class ILogFormatter {
public:
    virtual ~ILogFormatter() = default;
    virtual std::string format(const LogEntry& entry) = 0;
};

/**
 * @brief One JSON object per line
 */
class JsonLogFormatter : public ILogFormatter {
public:
    std::string format(const LogEntry& entry) override;
};

/**
 * @brief Human-readable single line format
 */
class TextLogFormatter : public ILogFormatter {
public:
    std::string format(const LogEntry& entry) override;
};

/**
 * @brief Log sink interface
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() = 0;
};

/**
 * @brief Writes to stdout, or stderr for ERROR and above
 */
class ConsoleLogSink : public ILogSink {
public:
    explicit ConsoleLogSink(std::shared_ptr<ILogFormatter> formatter);
    void write(const LogEntry& entry) override;
    void flush() override;

private:
    std::shared_ptr<ILogFormatter> m_formatter;
    std::mutex m_mutex;
};

/**
 * @brief Appends formatted entries to a file
 */
class FileLogSink : public ILogSink {
public:
    FileLogSink(const std::string& path, std::shared_ptr<ILogFormatter> formatter);
    ~FileLogSink() override;

    void write(const LogEntry& entry) override;
    void flush() override;

    bool isOpen() const;

private:
    std::string m_path;
    std::shared_ptr<ILogFormatter> m_formatter;
    std::ofstream m_file;
    std::mutex m_mutex;
};

/**
 * @brief Keeps entries in memory so callers can inspect what was logged
 */
class MemoryLogSink : public ILogSink {
public:
    void write(const LogEntry& entry) override;
    void flush() override {}

    std::vector<LogEntry> entries() const;
    size_t count(LogLevel level) const;
    bool contains(const std::string& messageFragment) const;
    void clear();

private:
    mutable std::mutex m_mutex;
    std::vector<LogEntry> m_entries;
};

class StructuredLogger {
public:
    static StructuredLogger& getInstance();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;
    void addSink(std::shared_ptr<ILogSink> sink);
    void removeSink(const std::shared_ptr<ILogSink>& sink);
    void clearSinks();

    void log(const LogEntry& entry);
    void log(LogLevel level, const std::string& message,
             const nlohmann::json& context = {});

    // Fluent builder, writes the entry when it goes out of scope
    class LogBuilder {
    public:
        LogBuilder(StructuredLogger* logger, LogLevel level);
        LogBuilder(LogBuilder&& other) noexcept;
        LogBuilder(const LogBuilder&) = delete;
        LogBuilder& operator=(const LogBuilder&) = delete;

        LogBuilder& message(const std::string& msg);
        LogBuilder& context(const std::string& key, const nlohmann::json& value);
        LogBuilder& component(const std::string& name);
        LogBuilder& file(const char* file, int line);

        ~LogBuilder();

    private:
        StructuredLogger* m_logger;
        LogEntry m_entry;
    };

    LogBuilder debug() { return LogBuilder(this, LogLevel::DEBUG); }
    LogBuilder info() { return LogBuilder(this, LogLevel::INFO); }
    LogBuilder warning() { return LogBuilder(this, LogLevel::WARNING); }
    LogBuilder error() { return LogBuilder(this, LogLevel::ERROR_LEVEL); }
    LogBuilder critical() { return LogBuilder(this, LogLevel::CRITICAL); }

    void flush();

private:
    StructuredLogger();
    ~StructuredLogger() = default;
    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    LogLevel m_minLevel;
    std::vector<std::shared_ptr<ILogSink>> m_sinks;
    mutable std::mutex m_mutex;
};

// Convenience macros for structured logging
#define SLOG_DEBUG() marionette::StructuredLogger::getInstance().debug().file(__FILE__, __LINE__)
#define SLOG_INFO() marionette::StructuredLogger::getInstance().info().file(__FILE__, __LINE__)
#define SLOG_WARNING() marionette::StructuredLogger::getInstance().warning().file(__FILE__, __LINE__)
#define SLOG_ERROR() marionette::StructuredLogger::getInstance().error().file(__FILE__, __LINE__)
#define SLOG_CRITICAL() marionette::StructuredLogger::getInstance().critical().file(__FILE__, __LINE__)

} // namespace marionette

#endif // MARIONETTE_STRUCTURED_LOGGER_H
