#include "structured_logger.h"
#include "json_utils.h"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <ctime>

namespace marionette {

namespace fs = std::filesystem;

namespace {
    std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
        auto time_t = std::chrono::system_clock::to_time_t(tp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            tp.time_since_epoch()) % 1000;

        std::tm local{};
#ifdef _WIN32
        localtime_s(&local, &time_t);
#else
        localtime_r(&time_t, &local);
#endif
        std::stringstream ss;
        ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    std::string threadIdToString(std::thread::id id) {
        std::stringstream ss;
        ss << id;
        return ss.str();
    }
}

std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR_LEVEL: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

LogLevel parseLogLevel(const std::string& name, LogLevel fallback) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG" || upper == "TRACE") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARNING" || upper == "WARN") return LogLevel::WARNING;
    if (upper == "ERROR") return LogLevel::ERROR_LEVEL;
    if (upper == "CRITICAL" || upper == "FATAL") return LogLevel::CRITICAL;
    return fallback;
}

// JsonLogFormatter implementation
std::string JsonLogFormatter::format(const LogEntry& entry) {
    nlohmann::json log_json;

    log_json["timestamp"] = formatTimestamp(entry.timestamp);
    log_json["level"] = logLevelToString(entry.level);
    log_json["message"] = entry.message;
    log_json["thread"] = threadIdToString(entry.thread_id);

    if (!entry.component.empty()) {
        log_json["component"] = entry.component;
    }

    if (!entry.file.empty()) {
        log_json["source"]["file"] = fs::path(entry.file).filename().string();
        log_json["source"]["line"] = entry.line;
    }

    if (!entry.context.empty()) {
        log_json["context"] = entry.context;
    }

    return utils::JsonUtils::safeDump(log_json) + "\n";
}

// TextLogFormatter implementation
std::string TextLogFormatter::format(const LogEntry& entry) {
    std::stringstream ss;

    ss << "[" << formatTimestamp(entry.timestamp) << "] ";
    ss << "[" << std::setw(8) << logLevelToString(entry.level) << "] ";

    if (!entry.component.empty()) {
        ss << "[" << entry.component << "] ";
    }

    ss << entry.message;

    // Source location only for errors and above
    if (!entry.file.empty() && entry.level >= LogLevel::ERROR_LEVEL) {
        ss << " (" << fs::path(entry.file).filename().string() << ":" << entry.line << ")";
    }

    if (!entry.context.empty()) {
        ss << " " << utils::JsonUtils::safeDump(entry.context);
    }

    ss << "\n";
    return ss.str();
}

// ConsoleLogSink implementation
ConsoleLogSink::ConsoleLogSink(std::shared_ptr<ILogFormatter> formatter)
    : m_formatter(std::move(formatter)) {}

void ConsoleLogSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::string formatted = m_formatter->format(entry);
    if (entry.level >= LogLevel::ERROR_LEVEL) {
        std::cerr << formatted;
    } else {
        std::cout << formatted;
    }
}

void ConsoleLogSink::flush() {
    std::cout.flush();
    std::cerr.flush();
}

// FileLogSink implementation
FileLogSink::FileLogSink(const std::string& path, std::shared_ptr<ILogFormatter> formatter)
    : m_path(path), m_formatter(std::move(formatter)) {
    fs::path p(m_path);
    if (p.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(p.parent_path(), ec);
    }
    m_file.open(m_path, std::ios::app);
}

FileLogSink::~FileLogSink() {
    if (m_file.is_open()) {
        m_file.close();
    }
}

void FileLogSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_file.is_open()) {
        return;
    }
    m_file << m_formatter->format(entry);
}

void FileLogSink::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file.is_open()) {
        m_file.flush();
    }
}

bool FileLogSink::isOpen() const {
    return m_file.is_open();
}

// MemoryLogSink implementation
void MemoryLogSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.push_back(entry);
}

std::vector<LogEntry> MemoryLogSink::entries() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries;
}

size_t MemoryLogSink::count(LogLevel level) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<size_t>(std::count_if(m_entries.begin(), m_entries.end(),
        [level](const LogEntry& e) { return e.level == level; }));
}

bool MemoryLogSink::contains(const std::string& messageFragment) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::any_of(m_entries.begin(), m_entries.end(),
        [&messageFragment](const LogEntry& e) {
            return e.message.find(messageFragment) != std::string::npos;
        });
}

void MemoryLogSink::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
}

// StructuredLogger implementation
StructuredLogger& StructuredLogger::getInstance() {
    static StructuredLogger instance;
    return instance;
}

StructuredLogger::StructuredLogger()
    : m_minLevel(LogLevel::INFO) {
    addSink(std::make_shared<ConsoleLogSink>(std::make_shared<TextLogFormatter>()));
}

void StructuredLogger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_minLevel = level;
}

LogLevel StructuredLogger::getLogLevel() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_minLevel;
}

void StructuredLogger::addSink(std::shared_ptr<ILogSink> sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sinks.push_back(std::move(sink));
}

void StructuredLogger::removeSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sinks.erase(std::remove(m_sinks.begin(), m_sinks.end(), sink), m_sinks.end());
}

void StructuredLogger::clearSinks() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sinks.clear();
}

void StructuredLogger::log(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (entry.level < m_minLevel) return;

    for (auto& sink : m_sinks) {
        sink->write(entry);
    }
}

void StructuredLogger::log(LogLevel level, const std::string& message,
                           const nlohmann::json& context) {
    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.level = level;
    entry.message = message;
    entry.thread_id = std::this_thread::get_id();
    entry.context = context;

    log(entry);
}

void StructuredLogger::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& sink : m_sinks) {
        sink->flush();
    }
}

// LogBuilder implementation
StructuredLogger::LogBuilder::LogBuilder(StructuredLogger* logger, LogLevel level)
    : m_logger(logger) {
    m_entry.level = level;
    m_entry.timestamp = std::chrono::system_clock::now();
    m_entry.thread_id = std::this_thread::get_id();
}

StructuredLogger::LogBuilder::LogBuilder(LogBuilder&& other) noexcept
    : m_logger(other.m_logger), m_entry(std::move(other.m_entry)) {
    other.m_logger = nullptr;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::message(const std::string& msg) {
    m_entry.message = msg;
    return *this;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::context(const std::string& key, const nlohmann::json& value) {
    m_entry.context[key] = value;
    return *this;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::component(const std::string& name) {
    m_entry.component = name;
    return *this;
}

StructuredLogger::LogBuilder&
StructuredLogger::LogBuilder::file(const char* file, int line) {
    m_entry.file = file;
    m_entry.line = line;
    return *this;
}

StructuredLogger::LogBuilder::~LogBuilder() {
    if (m_logger) {
        m_logger->log(m_entry);
    }
}

} // namespace marionette
