// EN: Implementation of the Logger class. Thread-safe NDJSON logging with correlation IDs.
// FR: Implémentation de la classe Logger. Logging NDJSON thread-safe avec IDs de corrélation.

#include "infrastructure/logging/logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <random>

namespace PHR {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

// EN: Destructor ensures all logs are flushed.
// FR: Le destructeur assure que tous les logs sont vidés.
Logger::~Logger() {
    flush();
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_level_ = level;
}

LogLevel Logger::getLogLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_level_;
}

// EN: Set output file and disable console output. Returns false if the file cannot be opened.
// FR: Définit le fichier de sortie et désactive la console. Retourne false si le fichier ne s'ouvre pas.
bool Logger::setOutputFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_) {
        log_file_->close();
        log_file_.reset();
    }
    if (filename.empty()) {
        console_output_ = true;
        return true;
    }
    auto file = std::make_unique<std::ofstream>(filename, std::ios::app);
    if (!file->is_open()) {
        std::cerr << "Failed to open log file: " << filename << std::endl;
        console_output_ = true;
        return false;
    }
    log_file_ = std::move(file);
    console_output_ = false;
    return true;
}

void Logger::setCorrelationId(const std::string& correlation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    correlation_id_ = correlation_id;
}

void Logger::addGlobalMetadata(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    global_metadata_[key] = value;
}

void Logger::clearGlobalMetadata() {
    std::lock_guard<std::mutex> lock(mutex_);
    global_metadata_.clear();
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message) {
    log(level, module, message, {});
}

// EN: Build the entry under the lock, then hand it to the writer.
// FR: Construit l'entrée sous verrou, puis la transmet à l'écrivain.
void Logger::log(LogLevel level, const std::string& module, const std::string& message,
                 const std::unordered_map<std::string, std::string>& metadata) {
    LogEntry entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < current_level_) {
            return;
        }
        entry.correlation_id = correlation_id_;
        entry.metadata = metadata;

        // EN: Merge global metadata, preserving entry-specific metadata.
        // FR: Fusionne les métadonnées globales, en préservant celles de l'entrée.
        for (const auto& [key, value] : global_metadata_) {
            if (entry.metadata.find(key) == entry.metadata.end()) {
                entry.metadata[key] = value;
            }
        }
    }

    entry.timestamp = std::chrono::system_clock::now();
    entry.level = level;
    entry.message = message;
    entry.module = module;
    entry.thread_id = getThreadId();

    writeEntry(entry);
}

void Logger::debug(const std::string& module, const std::string& message) {
    log(LogLevel::DEBUG, module, message);
}

void Logger::info(const std::string& module, const std::string& message) {
    log(LogLevel::INFO, module, message);
}

void Logger::warn(const std::string& module, const std::string& message) {
    log(LogLevel::WARN, module, message);
}

void Logger::error(const std::string& module, const std::string& message) {
    log(LogLevel::ERROR, module, message);
}

void Logger::debug(const std::string& module, const std::string& message,
                   const std::unordered_map<std::string, std::string>& metadata) {
    log(LogLevel::DEBUG, module, message, metadata);
}

void Logger::info(const std::string& module, const std::string& message,
                  const std::unordered_map<std::string, std::string>& metadata) {
    log(LogLevel::INFO, module, message, metadata);
}

void Logger::warn(const std::string& module, const std::string& message,
                  const std::unordered_map<std::string, std::string>& metadata) {
    log(LogLevel::WARN, module, message, metadata);
}

void Logger::error(const std::string& module, const std::string& message,
                   const std::unordered_map<std::string, std::string>& metadata) {
    log(LogLevel::ERROR, module, message, metadata);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_) {
        log_file_->flush();
    }
    if (console_output_) {
        std::cerr.flush();
    }
}

// EN: Generate a UUID-like correlation ID for run tracing.
// FR: Génère un ID de corrélation similaire à UUID pour le traçage des exécutions.
std::string Logger::generateCorrelationId() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << std::hex;
    for (int i = 0; i < 32; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) {
            ss << "-";
        }
        ss << dis(gen);
    }
    return ss.str();
}

// EN: Console entries go to stderr; stdout belongs to task output.
// FR: Les entrées console vont sur stderr ; stdout appartient à la sortie des tâches.
void Logger::writeEntry(const LogEntry& entry) {
    std::string ndjson = formatAsNDJSON(entry);

    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_ && log_file_->is_open()) {
        *log_file_ << ndjson << '\n';
    }
    if (console_output_) {
        std::cerr << ndjson << std::endl;
    }
}

std::string Logger::formatAsNDJSON(const LogEntry& entry) {
    nlohmann::json json;
    json["timestamp"] = timestampToISO8601(entry.timestamp);
    json["level"] = levelToString(entry.level);
    json["message"] = entry.message;
    json["module"] = entry.module;
    json["thread_id"] = entry.thread_id;

    if (!entry.correlation_id.empty()) {
        json["correlation_id"] = entry.correlation_id;
    }

    for (const auto& [key, value] : entry.metadata) {
        if (!json.contains(key)) {
            json[key] = value;
        }
    }

    return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default:              return "UNKNOWN";
    }
}

std::optional<LogLevel> Logger::levelFromString(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return std::nullopt;
}

std::string Logger::timestampToISO8601(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return ss.str();
}

std::string Logger::getThreadId() {
    std::ostringstream ss;
    ss << std::this_thread::get_id();
    return ss.str();
}

} // namespace PHR
