#include "transread/utils/log_engine.hpp"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>
#include <filesystem>
#include <stdexcept>


namespace transread {
namespace logging {

LogEngine& LogEngine::getInstance() {
    static LogEngine instance;
    return instance;
}

LogEngine::LogEngine() 
    : initialized_(false)
    , total_entries_(0) {
}

LogEngine::~LogEngine() {
    shutdown();
}

bool LogEngine::initialize(const StorageConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (initialized_) {
        return false;
    }
    
    config_ = config;
    storage_ = createStorage(config.format);
    
    if (!storage_->initialize(config)) {
        storage_.reset();
        return false;
    }
    
    initialized_ = true;
    
    return true;
}

bool LogEngine::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (!initialized_) {
        return false;
    }
    
    storage_->flush();
    storage_.reset();
    initialized_ = false;
    
    return true;
}

void LogEngine::logDebug(const std::string& category, const std::string& operation,
                         const std::string& message, const nlohmann::json& data) {
    LogEntry entry;
    entry.level = LogLevel::DEBUG;
    entry.category = category;
    entry.operation = operation;
    entry.message = message;
    entry.data = data;
    entry.success = true;
    
    store(std::move(entry));
}

void LogEngine::logInfo(const std::string& category, const std::string& operation,
                        const std::string& message, const nlohmann::json& data) {
    LogEntry entry;
    entry.level = LogLevel::INFO;
    entry.category = category;
    entry.operation = operation;
    entry.message = message;
    entry.data = data;
    entry.success = true;
    
    store(std::move(entry));
}

void LogEngine::logWarning(const std::string& category, const std::string& operation,
                           const std::string& message, const nlohmann::json& data) {
    LogEntry entry;
    entry.level = LogLevel::WARNING;
    entry.category = category;
    entry.operation = operation;
    entry.message = message;
    entry.data = data;
    entry.success = false;
    
    store(std::move(entry));
}

void LogEngine::logError(const std::string& category, const std::string& operation,
                         const std::string& message, int error_code, 
                         const nlohmann::json& data) {
    LogEntry entry;
    entry.level = LogLevel::ERROR;
    entry.category = category;
    entry.operation = operation;
    entry.message = message;
    entry.error_code = error_code;
    entry.data = data;
    entry.success = false;
    
    store(std::move(entry));
}

void LogEngine::logOperation(const std::string& category, const std::string& operation,
                             bool success, double duration_ms, const nlohmann::json& data) {
    LogEntry entry;
    entry.level = success ? LogLevel::DEBUG : LogLevel::ERROR;
    entry.category = category;
    entry.operation = operation;
    entry.message = success ? "Operation completed successfully" : "Operation failed";
    entry.duration_ms = duration_ms;
    entry.data = data;
    entry.success = success;
    
    store(std::move(entry));
}

std::string LogEngine::getCurrentFile() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return storage_ ? storage_->currentFile() : std::string();
}

uint64_t LogEngine::getTotalCount() const {
    return total_entries_.load();
}

std::map<std::string, uint64_t> LogEngine::getCountByCategory() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return category_counts_;
}

LogLevel LogEngine::parseLevel(const std::string& name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info") return LogLevel::INFO;
    if (name == "warning") return LogLevel::WARNING;
    if (name == "error") return LogLevel::ERROR;
    if (name == "critical") return LogLevel::CRITICAL;
    throw std::invalid_argument("unknown log level '" + name + "'");
}

StorageFormat LogEngine::parseFormat(const std::string& name) {
    if (name == "text") return StorageFormat::TEXT;
    if (name == "json") return StorageFormat::JSON;
    throw std::invalid_argument("unknown log format '" + name + "'");
}

std::string LogEngine::getLevelString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

std::string LogEngine::getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    
    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);
    
    std::stringstream ss;
    ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count();
    
    return ss.str();
}

void LogEngine::store(LogEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (!initialized_ || entry.level < config_.min_level) {
        return;
    }
    
    entry.timestamp = getCurrentTimestamp();
    
    total_entries_++;
    category_counts_[entry.category]++;
    
    storage_->store(entry);
    storage_->flush();
}

std::unique_ptr<LogStorage> LogEngine::createStorage(StorageFormat format) {
    switch (format) {
        case StorageFormat::JSON:
            return std::make_unique<JsonStorage>();
        case StorageFormat::TEXT:
        default:
            return std::make_unique<TextStorage>();
    }
}

namespace {

std::string openLogFile(const StorageConfig& config, const char* extension, std::ofstream& stream) {
    std::error_code ec;
    std::filesystem::create_directories(config.base_path, ec);
    if (ec) {
        return std::string();
    }
    
    std::string path = config.base_path + "/transread_" +
                       std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) +
                       extension;
    stream.open(path, std::ios::app);
    return stream.is_open() ? path : std::string();
}

}

bool TextStorage::initialize(const StorageConfig& config) {
    config_ = config;
    
    if (config.base_path.empty()) {
        return true;
    }
    
    current_file_ = openLogFile(config, ".log", file_stream_);
    return file_stream_.is_open();
}

std::ostream& TextStorage::out() {
    if (file_stream_.is_open()) {
        return file_stream_;
    }
    return std::cerr;
}

bool TextStorage::store(const LogEntry& entry) {
    out() << formatEntry(entry) << '\n';
    return true;
}

bool TextStorage::flush() {
    out().flush();
    return true;
}

std::string TextStorage::formatEntry(const LogEntry& entry) {
    std::stringstream ss;
    ss << "[" << entry.timestamp << "] "
       << "[" << LogEngine::getLevelString(entry.level) << "] "
       << "[" << entry.category << "] "
       << "[" << entry.operation << "] "
       << entry.message;
       
    if (entry.error_code != 0) {
        ss << " (Error: " << entry.error_code << ")";
    }
    
    if (entry.duration_ms > 0) {
        ss << " [Duration: " << entry.duration_ms << "ms]";
    }
    
    if (!entry.data.empty()) {
        ss << " [Data: " << entry.data.dump() << "]";
    }
    
    return ss.str();
}

bool JsonStorage::initialize(const StorageConfig& config) {
    config_ = config;
    pending_ = nlohmann::json::array();
    
    if (config.base_path.empty()) {
        return true;
    }
    
    current_file_ = openLogFile(config, ".json", file_stream_);
    return file_stream_.is_open();
}

std::ostream& JsonStorage::out() {
    if (file_stream_.is_open()) {
        return file_stream_;
    }
    return std::cerr;
}

bool JsonStorage::store(const LogEntry& entry) {
    pending_.push_back(convertToJson(entry));
    return true;
}

// Writes the records stored since the last flush as one JSON array per line.
bool JsonStorage::flush() {
    if (pending_.empty()) {
        return true;
    }
    
    out() << pending_.dump() << std::endl;
    
    pending_ = nlohmann::json::array();
    return true;
}

nlohmann::json JsonStorage::convertToJson(const LogEntry& entry) {
    nlohmann::json j;
    j["timestamp"] = entry.timestamp;
    j["level"] = LogEngine::getLevelString(entry.level);
    j["category"] = entry.category;
    j["operation"] = entry.operation;
    j["message"] = entry.message;
    j["data"] = entry.data;
    j["error_code"] = entry.error_code;
    j["duration_ms"] = entry.duration_ms;
    j["success"] = entry.success;
    
    return j;
}

}
}
