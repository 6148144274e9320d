#ifndef TRANSREAD_LOG_ENGINE_H
#define TRANSREAD_LOG_ENGINE_H

#include <string>
#include <map>
#include <memory>
#include <atomic>
#include <chrono>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>

namespace transread {
namespace logging {
    enum class LogLevel {
        DEBUG,
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class StorageFormat {
        TEXT,
        JSON
    };

    struct LogEntry {
        std::string timestamp;
        LogLevel level = LogLevel::INFO;
        std::string category;
        std::string operation;
        std::string message;
        nlohmann::json data;
        int error_code = 0;
        double duration_ms = 0.0;
        bool success = true;
    };

    // An empty base_path sends records to stderr.
    struct StorageConfig {
        std::string base_path;
        StorageFormat format = StorageFormat::TEXT;
        LogLevel min_level = LogLevel::WARNING;
    };

    class LogStorage {
    public:
        virtual ~LogStorage() = default;
        virtual bool initialize(const StorageConfig& config) = 0;
        virtual bool store(const LogEntry& entry) = 0;
        virtual bool flush() = 0;
        virtual std::string currentFile() const = 0;
    };

    class LogEngine {
    public:
        static LogEngine& getInstance();
        
        bool initialize(const StorageConfig& config);
        bool shutdown();
        bool isInitialized() const { return initialized_.load(); }
        
        void logDebug(const std::string& category, const std::string& operation, 
                     const std::string& message, const nlohmann::json& data = {});
        void logInfo(const std::string& category, const std::string& operation,
                    const std::string& message, const nlohmann::json& data = {});
        void logWarning(const std::string& category, const std::string& operation,
                       const std::string& message, const nlohmann::json& data = {});
        void logError(const std::string& category, const std::string& operation,
                     const std::string& message, int error_code = 0, 
                     const nlohmann::json& data = {});
        
        void logOperation(const std::string& category, const std::string& operation,
                         bool success, double duration_ms, const nlohmann::json& data = {});
        
        std::string getCurrentFile() const;
        
        uint64_t getTotalCount() const;
        std::map<std::string, uint64_t> getCountByCategory() const;

        static LogLevel parseLevel(const std::string& name);
        static StorageFormat parseFormat(const std::string& name);
        static std::string getLevelString(LogLevel level);

    private:
        LogEngine();
        ~LogEngine();
        
        std::string getCurrentTimestamp();
        void store(LogEntry entry);
        
        std::unique_ptr<LogStorage> createStorage(StorageFormat format);
        
        std::unique_ptr<LogStorage> storage_;
        StorageConfig config_;
        std::atomic<bool> initialized_;
        std::atomic<uint64_t> total_entries_;
        std::map<std::string, uint64_t> category_counts_;
        
        mutable std::mutex mutex_;
    };

    class TextStorage : public LogStorage {
    public:
        bool initialize(const StorageConfig& config) override;
        bool store(const LogEntry& entry) override;
        bool flush() override;
        std::string currentFile() const override { return current_file_; }

    private:
        std::string formatEntry(const LogEntry& entry);
        std::ostream& out();
        
        std::string current_file_;
        StorageConfig config_;
        std::ofstream file_stream_;
    };

    class JsonStorage : public LogStorage {
    public:
        bool initialize(const StorageConfig& config) override;
        bool store(const LogEntry& entry) override;
        bool flush() override;
        std::string currentFile() const override { return current_file_; }

    private:
        nlohmann::json convertToJson(const LogEntry& entry);
        std::ostream& out();
        
        std::string current_file_;
        StorageConfig config_;
        std::ofstream file_stream_;
        nlohmann::json pending_;
    };
}
}

#endif
