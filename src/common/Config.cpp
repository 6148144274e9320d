// src/common/Config.cpp
#include "transread/common/Config.hpp"
#include "transread/common/Exceptions.hpp"
#include <fstream>

namespace {

template<typename T>
void readField(const nlohmann::json& document, const char* key, T& target) {
    auto it = document.find(key);
    if (it == document.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw transread::common::ConfigError(std::string("configuration key '") + key +
                                             "' has the wrong type: " + e.what());
    }
}

bool isKnownLevel(const std::string& level) {
    return level == "debug" || level == "info" || level == "warning" ||
           level == "error" || level == "critical";
}

}

void transread::common::ReaderConfig::validate() const {
    if (minReadChunkSize == 0) {
        throw ConfigError("min_read_chunk_size must be greater than zero");
    }
    if (connectTimeoutSeconds < 0) {
        throw ConfigError("connect_timeout_seconds must not be negative");
    }
    if (!isKnownLevel(logLevel)) {
        throw ConfigError("unknown log level '" + logLevel + "'");
    }
    if (logFormat != "text" && logFormat != "json") {
        throw ConfigError("unknown log format '" + logFormat + "'");
    }
}

transread::common::ReaderConfig transread::common::ReaderConfig::fromJson(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw ConfigError("configuration document must be a JSON object");
    }

    ReaderConfig config;
    
    int64_t chunkSize = static_cast<int64_t>(config.minReadChunkSize);
    readField(document, "min_read_chunk_size", chunkSize);
    if (chunkSize <= 0) {
        throw ConfigError("min_read_chunk_size must be greater than zero");
    }
    config.minReadChunkSize = static_cast<size_t>(chunkSize);
    
    readField(document, "bypass_proxy", config.bypassProxy);
    readField(document, "connect_timeout_seconds", config.connectTimeoutSeconds);
    readField(document, "follow_redirects", config.followRedirects);
    readField(document, "verify_tls", config.verifyTls);
    readField(document, "user_agent", config.userAgent);
    readField(document, "log_level", config.logLevel);
    readField(document, "log_format", config.logFormat);
    readField(document, "log_path", config.logPath);
    
    config.validate();
    return config;
}

transread::common::ReaderConfig transread::common::ReaderConfig::fromFile(const std::string& filePath) {
    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw ConfigError("cannot open configuration file '" + filePath + "'");
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("cannot parse configuration file '" + filePath + "': " + e.what());
    }
    
    return fromJson(document);
}
