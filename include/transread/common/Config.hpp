// include/transread/common/Config.hpp
#ifndef TRANSREAD_CONFIG_HPP
#define TRANSREAD_CONFIG_HPP

#include "Constants.hpp"
#include <string>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace transread {
namespace common {

struct ReaderConfig {
    size_t minReadChunkSize;
    bool bypassProxy;
    long connectTimeoutSeconds;
    bool followRedirects;
    bool verifyTls;
    std::string userAgent;
    std::string logLevel;
    std::string logFormat;
    std::string logPath;
    
    ReaderConfig() : minReadChunkSize(Constants::MIN_READ_CHUNK_SIZE),
                     bypassProxy(true),
                     connectTimeoutSeconds(Constants::DEFAULT_CONNECT_TIMEOUT_SECONDS),
                     followRedirects(true),
                     verifyTls(true),
                     userAgent(Constants::DEFAULT_USER_AGENT),
                     logLevel("warning"),
                     logFormat("text"),
                     logPath("") {}
    
    // Throws ConfigError on wrong types or out-of-range values.
    void validate() const;
    
    static ReaderConfig fromJson(const nlohmann::json& document);
    static ReaderConfig fromFile(const std::string& filePath);
};

} // namespace common
} // namespace transread

#endif
