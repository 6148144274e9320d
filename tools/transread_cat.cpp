// tools/transread_cat.cpp
#include "transread/core/TransRead.hpp"
#include "transread/common/Config.hpp"
#include "transread/common/Exceptions.hpp"
#include "transread/utils/log_engine.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <limits>
#include <optional>
#include <string>

namespace {

constexpr int EXIT_TRANSREAD_ERROR = 1;
constexpr int EXIT_USAGE = 2;

void usage(const char* program) {
    std::cerr << "usage: " << program
              << " [--config FILE] [--seek N] [--length N] [--chunk-size N] [--log-level LEVEL] PATH|URL\n";
}

bool parseCount(const char* text, uint64_t& value,
                uint64_t maximum = std::numeric_limits<uint64_t>::max()) {
    try {
        size_t consumed = 0;
        std::string input(text);
        if (input.empty() || input[0] == '-') {
            return false;
        }
        value = std::stoull(input, &consumed);
        return consumed == input.size() && value <= maximum;
    } catch (const std::exception&) {
        return false;
    }
}

}

int main(int argc, char* argv[]) {
    std::string configPath;
    std::optional<std::string> logLevel;
    std::string location;
    uint64_t seekTo = 0;
    uint64_t length = std::numeric_limits<uint64_t>::max();
    uint64_t chunkSize = 65536;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        bool takesValue = std::strcmp(arg, "--config") == 0 || std::strcmp(arg, "--seek") == 0 ||
                          std::strcmp(arg, "--length") == 0 || std::strcmp(arg, "--chunk-size") == 0 ||
                          std::strcmp(arg, "--log-level") == 0;

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (takesValue) {
            if (i + 1 >= argc) {
                std::cerr << "missing value for " << arg << "\n";
                usage(argv[0]);
                return EXIT_USAGE;
            }
            const char* value = argv[++i];
            if (std::strcmp(arg, "--config") == 0) {
                configPath = value;
            } else if (std::strcmp(arg, "--log-level") == 0) {
                logLevel = value;
            } else {
                uint64_t number = 0;
                uint64_t maximum = std::strcmp(arg, "--seek") == 0
                                       ? static_cast<uint64_t>(std::numeric_limits<int64_t>::max())
                                       : std::numeric_limits<uint64_t>::max();
                if (!parseCount(value, number, maximum)) {
                    std::cerr << "invalid number " << value << " for " << arg << "\n";
                    return EXIT_USAGE;
                }
                if (std::strcmp(arg, "--seek") == 0) {
                    seekTo = number;
                } else if (std::strcmp(arg, "--length") == 0) {
                    length = number;
                } else {
                    if (number == 0) {
                        std::cerr << "--chunk-size must be positive\n";
                        return EXIT_USAGE;
                    }
                    chunkSize = number;
                }
            }
        } else if (arg[0] == '-' && arg[1] != '\0') {
            std::cerr << "unknown option " << arg << "\n";
            usage(argv[0]);
            return EXIT_USAGE;
        } else if (location.empty()) {
            location = arg;
        } else {
            std::cerr << "only one PATH|URL may be given\n";
            return EXIT_USAGE;
        }
    }

    if (location.empty()) {
        usage(argv[0]);
        return EXIT_USAGE;
    }

    auto& logEngine = transread::logging::LogEngine::getInstance();
    try {
        transread::common::ReaderConfig config;
        if (!configPath.empty()) {
            config = transread::common::ReaderConfig::fromFile(configPath);
        }
        if (logLevel) {
            config.logLevel = *logLevel;
        }
        config.validate();

        transread::logging::StorageConfig logConfig;
        logConfig.base_path = config.logPath;
        logConfig.format = transread::logging::LogEngine::parseFormat(config.logFormat);
        logConfig.min_level = transread::logging::LogEngine::parseLevel(config.logLevel);
        if (!logEngine.initialize(logConfig)) {
            std::cerr << "warning: cannot open log destination '" << config.logPath << "'\n";
        }

        transread::core::TransRead reader(location, config);
        if (seekTo > 0) {
            reader.seek(static_cast<int64_t>(seekTo));
        }

        transread::common::ByteArray buffer;
        uint64_t left = length;
        while (left > 0) {
            size_t toRead = static_cast<size_t>(std::min<uint64_t>(left, chunkSize));
            reader.read(buffer, toRead);
            if (buffer.empty()) {
                break;
            }
            if (std::fwrite(buffer.data(), 1, buffer.size(), stdout) != buffer.size()) {
                std::cerr << "cannot write to standard output: " << std::strerror(errno) << "\n";
                logEngine.shutdown();
                return EXIT_TRANSREAD_ERROR;
            }
            left -= buffer.size();
        }
        reader.close();
        std::fflush(stdout);
    } catch (const transread::common::Error& e) {
        std::cerr << "transread-cat: " << e.what() << "\n";
        logEngine.shutdown();
        return EXIT_TRANSREAD_ERROR;
    }

    logEngine.shutdown();
    return 0;
}
