#pragma once
#include "log_engine.hpp"
#include <chrono>
#include <string>
#include <functional>
#include <system_error>
#include <type_traits>
#include <utility>

namespace transread {
namespace logging {

// Mixin giving a component its own category in the shared LogEngine.
class LogBase {
public:
    virtual ~LogBase() = default;

    // Runs func, logging its duration, or its failure when it throws.
    // Exceptions are always rethrown.
    template<typename Func, typename... Args>
    auto measure(const std::string& operation, Func&& func, 
                const nlohmann::json& context_data = {}, Args&&... args) {
        auto start = std::chrono::steady_clock::now();
        
        try {
            if constexpr (std::is_void_v<std::invoke_result_t<Func, Args...>>) {
                std::invoke(std::forward<Func>(func), std::forward<Args>(args)...);
                recordSuccess(operation, start, context_data);
            } else {
                auto result = std::invoke(std::forward<Func>(func), std::forward<Args>(args)...);
                recordSuccess(operation, start, context_data);
                return result;
            }
        } catch (const std::system_error& e) {
            recordFailure(operation, e.code().value(), e.what(), context_data);
            throw;
        } catch (const std::exception& e) {
            recordFailure(operation, -1, e.what(), context_data);
            throw;
        }
    }

    void logDebug(const std::string& operation, const std::string& message,
                 const nlohmann::json& data = {});
    void logInfo(const std::string& operation, const std::string& message,
                const nlohmann::json& data = {});
    void logWarning(const std::string& operation, const std::string& message,
                   const nlohmann::json& data = {});
    void logError(const std::string& operation, const std::string& message,
                 int error_code = 0, const nlohmann::json& data = {});

    void enableLogging(bool enabled = true) { logging_enabled_ = enabled; }
    bool isLoggingEnabled() const { return logging_enabled_; }
    
    const std::string& getComponentName() const { return component_name_; }

protected:
    explicit LogBase(std::string component_name, bool enabled = true);

private:
    void recordSuccess(const std::string& operation,
                       std::chrono::steady_clock::time_point start,
                       const nlohmann::json& data);
    void recordFailure(const std::string& operation, int error_code,
                       const std::string& error_message, const nlohmann::json& data);

    LogEngine& log_;
    std::string component_name_;
    bool logging_enabled_;
};

}
}
