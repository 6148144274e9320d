#include "transread/utils/log_base.hpp"

namespace transread {
namespace logging {

LogBase::LogBase(std::string component_name, bool enabled)
    : log_(LogEngine::getInstance())
    , component_name_(std::move(component_name))
    , logging_enabled_(enabled) {
}

void LogBase::logDebug(const std::string& operation, const std::string& message,
                       const nlohmann::json& data) {
    if (!logging_enabled_) return;
    log_.logDebug(component_name_, operation, message, data);
}

void LogBase::logInfo(const std::string& operation, const std::string& message,
                      const nlohmann::json& data) {
    if (!logging_enabled_) return;
    log_.logInfo(component_name_, operation, message, data);
}

void LogBase::logWarning(const std::string& operation, const std::string& message,
                         const nlohmann::json& data) {
    if (!logging_enabled_) return;
    log_.logWarning(component_name_, operation, message, data);
}

void LogBase::logError(const std::string& operation, const std::string& message,
                       int error_code, const nlohmann::json& data) {
    if (!logging_enabled_) return;
    log_.logError(component_name_, operation, message, error_code, data);
}

void LogBase::recordSuccess(const std::string& operation,
                            std::chrono::steady_clock::time_point start,
                            const nlohmann::json& data) {
    if (!logging_enabled_) return;
    
    auto duration = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start);
    log_.logOperation(component_name_, operation, true, duration.count(), data);
}

void LogBase::recordFailure(const std::string& operation, int error_code,
                            const std::string& error_message, const nlohmann::json& data) {
    if (!logging_enabled_) return;
    
    nlohmann::json details = data.is_object() ? data : nlohmann::json::object();
    details["error_message"] = error_message;
    log_.logError(component_name_, operation, "Operation failed", error_code, details);
}

}
}
