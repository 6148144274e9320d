// include/transread/common/Exceptions.hpp
#ifndef TRANSREAD_EXCEPTIONS_HPP
#define TRANSREAD_EXCEPTIONS_HPP

#include "ErrorCodes.hpp"
#include <string>
#include <system_error>

namespace transread {
namespace common {

// Base of every failure raised by the library. what() carries the
// human-readable description, code() the ErrorCode.
class Error : public std::system_error {
public:
    Error(ErrorCode code, const std::string& message)
        : std::system_error(make_error_code(code), message) {}
    
    ErrorCode errorCode() const {
        return static_cast<ErrorCode>(code().value());
    }
};

class OpenError : public Error {
public:
    using Error::Error;
};

class FormatError : public Error {
public:
    using Error::Error;
};

class SeekError : public Error {
public:
    using Error::Error;
};

class IOError : public Error {
public:
    using Error::Error;
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message)
        : Error(ErrorCode::INVALID_CONFIGURATION, message) {}
};

} // namespace common
} // namespace transread

#endif
