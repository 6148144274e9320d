// include/transread/common/ErrorCodes.hpp
#ifndef TRANSREAD_ERRORCODES_HPP
#define TRANSREAD_ERRORCODES_HPP

#include <string>
#include <system_error>

namespace transread {
namespace common {

enum class ErrorCode {
    SUCCESS = 0,
    
    // Source resolution
    FILE_NOT_FOUND = 100,
    FILE_ACCESS_DENIED,
    FILE_READ_ERROR,
    URL_MALFORMED,
    URL_OPEN_FAILED,
    URL_READ_ERROR,
    
    // Decompression
    DECOMPRESSION_FAILED = 300,
    CORRUPT_COMPRESSED_DATA,
    
    // Stream operations
    STREAM_CLOSED = 400,
    
    // Seeking
    SEEK_UNSUPPORTED = 500,
    SEEK_UNSUPPORTED_ORIGIN,
    SEEK_BACKWARD,
    SEEK_PAST_END,
    
    // Archives
    ARCHIVE_EMPTY = 600,
    ARCHIVE_MULTIPLE_MEMBERS,
    ARCHIVE_CORRUPT,
    
    // Configuration errors
    INVALID_CONFIGURATION = 700
};

class TransReadErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "transread";
    }
    
    std::string message(int ev) const override {
        switch (static_cast<ErrorCode>(ev)) {
            case ErrorCode::SUCCESS:
                return "Success";
                
            case ErrorCode::FILE_NOT_FOUND:
                return "File not found";
            case ErrorCode::FILE_ACCESS_DENIED:
                return "File access denied";
            case ErrorCode::FILE_READ_ERROR:
                return "File read error";
            case ErrorCode::URL_MALFORMED:
                return "Malformed URL";
            case ErrorCode::URL_OPEN_FAILED:
                return "Cannot open URL";
            case ErrorCode::URL_READ_ERROR:
                return "URL read error";
                
            case ErrorCode::DECOMPRESSION_FAILED:
                return "Decompression failed";
            case ErrorCode::CORRUPT_COMPRESSED_DATA:
                return "Corrupt compressed data";
                
            case ErrorCode::STREAM_CLOSED:
                return "Stream is closed";
                
            case ErrorCode::SEEK_UNSUPPORTED:
                return "Stream does not support seeking";
            case ErrorCode::SEEK_UNSUPPORTED_ORIGIN:
                return "Unsupported seek origin";
            case ErrorCode::SEEK_BACKWARD:
                return "Backward seek is not supported";
            case ErrorCode::SEEK_PAST_END:
                return "Seek past end of data";
                
            case ErrorCode::ARCHIVE_EMPTY:
                return "Archive contains no members";
            case ErrorCode::ARCHIVE_MULTIPLE_MEMBERS:
                return "Archive contains more than one member";
            case ErrorCode::ARCHIVE_CORRUPT:
                return "Archive is corrupt";
                
            case ErrorCode::INVALID_CONFIGURATION:
                return "Invalid configuration";
                
            default:
                return "Unknown error";
        }
    }
};

inline const std::error_category& transread_error_category() {
    static TransReadErrorCategory instance;
    return instance;
}

inline std::error_code make_error_code(ErrorCode e) {
    return std::error_code(static_cast<int>(e), transread_error_category());
}

} // namespace common
} // namespace transread

namespace std {
    template<>
    struct is_error_code_enum<transread::common::ErrorCode> : true_type {};
}

#endif
