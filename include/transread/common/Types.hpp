// include/transread/common/Types.hpp
#ifndef TRANSREAD_TYPES_HPP
#define TRANSREAD_TYPES_HPP

#include <cstdint>
#include <vector>
#include <memory>
#include <string>

namespace transread {
namespace common {

using Byte = uint8_t;
using ByteArray = std::vector<Byte>;
using ConstBytePtr = const Byte*;

enum class CompressionType {
    NONE,
    GZIP,
    BZIP2,
    TAR_GZIP,
    TAR_BZIP2
};

enum class SeekOrigin {
    BEGIN,
    CURRENT,
    END
};

class NonCopyable {
protected:
    NonCopyable() = default;
    ~NonCopyable() = default;
    
    NonCopyable(const NonCopyable&) = delete;
    NonCopyable& operator=(const NonCopyable&) = delete;
    
    NonCopyable(NonCopyable&&) = default;
    NonCopyable& operator=(NonCopyable&&) = default;
};

inline bool isTarType(CompressionType type) {
    return type == CompressionType::TAR_GZIP || type == CompressionType::TAR_BZIP2;
}

inline const char* compressionTypeName(CompressionType type) {
    switch (type) {
        case CompressionType::NONE: return "none";
        case CompressionType::GZIP: return "gzip";
        case CompressionType::BZIP2: return "bzip2";
        case CompressionType::TAR_GZIP: return "tar+gzip";
        case CompressionType::TAR_BZIP2: return "tar+bzip2";
        default: return "unknown";
    }
}

} // namespace common
} // namespace transread

#endif
