// include/transread/common/Constants.hpp
#ifndef TRANSREAD_CONSTANTS_HPP
#define TRANSREAD_CONSTANTS_HPP

#include <cstddef>

namespace transread {
namespace common {

class Constants {
public:
    // Floor for raw reads feeding a decompressor.
    static constexpr size_t MIN_READ_CHUNK_SIZE = 131072;
    
    // Initial output space handed to zlib/libbz2 per decompress step.
    static constexpr size_t DECOMPRESS_OUTPUT_CHUNK = 65536;
    
    // Largest input or output span handed to zlib/libbz2 in one call. Both
    // count bytes in 32-bit fields.
    static constexpr size_t DECOMPRESS_MAX_SLICE = size_t(1) << 30;
    
    static constexpr size_t TAR_BLOCK_SIZE = 512;
    
    static constexpr long DEFAULT_CONNECT_TIMEOUT_SECONDS = 30;
    static constexpr long URL_POLL_TIMEOUT_MS = 1000;
    
    static const char* DEFAULT_USER_AGENT;
    
    static const char* SUFFIX_TAR_GZIP;
    static const char* SUFFIX_TAR_BZIP2;
    static const char* SUFFIX_TGZ;
    static const char* SUFFIX_GZIP;
    static const char* SUFFIX_BZIP2;
};

} // namespace common
} // namespace transread

#endif
