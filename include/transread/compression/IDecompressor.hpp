// include/transread/compression/IDecompressor.hpp
#ifndef TRANSREAD_IDECOMPRESSOR_HPP
#define TRANSREAD_IDECOMPRESSOR_HPP

#include "../common/Types.hpp"
#include "../common/Exceptions.hpp"
#include <string>

namespace transread {
namespace compression {

// Stateful chunk-by-chunk decompressor. decompress() may return nothing for a
// chunk (an incomplete frame is held internally) or much more than the chunk
// size. finish() is called once after the last chunk and throws IOError when
// the compressed stream stopped in the middle of a frame.
class IDecompressor {
public:
    virtual ~IDecompressor() = default;
    
    virtual void decompress(const common::ByteArray& input, common::ByteArray& output) = 0;
    virtual void finish() = 0;
    
    virtual common::CompressionType getType() const = 0;
    virtual std::string getAlgorithmName() const = 0;
};

} // namespace compression
} // namespace transread

#endif
