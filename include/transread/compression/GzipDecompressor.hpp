// include/transread/compression/GzipDecompressor.hpp
#ifndef TRANSREAD_GZIPDECOMPRESSOR_HPP
#define TRANSREAD_GZIPDECOMPRESSOR_HPP

#include "IDecompressor.hpp"
#include "../common/Types.hpp"
#include "../common/Constants.hpp"
#include <memory>

namespace transread {
namespace compression {

// gzip via zlib. Concatenated members are decoded back to back and zero
// padding between or after members is skipped.
class GzipDecompressor : public IDecompressor, public common::NonCopyable {
private:
    struct ZlibContext;
    std::unique_ptr<ZlibContext> context_;
    
public:
    // maxSlice bounds the input and output spans passed to the library per call.
    explicit GzipDecompressor(size_t maxSlice = common::Constants::DECOMPRESS_MAX_SLICE);
    ~GzipDecompressor() override;
    
    void decompress(const common::ByteArray& input, common::ByteArray& output) override;
    void finish() override;
    
    common::CompressionType getType() const override { 
        return common::CompressionType::GZIP; 
    }
    
    std::string getAlgorithmName() const override { return "GZIP"; }
    
    size_t getMembersCompleted() const;
    
private:
    void initializeDecompression();
    void cleanup();
};

} // namespace compression
} // namespace transread

#endif
