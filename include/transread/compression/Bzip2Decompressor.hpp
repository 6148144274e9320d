// include/transread/compression/Bzip2Decompressor.hpp
#ifndef TRANSREAD_BZIP2DECOMPRESSOR_HPP
#define TRANSREAD_BZIP2DECOMPRESSOR_HPP

#include "IDecompressor.hpp"
#include "../common/Types.hpp"
#include "../common/Constants.hpp"
#include <memory>

namespace transread {
namespace compression {

// bzip2 via libbz2. Multi-stream files (as written by pbzip2) are decoded
// stream after stream.
class Bzip2Decompressor : public IDecompressor, public common::NonCopyable {
private:
    struct Bzip2Context;
    std::unique_ptr<Bzip2Context> context_;
    
public:
    // maxSlice bounds the input and output spans passed to the library per call.
    explicit Bzip2Decompressor(size_t maxSlice = common::Constants::DECOMPRESS_MAX_SLICE);
    ~Bzip2Decompressor() override;
    
    void decompress(const common::ByteArray& input, common::ByteArray& output) override;
    void finish() override;
    
    common::CompressionType getType() const override { 
        return common::CompressionType::BZIP2; 
    }
    
    std::string getAlgorithmName() const override { return "BZIP2"; }
    
    size_t getStreamsCompleted() const;
    
private:
    void initializeDecompression();
    void cleanup();
};

} // namespace compression
} // namespace transread

#endif
