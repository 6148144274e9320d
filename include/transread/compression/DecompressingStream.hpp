// include/transread/compression/DecompressingStream.hpp
#ifndef TRANSREAD_DECOMPRESSINGSTREAM_HPP
#define TRANSREAD_DECOMPRESSINGSTREAM_HPP

#include "IDecompressor.hpp"
#include "../io/IStream.hpp"
#include "../common/Types.hpp"
#include "../common/Constants.hpp"
#include "../utils/log_base.hpp"
#include <exception>
#include <memory>

namespace transread {
namespace compression {

// Turns a raw source plus an optional decompressor into a stream that
// returns exactly the requested number of bytes until the data runs out.
//
// Raw reads are at least minReadChunkSize bytes. Decompressor output that
// exceeds the request is kept in an internal buffer and served first on the
// next read; the buffer is released as soon as it is drained. End of stream
// is sticky. Without a decompressor the raw bytes pass through unchanged.
//
// A read that fails after it has already collected data returns that data;
// the failure is rethrown by the next read and by every read after it.
class DecompressingStream : public io::IStream, public logging::LogBase, public common::NonCopyable {
private:
    std::unique_ptr<io::IStream> source_;
    std::unique_ptr<IDecompressor> decompressor_;
    size_t minReadChunkSize_;
    
    common::ByteArray buffer_;
    size_t bufferPos_;
    
    common::ByteArray rawChunk_;
    common::ByteArray decodedChunk_;
    
    bool eof_;
    bool closed_;
    std::exception_ptr failure_;
    uint64_t position_;
    uint64_t rawBytesRead_;
    
public:
    DecompressingStream(std::unique_ptr<io::IStream> source,
                        std::unique_ptr<IDecompressor> decompressor,
                        size_t minReadChunkSize = common::Constants::MIN_READ_CHUNK_SIZE);
    ~DecompressingStream() override;
    
    void read(common::ByteArray& buffer, size_t bytesToRead) override;
    uint64_t tell() const override { return position_; }
    void close() override;
    std::string describe() const override;
    
    bool endOfStream() const { return eof_ && bufferedBytes() == 0; }
    bool failed() const { return failure_ != nullptr; }
    size_t bufferedBytes() const { return buffer_.size() - bufferPos_; }
    uint64_t getRawBytesRead() const { return rawBytesRead_; }
    
private:
    void readFromBuffer(common::ByteArray& out, size_t length);
    void fill(common::ByteArray& out, size_t remaining);
    void markEndOfStream();
};

} // namespace compression
} // namespace transread

#endif
