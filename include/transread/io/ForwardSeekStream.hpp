// include/transread/io/ForwardSeekStream.hpp
#ifndef TRANSREAD_FORWARDSEEKSTREAM_HPP
#define TRANSREAD_FORWARDSEEKSTREAM_HPP

#include "IStream.hpp"
#include "../common/Types.hpp"
#include "../common/Constants.hpp"
#include <memory>

namespace transread {
namespace io {

// Adds tell() and forward-only seek() to a sequential stream. Seeking reads
// and discards the bytes between the current position and the target.
class ForwardSeekStream : public IStream, public common::NonCopyable {
private:
    std::unique_ptr<IStream> inner_;
    uint64_t position_;
    size_t discardChunkSize_;
    common::ByteArray scratch_;
    
public:
    explicit ForwardSeekStream(std::unique_ptr<IStream> inner,
                               size_t discardChunkSize = common::Constants::MIN_READ_CHUNK_SIZE);
    ~ForwardSeekStream() override;
    
    void read(common::ByteArray& buffer, size_t bytesToRead) override;
    uint64_t tell() const override { return position_; }
    void close() override;
    std::string describe() const override { return inner_->describe(); }
    
    bool seekable() const override { return true; }
    
    // Only BEGIN and CURRENT are accepted. Throws SeekError for a target
    // behind the current position or beyond the end of the data.
    void seek(int64_t offset, common::SeekOrigin origin = common::SeekOrigin::BEGIN) override;
    
    std::optional<uint64_t> getSize() const override { return inner_->getSize(); }
};

} // namespace io
} // namespace transread

#endif
