// include/transread/io/LocalFileStream.hpp
#ifndef TRANSREAD_LOCALFILESTREAM_HPP
#define TRANSREAD_LOCALFILESTREAM_HPP

#include "IStream.hpp"
#include "../common/Types.hpp"
#include <cstdio>
#include <string>

namespace transread {
namespace io {

// Read-only stdio file. Seeking follows the same forward-only contract as
// ForwardSeekStream but is done with fseeko instead of discard-reads.
class LocalFileStream : public IStream, public common::NonCopyable {
private:
    std::string filePath_;
    uint64_t fileSize_;
    uint64_t position_;
    FILE* fileHandle_;
    
public:
    // Throws OpenError; the code is FILE_NOT_FOUND when the path does not exist.
    explicit LocalFileStream(const std::string& filePath);
    ~LocalFileStream() override;
    
    void read(common::ByteArray& buffer, size_t bytesToRead) override;
    uint64_t tell() const override { return position_; }
    void close() override;
    std::string describe() const override { return "file '" + filePath_ + "'"; }
    
    bool seekable() const override { return true; }
    void seek(int64_t offset, common::SeekOrigin origin = common::SeekOrigin::BEGIN) override;
    
    std::optional<uint64_t> getSize() const override { return fileSize_; }
    
    bool isOpen() const { return fileHandle_ != nullptr; }
    const std::string& getFilePath() const { return filePath_; }
};

} // namespace io
} // namespace transread

#endif
