// include/transread/core/TransRead.hpp
#ifndef TRANSREAD_TRANSREAD_HPP
#define TRANSREAD_TRANSREAD_HPP

#include "../io/IStream.hpp"
#include "../common/Config.hpp"
#include "../common/Types.hpp"
#include "../utils/log_base.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace transread {
namespace core {

// Reads a local file or URL, decompressing gzip, bzip2 and single-member
// tar.gz/tgz/tar.bz2 content on the fly. Supports tell() and forward seek().
class TransRead : public logging::LogBase, public common::NonCopyable {
private:
    std::unique_ptr<io::IStream> stream_;
    std::string name_;
    std::optional<uint64_t> size_;
    common::CompressionType type_;
    bool isUrl_;
    bool closed_;
    
public:
    // Throws OpenError, FormatError or IOError.
    explicit TransRead(const std::string& location,
                       const common::ReaderConfig& config = common::ReaderConfig());
    ~TransRead() override;
    
    // Returns `size` bytes, fewer only at the end of the data.
    common::ByteArray read(size_t size);
    void read(common::ByteArray& buffer, size_t size);
    
    uint64_t tell() const;
    void seek(int64_t offset, common::SeekOrigin origin = common::SeekOrigin::BEGIN);
    bool seekable() const;
    void close();
    
    const std::string& name() const { return name_; }
    std::optional<uint64_t> size() const { return size_; }
    bool isCompressed() const { return type_ != common::CompressionType::NONE; }
    bool isUrl() const { return isUrl_; }
    common::CompressionType compressionType() const { return type_; }
    bool isClosed() const { return closed_; }
    
    static std::vector<std::string> supportedCompressionTypes();
    
private:
    void ensureOpen(const char* operation) const;
};

} // namespace core
} // namespace transread

#endif
