// include/transread/archive/TarMemberStream.hpp
#ifndef TRANSREAD_TARMEMBERSTREAM_HPP
#define TRANSREAD_TARMEMBERSTREAM_HPP

#include "TarReader.hpp"
#include "../io/IStream.hpp"
#include "../common/Types.hpp"
#include <memory>

namespace transread {
namespace archive {

// Data of a single archive member. The archive stream must be positioned at
// the first data byte of the entry; reads stop at the entry's declared size.
class TarMemberStream : public io::IStream, public common::NonCopyable {
private:
    std::unique_ptr<io::IStream> archive_;
    TarEntry entry_;
    uint64_t position_;
    
public:
    TarMemberStream(std::unique_ptr<io::IStream> archive, TarEntry entry);
    ~TarMemberStream() override;
    
    void read(common::ByteArray& buffer, size_t bytesToRead) override;
    uint64_t tell() const override { return position_; }
    void close() override;
    std::string describe() const override;
    
    std::optional<uint64_t> getSize() const override { return entry_.size; }
    
    const TarEntry& getEntry() const { return entry_; }
};

} // namespace archive
} // namespace transread

#endif
