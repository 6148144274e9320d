// include/transread/io/IStream.hpp
#ifndef TRANSREAD_ISTREAM_HPP
#define TRANSREAD_ISTREAM_HPP

#include "../common/Types.hpp"
#include "../common/Exceptions.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace transread {
namespace io {

// Uniform interface implemented by every layer of a stream chain: raw
// sources, decompression wrappers, seek wrappers and archive members.
//
// read() replaces the buffer contents with at most bytesToRead bytes. An
// empty buffer means end of stream. Failures are thrown as common::Error
// subclasses. close() releases the layer together with the layers it owns,
// may be called repeatedly and never throws.
class IStream {
public:
    virtual ~IStream() = default;
    
    virtual void read(common::ByteArray& buffer, size_t bytesToRead) = 0;
    virtual uint64_t tell() const = 0;
    virtual void close() = 0;
    virtual std::string describe() const = 0;
    
    virtual bool seekable() const { return false; }
    
    virtual void seek(int64_t offset, common::SeekOrigin origin = common::SeekOrigin::BEGIN) {
        (void)offset;
        (void)origin;
        throw common::SeekError(common::ErrorCode::SEEK_UNSUPPORTED,
                                "'" + describe() + "' does not support seeking");
    }
    
    virtual std::optional<uint64_t> getSize() const { return std::nullopt; }
};

} // namespace io
} // namespace transread

#endif
