// include/transread/archive/TarReader.hpp
#ifndef TRANSREAD_TARREADER_HPP
#define TRANSREAD_TARREADER_HPP

#include "../io/IStream.hpp"
#include "../common/Types.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace transread {
namespace archive {

struct TarEntry {
    std::string name;
    uint64_t size;
    char type;
    
    TarEntry() : size(0), type('0') {}
    
    bool isRegularFile() const { return type == '0' || type == '\0' || type == '7'; }
    bool isDirectory() const { return type == '5'; }
};

// Walks the headers of a ustar/GNU/pax archive read from a sequential
// stream. pax ('x', 'g') and GNU long name ('L', 'K') records are folded into
// the entry they describe and never returned on their own.
class TarReader : public common::NonCopyable {
private:
    io::IStream& stream_;
    uint64_t remainingData_;
    uint64_t padding_;
    bool finished_;
    common::ByteArray block_;
    common::ByteArray scratch_;
    
public:
    explicit TarReader(io::IStream& stream);
    
    // Skips whatever is left of the current entry and returns the next one,
    // or nullopt at the end-of-archive marker or at a clean end of stream.
    // Throws FormatError (ARCHIVE_CORRUPT) on damaged or truncated input.
    std::optional<TarEntry> nextEntry();
    
    // Counts entries from the current position, stopping once `limit` have
    // been seen.
    size_t countEntries(size_t limit);
    
private:
    bool readBlock();
    void readExact(common::ByteArray& buffer, size_t length);
    void discard(uint64_t length);
    void skipCurrent();
    std::string readExtensionData(uint64_t size);
};

namespace tar_header {

// Header layout helpers, exposed for tests and tools.
bool isZeroBlock(const common::Byte* block);
bool verifyChecksum(const common::Byte* block);
uint64_t parseNumeric(const common::Byte* field, size_t length);
std::string parseString(const common::Byte* field, size_t length);

}

} // namespace archive
} // namespace transread

#endif
