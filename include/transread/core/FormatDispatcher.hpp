// include/transread/core/FormatDispatcher.hpp
#ifndef TRANSREAD_FORMATDISPATCHER_HPP
#define TRANSREAD_FORMATDISPATCHER_HPP

#include "SourceResolver.hpp"
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

struct OpenedStream {
    std::unique_ptr<io::IStream> stream;
    std::optional<uint64_t> size;
    common::CompressionType type;
    
    OpenedStream() : type(common::CompressionType::NONE) {}
    
    bool isCompressed() const { return type != common::CompressionType::NONE; }
};

// Picks the decoding chain for a source from its name and builds it.
class FormatDispatcher : public logging::LogBase, public common::NonCopyable {
private:
    SourceResolver& resolver_;
    common::ReaderConfig config_;
    
public:
    FormatDispatcher(SourceResolver& resolver, const common::ReaderConfig& config);
    
    // Suffix match, case-sensitive, checked in the order .tar.gz, .tar.bz2,
    // .tgz, .gz, .bz2.
    static common::CompressionType detect(const std::string& name);
    
    static std::vector<std::string> supportedCompressionTypes();
    
    // Consumes source.stream. Archives are reopened through the resolver
    // after their members have been counted.
    OpenedStream open(Source& source);
    
private:
    std::unique_ptr<io::IStream> buildChain(std::unique_ptr<io::IStream> raw,
                                            common::CompressionType type) const;
    OpenedStream openArchive(Source& source, common::CompressionType type);
};

} // namespace core
} // namespace transread

#endif
