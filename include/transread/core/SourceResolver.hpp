// include/transread/core/SourceResolver.hpp
#ifndef TRANSREAD_SOURCERESOLVER_HPP
#define TRANSREAD_SOURCERESOLVER_HPP

#include "../io/IStream.hpp"
#include "../common/Config.hpp"
#include "../common/Types.hpp"
#include "../utils/log_base.hpp"
#include <memory>
#include <optional>
#include <string>

namespace transread {
namespace core {

struct Source {
    std::string name;
    bool isUrl;
    std::optional<uint64_t> size;
    std::unique_ptr<io::IStream> stream;
    
    Source() : isUrl(false) {}
};

// Turns a path or URL into an open raw byte source. Local files win; a
// location is only tried as a URL when no file of that name exists.
class SourceResolver : public logging::LogBase, public common::NonCopyable {
private:
    common::ReaderConfig config_;
    
public:
    explicit SourceResolver(const common::ReaderConfig& config = common::ReaderConfig());
    
    Source resolve(const std::string& location);
    
    // Opens a new channel to a source returned by resolve(), of the same kind.
    std::unique_ptr<io::IStream> reopen(const Source& source);
    
private:
    std::unique_ptr<io::IStream> openUrl(const std::string& url);
};

} // namespace core
} // namespace transread

#endif
