// include/transread/compression/DecompressorFactory.hpp
#ifndef TRANSREAD_DECOMPRESSORFACTORY_HPP
#define TRANSREAD_DECOMPRESSORFACTORY_HPP

#include "IDecompressor.hpp"
#include "../common/Types.hpp"
#include <functional>
#include <memory>
#include <unordered_map>
#include <vector>

namespace transread {
namespace compression {

class DecompressorFactory : public common::NonCopyable {
private:
    using CreatorFunc = std::function<std::unique_ptr<IDecompressor>()>;
    std::unordered_map<common::CompressionType, CreatorFunc> creators_;
    
public:
    DecompressorFactory();
    
    void registerDecompressor(common::CompressionType type, CreatorFunc creator);
    void unregisterDecompressor(common::CompressionType type);
    
    // Tar types map to the decompressor of their outer layer. Returns nullptr
    // for CompressionType::NONE; throws FormatError for unregistered types.
    std::unique_ptr<IDecompressor> create(common::CompressionType type) const;
    
    bool isSupported(common::CompressionType type) const;
    std::vector<common::CompressionType> getSupportedTypes() const;
    
    static DecompressorFactory& getInstance();
    
    static common::CompressionType outerLayer(common::CompressionType type);
    
private:
    void initializeDefaultDecompressors();
};

} // namespace compression
} // namespace transread

#endif
