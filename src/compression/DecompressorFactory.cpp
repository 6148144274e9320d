// src/compression/DecompressorFactory.cpp
#include "transread/compression/DecompressorFactory.hpp"
#include "transread/compression/GzipDecompressor.hpp"
#include "transread/compression/Bzip2Decompressor.hpp"

transread::compression::DecompressorFactory::DecompressorFactory() {
    initializeDefaultDecompressors();
}

transread::compression::DecompressorFactory& transread::compression::DecompressorFactory::getInstance() {
    static DecompressorFactory instance;
    return instance;
}

void transread::compression::DecompressorFactory::initializeDefaultDecompressors() {
    registerDecompressor(common::CompressionType::GZIP, []() {
        return std::unique_ptr<IDecompressor>(std::make_unique<GzipDecompressor>());
    });
    registerDecompressor(common::CompressionType::BZIP2, []() {
        return std::unique_ptr<IDecompressor>(std::make_unique<Bzip2Decompressor>());
    });
}

void transread::compression::DecompressorFactory::registerDecompressor(common::CompressionType type,
                                                                       CreatorFunc creator) {
    creators_[type] = std::move(creator);
}

void transread::compression::DecompressorFactory::unregisterDecompressor(common::CompressionType type) {
    creators_.erase(type);
}

transread::common::CompressionType
transread::compression::DecompressorFactory::outerLayer(common::CompressionType type) {
    switch (type) {
        case common::CompressionType::TAR_GZIP:
            return common::CompressionType::GZIP;
        case common::CompressionType::TAR_BZIP2:
            return common::CompressionType::BZIP2;
        default:
            return type;
    }
}

std::unique_ptr<transread::compression::IDecompressor>
transread::compression::DecompressorFactory::create(common::CompressionType type) const {
    common::CompressionType outer = outerLayer(type);
    if (outer == common::CompressionType::NONE) {
        return nullptr;
    }

    auto it = creators_.find(outer);
    if (it == creators_.end()) {
        throw common::FormatError(common::ErrorCode::DECOMPRESSION_FAILED,
                                  std::string("no decompressor registered for ") +
                                  common::compressionTypeName(type));
    }
    return it->second();
}

bool transread::compression::DecompressorFactory::isSupported(common::CompressionType type) const {
    common::CompressionType outer = outerLayer(type);
    return outer == common::CompressionType::NONE || creators_.count(outer) > 0;
}

std::vector<transread::common::CompressionType>
transread::compression::DecompressorFactory::getSupportedTypes() const {
    std::vector<common::CompressionType> types;
    types.reserve(creators_.size());
    for (const auto& entry : creators_) {
        types.push_back(entry.first);
    }
    return types;
}
