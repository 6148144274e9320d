// src/core/FormatDispatcher.cpp
#include "transread/core/FormatDispatcher.hpp"
#include "transread/archive/TarMemberStream.hpp"
#include "transread/archive/TarReader.hpp"
#include "transread/compression/DecompressingStream.hpp"
#include "transread/compression/DecompressorFactory.hpp"
#include "transread/io/ForwardSeekStream.hpp"
#include "transread/common/Constants.hpp"

namespace {

bool endsWith(const std::string& value, const char* suffix) {
    std::string tail(suffix);
    return value.size() >= tail.size() &&
           value.compare(value.size() - tail.size(), tail.size(), tail) == 0;
}

}

transread::core::FormatDispatcher::FormatDispatcher(SourceResolver& resolver, const common::ReaderConfig& config)
    : LogBase("FORMAT_DISPATCHER"), resolver_(resolver), config_(config) {}

transread::common::CompressionType transread::core::FormatDispatcher::detect(const std::string& name) {
    using common::Constants;

    if (endsWith(name, Constants::SUFFIX_TAR_GZIP)) {
        return common::CompressionType::TAR_GZIP;
    }
    if (endsWith(name, Constants::SUFFIX_TAR_BZIP2)) {
        return common::CompressionType::TAR_BZIP2;
    }
    if (endsWith(name, Constants::SUFFIX_TGZ)) {
        return common::CompressionType::TAR_GZIP;
    }
    if (endsWith(name, Constants::SUFFIX_GZIP)) {
        return common::CompressionType::GZIP;
    }
    if (endsWith(name, Constants::SUFFIX_BZIP2)) {
        return common::CompressionType::BZIP2;
    }
    return common::CompressionType::NONE;
}

std::vector<std::string> transread::core::FormatDispatcher::supportedCompressionTypes() {
    return {"bz2", "gz", "tar.gz", "tgz", "tar.bz2"};
}

std::unique_ptr<transread::io::IStream> transread::core::FormatDispatcher::buildChain(
        std::unique_ptr<io::IStream> raw, common::CompressionType type) const {
    auto decompressor = compression::DecompressorFactory::getInstance().create(type);
    return std::make_unique<compression::DecompressingStream>(std::move(raw), std::move(decompressor),
                                                              config_.minReadChunkSize);
}

transread::core::OpenedStream transread::core::FormatDispatcher::open(Source& source) {
    OpenedStream opened;
    opened.type = detect(source.name);

    logDebug("open", "detected format",
             {{"name", source.name}, {"type", common::compressionTypeName(opened.type)}});

    switch (opened.type) {
        case common::CompressionType::TAR_GZIP:
        case common::CompressionType::TAR_BZIP2:
            return openArchive(source, opened.type);

        case common::CompressionType::GZIP:
        case common::CompressionType::BZIP2:
            opened.stream = std::make_unique<io::ForwardSeekStream>(
                buildChain(std::move(source.stream), opened.type), config_.minReadChunkSize);
            return opened;

        case common::CompressionType::NONE:
        default:
            break;
    }

    if (source.isUrl) {
        opened.stream = std::make_unique<io::ForwardSeekStream>(std::move(source.stream),
                                                                config_.minReadChunkSize);
    } else {
        opened.size = source.size;
        opened.stream = std::move(source.stream);
    }
    return opened;
}

transread::core::OpenedStream transread::core::FormatDispatcher::openArchive(Source& source,
                                                                            common::CompressionType type) {
    size_t members = 0;
    {
        auto chain = buildChain(std::move(source.stream), type);
        archive::TarReader reader(*chain);
        members = measure("count_members", [&]() { return reader.countEntries(2); },
                          {{"name", source.name}});
        chain->close();
    }

    if (members == 0) {
        logError("open", "empty tarball", static_cast<int>(common::ErrorCode::ARCHIVE_EMPTY),
                 {{"name", source.name}});
        throw common::FormatError(common::ErrorCode::ARCHIVE_EMPTY,
                                  "tarball '" + source.name + "' is empty (no files)");
    }
    if (members > 1) {
        logError("open", "tarball with several members",
                 static_cast<int>(common::ErrorCode::ARCHIVE_MULTIPLE_MEMBERS), {{"name", source.name}});
        throw common::FormatError(common::ErrorCode::ARCHIVE_MULTIPLE_MEMBERS,
                                  "tarball '" + source.name + "' contains more than one file");
    }

    auto chain = buildChain(resolver_.reopen(source), type);
    archive::TarReader reader(*chain);
    std::optional<archive::TarEntry> entry = reader.nextEntry();
    if (!entry) {
        throw common::FormatError(common::ErrorCode::ARCHIVE_CORRUPT,
                                  "tarball '" + source.name + "' changed while it was being opened");
    }

    logDebug("open", "serving tarball member",
             {{"name", source.name}, {"member", entry->name}, {"size", entry->size}});

    OpenedStream opened;
    opened.type = type;
    opened.size = entry->size;
    opened.stream = std::make_unique<io::ForwardSeekStream>(
        std::make_unique<archive::TarMemberStream>(std::move(chain), *entry), config_.minReadChunkSize);
    return opened;
}
