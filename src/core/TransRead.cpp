// src/core/TransRead.cpp
#include "transread/core/TransRead.hpp"
#include "transread/core/FormatDispatcher.hpp"
#include "transread/core/SourceResolver.hpp"

transread::core::TransRead::TransRead(const std::string& location, const common::ReaderConfig& config)
    : LogBase("TRANSREAD"), name_(location), type_(common::CompressionType::NONE),
      isUrl_(false), closed_(false) {
    config.validate();

    measure("open", [&]() {
        SourceResolver resolver(config);
        Source source = resolver.resolve(location);
        isUrl_ = source.isUrl;

        FormatDispatcher dispatcher(resolver, config);
        OpenedStream opened = dispatcher.open(source);
        stream_ = std::move(opened.stream);
        size_ = opened.size;
        type_ = opened.type;
    }, {{"location", location}});

    logInfo("open", "opened " + stream_->describe(),
            {{"compression", common::compressionTypeName(type_)},
             {"url", isUrl_},
             {"size", size_ ? nlohmann::json(*size_) : nlohmann::json()}});
}

transread::core::TransRead::~TransRead() {
    close();
}

std::vector<std::string> transread::core::TransRead::supportedCompressionTypes() {
    return FormatDispatcher::supportedCompressionTypes();
}

void transread::core::TransRead::ensureOpen(const char* operation) const {
    if (closed_) {
        throw common::IOError(common::ErrorCode::STREAM_CLOSED,
                              std::string("cannot ") + operation + " '" + name_ + "': reader is closed");
    }
}

void transread::core::TransRead::read(common::ByteArray& buffer, size_t size) {
    ensureOpen("read");
    try {
        stream_->read(buffer, size);
    } catch (const common::Error& e) {
        logError("read", e.what(), e.code().value(), {{"name", name_}, {"offset", stream_->tell()}});
        throw;
    }
}

transread::common::ByteArray transread::core::TransRead::read(size_t size) {
    common::ByteArray buffer;
    read(buffer, size);
    return buffer;
}

uint64_t transread::core::TransRead::tell() const {
    ensureOpen("tell");
    return stream_->tell();
}

bool transread::core::TransRead::seekable() const {
    return !closed_ && stream_->seekable();
}

void transread::core::TransRead::seek(int64_t offset, common::SeekOrigin origin) {
    ensureOpen("seek");
    stream_->seek(offset, origin);
}

void transread::core::TransRead::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    if (stream_) {
        stream_->close();
        logDebug("close", "closed '" + name_ + "'");
        stream_.reset();
    }
}
