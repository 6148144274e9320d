// src/core/SourceResolver.cpp
#include "transread/core/SourceResolver.hpp"
#include "transread/io/LocalFileStream.hpp"
#include "transread/io/UrlStream.hpp"

transread::core::SourceResolver::SourceResolver(const common::ReaderConfig& config)
    : LogBase("SOURCE_RESOLVER"), config_(config) {}

std::unique_ptr<transread::io::IStream> transread::core::SourceResolver::openUrl(const std::string& url) {
    return measure("open_url", [&]() -> std::unique_ptr<io::IStream> {
        return std::make_unique<io::UrlStream>(url, config_);
    }, {{"url", url}, {"bypass_proxy", config_.bypassProxy}});
}

transread::core::Source transread::core::SourceResolver::resolve(const std::string& location) {
    Source source;
    source.name = location;

    try {
        auto file = std::make_unique<io::LocalFileStream>(location);
        source.size = file->getSize();
        source.stream = std::move(file);
        logDebug("resolve", "opened local file", {{"path", location}, {"size", *source.size}});
        return source;
    } catch (const common::OpenError& e) {
        if (e.errorCode() != common::ErrorCode::FILE_NOT_FOUND) {
            logError("resolve", e.what(), e.code().value(), {{"path", location}});
            throw;
        }
        if (!io::UrlStream::isUrl(location)) {
            logError("resolve", e.what(), e.code().value(), {{"path", location}});
            throw common::OpenError(common::ErrorCode::FILE_NOT_FOUND,
                                    "cannot open '" + location + "': no such file and not a URL");
        }
    }

    source.isUrl = true;
    source.stream = openUrl(location);
    return source;
}

std::unique_ptr<transread::io::IStream> transread::core::SourceResolver::reopen(const Source& source) {
    if (source.isUrl) {
        return openUrl(source.name);
    }
    return std::make_unique<io::LocalFileStream>(source.name);
}
