// src/archive/TarMemberStream.cpp
#include "transread/archive/TarMemberStream.hpp"
#include <algorithm>

transread::archive::TarMemberStream::TarMemberStream(std::unique_ptr<io::IStream> archive, TarEntry entry)
    : archive_(std::move(archive)), entry_(std::move(entry)), position_(0) {}

transread::archive::TarMemberStream::~TarMemberStream() {
    close();
}

std::string transread::archive::TarMemberStream::describe() const {
    return "member '" + entry_.name + "' of " + archive_->describe();
}

void transread::archive::TarMemberStream::close() {
    if (archive_) {
        archive_->close();
    }
}

void transread::archive::TarMemberStream::read(common::ByteArray& buffer, size_t bytesToRead) {
    uint64_t left = entry_.size - position_;
    size_t toRead = static_cast<size_t>(std::min<uint64_t>(left, bytesToRead));
    if (toRead == 0) {
        buffer.clear();
        return;
    }

    archive_->read(buffer, toRead);
    if (buffer.empty()) {
        throw common::FormatError(common::ErrorCode::ARCHIVE_CORRUPT,
                                  "corrupt tar archive: " + describe() + " is truncated at byte " +
                                  std::to_string(position_) + " of " + std::to_string(entry_.size));
    }
    position_ += buffer.size();
}
