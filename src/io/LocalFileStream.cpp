// src/io/LocalFileStream.cpp
#include "transread/io/LocalFileStream.hpp"
#include <cerrno>
#include <cstring>
#include <limits>
#include <sys/stat.h>

namespace {

transread::common::ErrorCode openErrorCode(int err) {
    switch (err) {
        case ENOENT:
            return transread::common::ErrorCode::FILE_NOT_FOUND;
        case EACCES:
        case EPERM:
            return transread::common::ErrorCode::FILE_ACCESS_DENIED;
        default:
            return transread::common::ErrorCode::FILE_READ_ERROR;
    }
}

}

transread::io::LocalFileStream::LocalFileStream(const std::string& filePath)
    : filePath_(filePath), fileSize_(0), position_(0), fileHandle_(nullptr) {
    FILE* file = fopen(filePath_.c_str(), "rb");
    if (!file) {
        int err = errno;
        throw common::OpenError(openErrorCode(err),
                                "cannot open file '" + filePath_ + "': " + std::strerror(err));
    }

    struct stat info;
    if (fstat(fileno(file), &info) != 0) {
        int err = errno;
        fclose(file);
        throw common::OpenError(common::ErrorCode::FILE_READ_ERROR,
                                "cannot open file '" + filePath_ + "': " + std::strerror(err));
    }
    if (S_ISDIR(info.st_mode)) {
        fclose(file);
        throw common::OpenError(common::ErrorCode::FILE_READ_ERROR,
                                "cannot open file '" + filePath_ + "': " + std::strerror(EISDIR));
    }

    fileHandle_ = file;
    fileSize_ = static_cast<uint64_t>(info.st_size);
}

transread::io::LocalFileStream::~LocalFileStream() {
    close();
}

void transread::io::LocalFileStream::close() {
    if (fileHandle_) {
        fclose(fileHandle_);
        fileHandle_ = nullptr;
    }
}

void transread::io::LocalFileStream::read(common::ByteArray& buffer, size_t bytesToRead) {
    if (!fileHandle_) {
        throw common::IOError(common::ErrorCode::STREAM_CLOSED,
                              "cannot read " + describe() + ": stream is closed");
    }

    buffer.resize(bytesToRead);
    if (bytesToRead == 0) {
        return;
    }

    size_t bytesRead = fread(buffer.data(), 1, bytesToRead, fileHandle_);
    if (bytesRead < bytesToRead && ferror(fileHandle_)) {
        int err = errno;
        buffer.clear();
        throw common::IOError(common::ErrorCode::FILE_READ_ERROR,
                              "cannot read " + describe() + ": " + std::strerror(err));
    }

    buffer.resize(bytesRead);
    position_ += bytesRead;
}

void transread::io::LocalFileStream::seek(int64_t offset, common::SeekOrigin origin) {
    if (!fileHandle_) {
        throw common::IOError(common::ErrorCode::STREAM_CLOSED,
                              "cannot seek " + describe() + ": stream is closed");
    }

    int64_t target = 0;
    if (origin == common::SeekOrigin::BEGIN) {
        target = offset;
    } else if (origin == common::SeekOrigin::CURRENT) {
        if (offset > std::numeric_limits<int64_t>::max() - static_cast<int64_t>(position_)) {
            throw common::SeekError(common::ErrorCode::SEEK_PAST_END,
                                    "cannot seek " + std::to_string(offset) + " bytes past " +
                                    std::to_string(position_) + " in " + describe());
        }
        target = static_cast<int64_t>(position_) + offset;
    } else {
        throw common::SeekError(common::ErrorCode::SEEK_UNSUPPORTED_ORIGIN,
                                "seek() supports only the BEGIN and CURRENT origins");
    }

    if (target < static_cast<int64_t>(position_)) {
        throw common::SeekError(common::ErrorCode::SEEK_BACKWARD,
                                "seek() supports only seeking forward, seeking from " +
                                std::to_string(position_) + " to " + std::to_string(target) +
                                " is not allowed");
    }
    if (static_cast<uint64_t>(target) > fileSize_) {
        throw common::SeekError(common::ErrorCode::SEEK_PAST_END,
                                "cannot seek to " + std::to_string(target) + ": " + describe() +
                                " is only " + std::to_string(fileSize_) + " bytes long");
    }

    if (fseeko(fileHandle_, static_cast<off_t>(target), SEEK_SET) != 0) {
        int err = errno;
        throw common::IOError(common::ErrorCode::FILE_READ_ERROR,
                              "cannot seek " + describe() + ": " + std::strerror(err));
    }

    position_ = static_cast<uint64_t>(target);
}
