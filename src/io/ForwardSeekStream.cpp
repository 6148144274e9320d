// src/io/ForwardSeekStream.cpp
#include "transread/io/ForwardSeekStream.hpp"
#include <algorithm>
#include <limits>

transread::io::ForwardSeekStream::ForwardSeekStream(std::unique_ptr<IStream> inner, size_t discardChunkSize)
    : inner_(std::move(inner)),
      position_(0),
      discardChunkSize_(discardChunkSize == 0 ? common::Constants::MIN_READ_CHUNK_SIZE : discardChunkSize) {}

transread::io::ForwardSeekStream::~ForwardSeekStream() {
    close();
}

void transread::io::ForwardSeekStream::close() {
    if (inner_) {
        inner_->close();
    }
    scratch_ = common::ByteArray();
}

void transread::io::ForwardSeekStream::read(common::ByteArray& buffer, size_t bytesToRead) {
    inner_->read(buffer, bytesToRead);
    position_ += buffer.size();
}

void transread::io::ForwardSeekStream::seek(int64_t offset, common::SeekOrigin origin) {
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

    uint64_t gap = static_cast<uint64_t>(target) - position_;
    while (gap > 0) {
        size_t toRead = static_cast<size_t>(std::min<uint64_t>(gap, discardChunkSize_));
        read(scratch_, toRead);
        if (scratch_.empty()) {
            break;
        }
        gap -= scratch_.size();
    }

    if (gap > 0) {
        throw common::SeekError(common::ErrorCode::SEEK_PAST_END,
                                "cannot seek to " + std::to_string(target) + ": " + describe() +
                                " ends at " + std::to_string(position_));
    }
}
