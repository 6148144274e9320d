// src/compression/DecompressingStream.cpp
#include "transread/compression/DecompressingStream.hpp"
#include <algorithm>

transread::compression::DecompressingStream::DecompressingStream(std::unique_ptr<io::IStream> source,
                                                                 std::unique_ptr<IDecompressor> decompressor,
                                                                 size_t minReadChunkSize)
    : LogBase("DECOMPRESSING_STREAM"),
      source_(std::move(source)),
      decompressor_(std::move(decompressor)),
      minReadChunkSize_(minReadChunkSize == 0 ? common::Constants::MIN_READ_CHUNK_SIZE : minReadChunkSize),
      bufferPos_(0),
      eof_(false),
      closed_(false),
      position_(0),
      rawBytesRead_(0) {}

transread::compression::DecompressingStream::~DecompressingStream() {
    close();
}

std::string transread::compression::DecompressingStream::describe() const {
    std::string inner = source_ ? source_->describe() : std::string("closed source");
    if (!decompressor_) {
        return inner;
    }
    return decompressor_->getAlgorithmName() + " data from " + inner;
}

void transread::compression::DecompressingStream::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    decompressor_.reset();
    if (source_) {
        source_->close();
    }

    buffer_.clear();
    buffer_.shrink_to_fit();
    bufferPos_ = 0;
    rawChunk_ = common::ByteArray();
    decodedChunk_ = common::ByteArray();
}

void transread::compression::DecompressingStream::readFromBuffer(common::ByteArray& out, size_t length) {
    size_t available = bufferedBytes();
    if (available > length) {
        out.insert(out.end(), buffer_.begin() + bufferPos_, buffer_.begin() + bufferPos_ + length);
        bufferPos_ += length;
    } else {
        out.insert(out.end(), buffer_.begin() + bufferPos_, buffer_.end());
        buffer_.clear();
        bufferPos_ = 0;
    }
}

void transread::compression::DecompressingStream::markEndOfStream() {
    eof_ = true;
    if (decompressor_) {
        decompressor_->finish();
    }
    logDebug("read", "end of stream reached",
             {{"source", source_->describe()},
              {"raw_bytes", rawBytesRead_},
              {"delivered_bytes", position_}});
}

void transread::compression::DecompressingStream::fill(common::ByteArray& out, size_t remaining) {
    const size_t chunkSize = std::max(remaining, minReadChunkSize_);
    while (remaining > 0 && !eof_) {
        source_->read(rawChunk_, chunkSize);
        if (rawChunk_.empty()) {
            markEndOfStream();
            break;
        }
        rawBytesRead_ += rawChunk_.size();

        common::ByteArray* chunk = &rawChunk_;
        if (decompressor_) {
            decompressor_->decompress(rawChunk_, decodedChunk_);
            if (decodedChunk_.empty()) {
                continue;
            }
            chunk = &decodedChunk_;
        }

        if (chunk->size() >= remaining) {
            // Keep the surplus for the next read.
            buffer_.swap(*chunk);
            bufferPos_ = 0;
            readFromBuffer(out, remaining);
            remaining = 0;
        } else {
            out.insert(out.end(), chunk->begin(), chunk->end());
            remaining -= chunk->size();
        }
    }
}

void transread::compression::DecompressingStream::read(common::ByteArray& out, size_t bytesToRead) {
    if (closed_) {
        throw common::IOError(common::ErrorCode::STREAM_CLOSED,
                              "cannot read " + describe() + ": stream is closed");
    }

    out.clear();
    if (bytesToRead == 0) {
        return;
    }
    if (failure_ && bufferedBytes() == 0) {
        std::rethrow_exception(failure_);
    }
    if (endOfStream()) {
        return;
    }

    readFromBuffer(out, bytesToRead);
    if (out.size() < bytesToRead && !failure_) {
        try {
            fill(out, bytesToRead - out.size());
        } catch (const common::Error& e) {
            failure_ = std::current_exception();
            logError("read", e.what(), e.code().value(),
                     {{"source", source_->describe()}, {"delivered_bytes", position_ + out.size()}});
            if (out.empty()) {
                throw;
            }
        }
    }

    position_ += out.size();
}
