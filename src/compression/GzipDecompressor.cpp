// src/compression/GzipDecompressor.cpp
#include "transread/compression/GzipDecompressor.hpp"
#include "transread/common/Constants.hpp"
#include <zlib.h>
#include <algorithm>
#include <cstring>
#include <limits>

namespace {

// 15 bits of window, +16 selects the gzip wrapper.
constexpr int GZIP_WINDOW_BITS = 15 + 16;

}

struct transread::compression::GzipDecompressor::ZlibContext {
    z_stream stream;
    size_t maxSlice = 0;
    bool initialized = false;
    bool inMember = false;
    size_t membersCompleted = 0;
};

transread::compression::GzipDecompressor::GzipDecompressor(size_t maxSlice)
    : context_(std::make_unique<ZlibContext>()) {
    context_->maxSlice = std::min<size_t>(maxSlice == 0 ? common::Constants::DECOMPRESS_MAX_SLICE : maxSlice,
                                          std::numeric_limits<uInt>::max());
    initializeDecompression();
}

transread::compression::GzipDecompressor::~GzipDecompressor() {
    cleanup();
}

void transread::compression::GzipDecompressor::initializeDecompression() {
    std::memset(&context_->stream, 0, sizeof(context_->stream));
    int ret = inflateInit2(&context_->stream, GZIP_WINDOW_BITS);
    if (ret != Z_OK) {
        throw common::IOError(common::ErrorCode::DECOMPRESSION_FAILED,
                              std::string("gzip: cannot initialise zlib: ") + zError(ret));
    }
    context_->initialized = true;
}

void transread::compression::GzipDecompressor::cleanup() {
    if (context_ && context_->initialized) {
        inflateEnd(&context_->stream);
        context_->initialized = false;
    }
}

size_t transread::compression::GzipDecompressor::getMembersCompleted() const {
    return context_->membersCompleted;
}

void transread::compression::GzipDecompressor::decompress(const common::ByteArray& input,
                                                          common::ByteArray& output) {
    output.clear();
    if (input.empty()) {
        return;
    }

    z_stream& stream = context_->stream;
    const size_t maxSlice = context_->maxSlice;
    size_t fed = 0;

    // Hands zlib the next slice of input once the previous one is used up.
    auto refill = [&]() {
        size_t length = std::min(input.size() - fed, maxSlice);
        stream.next_in = const_cast<Bytef*>(input.data() + fed);
        stream.avail_in = static_cast<uInt>(length);
        fed += length;
    };
    auto inputLeft = [&]() { return stream.avail_in > 0 || fed < input.size(); };

    refill();
    const size_t chunk = std::min(std::max(common::Constants::DECOMPRESS_OUTPUT_CHUNK, input.size() * 2), maxSlice);

    bool more = true;
    while (more) {
        if (stream.avail_in == 0 && fed < input.size()) {
            refill();
        }

        if (!context_->inMember && context_->membersCompleted > 0) {
            while (inputLeft()) {
                if (stream.avail_in == 0) {
                    refill();
                }
                if (*stream.next_in != 0) {
                    break;
                }
                stream.next_in++;
                stream.avail_in--;
            }
            if (!inputLeft()) {
                break;
            }
        }

        size_t oldSize = output.size();
        output.resize(oldSize + chunk);
        stream.next_out = output.data() + oldSize;
        stream.avail_out = static_cast<uInt>(chunk);

        uInt inBefore = stream.avail_in;
        int ret = inflate(&stream, Z_NO_FLUSH);
        size_t produced = chunk - stream.avail_out;
        output.resize(oldSize + produced);

        if (ret == Z_STREAM_END) {
            context_->inMember = false;
            context_->membersCompleted++;
            inflateReset(&stream);
            more = inputLeft();
            continue;
        }
        if (ret == Z_BUF_ERROR) {
            break;
        }
        if (ret != Z_OK) {
            const char* reason = stream.msg ? stream.msg : zError(ret);
            throw common::IOError(common::ErrorCode::CORRUPT_COMPRESSED_DATA,
                                  std::string("gzip: invalid compressed data: ") + reason);
        }

        context_->inMember = true;
        if (produced == 0 && stream.avail_in == inBefore) {
            break;
        }
        more = inputLeft() || stream.avail_out == 0;
    }
}

void transread::compression::GzipDecompressor::finish() {
    if (context_->inMember) {
        throw common::IOError(common::ErrorCode::DECOMPRESSION_FAILED,
                              "gzip: compressed file ended before the end-of-stream marker was reached");
    }
}
