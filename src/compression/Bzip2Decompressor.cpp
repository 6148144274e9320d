// src/compression/Bzip2Decompressor.cpp
#include "transread/compression/Bzip2Decompressor.hpp"
#include "transread/common/Constants.hpp"
#include <bzlib.h>
#include <algorithm>
#include <cstring>
#include <limits>

namespace {

std::string bzipErrorString(int ret) {
    switch (ret) {
        case BZ_DATA_ERROR:
            return "data integrity error";
        case BZ_DATA_ERROR_MAGIC:
            return "not a bzip2 stream";
        case BZ_MEM_ERROR:
            return "out of memory";
        case BZ_PARAM_ERROR:
            return "invalid parameter";
        case BZ_CONFIG_ERROR:
            return "libbz2 is misconfigured";
        default:
            return "error " + std::to_string(ret);
    }
}

}

struct transread::compression::Bzip2Decompressor::Bzip2Context {
    bz_stream stream;
    size_t maxSlice = 0;
    bool initialized = false;
    bool inStream = false;
    size_t streamsCompleted = 0;
};

transread::compression::Bzip2Decompressor::Bzip2Decompressor(size_t maxSlice)
    : context_(std::make_unique<Bzip2Context>()) {
    context_->maxSlice = std::min<size_t>(maxSlice == 0 ? common::Constants::DECOMPRESS_MAX_SLICE : maxSlice,
                                          std::numeric_limits<unsigned int>::max());
    initializeDecompression();
}

transread::compression::Bzip2Decompressor::~Bzip2Decompressor() {
    cleanup();
}

void transread::compression::Bzip2Decompressor::initializeDecompression() {
    std::memset(&context_->stream, 0, sizeof(context_->stream));
    int ret = BZ2_bzDecompressInit(&context_->stream, 0, 0);
    if (ret != BZ_OK) {
        throw common::IOError(common::ErrorCode::DECOMPRESSION_FAILED,
                              "bzip2: cannot initialise libbz2: " + bzipErrorString(ret));
    }
    context_->initialized = true;
}

void transread::compression::Bzip2Decompressor::cleanup() {
    if (context_ && context_->initialized) {
        BZ2_bzDecompressEnd(&context_->stream);
        context_->initialized = false;
    }
}

size_t transread::compression::Bzip2Decompressor::getStreamsCompleted() const {
    return context_->streamsCompleted;
}

void transread::compression::Bzip2Decompressor::decompress(const common::ByteArray& input,
                                                           common::ByteArray& output) {
    output.clear();
    if (input.empty()) {
        return;
    }

    bz_stream& stream = context_->stream;
    const size_t maxSlice = context_->maxSlice;
    size_t fed = 0;

    auto refill = [&]() {
        size_t length = std::min(input.size() - fed, maxSlice);
        stream.next_in = reinterpret_cast<char*>(const_cast<common::Byte*>(input.data() + fed));
        stream.avail_in = static_cast<unsigned int>(length);
        fed += length;
    };
    auto inputLeft = [&]() { return stream.avail_in > 0 || fed < input.size(); };

    refill();
    const size_t chunk = std::min(std::max(common::Constants::DECOMPRESS_OUTPUT_CHUNK, input.size() * 4), maxSlice);

    bool more = true;
    while (more) {
        if (stream.avail_in == 0 && fed < input.size()) {
            refill();
        }

        size_t oldSize = output.size();
        output.resize(oldSize + chunk);
        stream.next_out = reinterpret_cast<char*>(output.data() + oldSize);
        stream.avail_out = static_cast<unsigned int>(chunk);

        unsigned int inBefore = stream.avail_in;
        int ret = BZ2_bzDecompress(&stream);
        size_t produced = chunk - stream.avail_out;
        output.resize(oldSize + produced);

        if (ret == BZ_STREAM_END) {
            context_->inStream = false;
            context_->streamsCompleted++;

            // Keep whatever follows the end marker; it is the next stream.
            char* rest = stream.next_in;
            unsigned int restSize = stream.avail_in;
            cleanup();
            initializeDecompression();
            stream.next_in = rest;
            stream.avail_in = restSize;

            more = inputLeft();
            continue;
        }
        if (ret != BZ_OK) {
            throw common::IOError(common::ErrorCode::CORRUPT_COMPRESSED_DATA,
                                  "bzip2: invalid compressed data: " + bzipErrorString(ret));
        }

        context_->inStream = true;
        if (produced == 0 && stream.avail_in == inBefore) {
            break;
        }
        more = inputLeft() || stream.avail_out == 0;
    }
}

void transread::compression::Bzip2Decompressor::finish() {
    if (context_->inStream) {
        throw common::IOError(common::ErrorCode::DECOMPRESSION_FAILED,
                              "bzip2: compressed file ended before the end-of-stream marker was reached");
    }
}
