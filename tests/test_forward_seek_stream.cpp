// tests/test_forward_seek_stream.cpp
#include "TestUtils.hpp"
#include "transread/io/ForwardSeekStream.hpp"
#include "transread/io/LocalFileStream.hpp"
#include "MemoryStream.hpp"
#include <gtest/gtest.h>
#include <limits>

using namespace transread;
using transread::test::toBytes;
using transread::test::toString;

namespace {

std::unique_ptr<io::ForwardSeekStream> seekable(const std::string& text, size_t maxRead = 0,
                                                size_t discardChunk = 4) {
    return std::make_unique<io::ForwardSeekStream>(
        std::make_unique<test::MemoryStream>(toBytes(text), maxRead), discardChunk);
}

}

TEST(ForwardSeekStreamTest, SeekFromBeginThenRead) {
    auto stream = seekable("hello world");
    stream->seek(6);
    EXPECT_EQ(stream->tell(), 6u);

    common::ByteArray buffer;
    stream->read(buffer, 5);
    EXPECT_EQ(toString(buffer), "world");
    EXPECT_EQ(stream->tell(), 11u);
}

TEST(ForwardSeekStreamTest, SeekRelativeToCurrent) {
    auto stream = seekable("0123456789abcdef", 3);
    common::ByteArray buffer;
    stream->read(buffer, 2);
    stream->seek(5, common::SeekOrigin::CURRENT);
    EXPECT_EQ(stream->tell(), 7u);

    stream->read(buffer, 3);
    EXPECT_EQ(toString(buffer), "789");
}

TEST(ForwardSeekStreamTest, SeekToCurrentPositionIsNoOp) {
    auto stream = seekable("abc");
    stream->seek(0);
    stream->seek(0, common::SeekOrigin::CURRENT);
    EXPECT_EQ(stream->tell(), 0u);
}

TEST(ForwardSeekStreamTest, SeekEqualsReadAndDrop) {
    std::string text = test::makePayload(5000);
    for (size_t k : {0u, 1u, 511u, 4096u, 4999u}) {
        auto stream = seekable(text, 0, 1000);
        stream->seek(static_cast<int64_t>(k));
        common::ByteArray buffer;
        stream->read(buffer, 100);
        EXPECT_EQ(toString(buffer), text.substr(k, 100)) << "offset " << k;
    }
}

TEST(ForwardSeekStreamTest, BackwardSeekIsRejected) {
    auto stream = seekable("hello world");
    stream->seek(6);
    try {
        stream->seek(2);
        FAIL() << "expected SeekError";
    } catch (const common::SeekError& e) {
        EXPECT_EQ(e.errorCode(), common::ErrorCode::SEEK_BACKWARD);
        EXPECT_NE(std::string(e.what()).find("seeking from 6 to 2"), std::string::npos);
    }
    EXPECT_EQ(stream->tell(), 6u);
}

TEST(ForwardSeekStreamTest, NegativeRelativeSeekIsRejected) {
    auto stream = seekable("hello world");
    stream->seek(4);
    EXPECT_THROW(stream->seek(-1, common::SeekOrigin::CURRENT), common::SeekError);
}

TEST(ForwardSeekStreamTest, EndOriginIsRejected) {
    auto stream = seekable("hello world");
    try {
        stream->seek(0, common::SeekOrigin::END);
        FAIL() << "expected SeekError";
    } catch (const common::SeekError& e) {
        EXPECT_EQ(e.errorCode(), common::ErrorCode::SEEK_UNSUPPORTED_ORIGIN);
    }
}

TEST(ForwardSeekStreamTest, SeekPastEndIsRejected) {
    auto stream = seekable("short");
    try {
        stream->seek(100);
        FAIL() << "expected SeekError";
    } catch (const common::SeekError& e) {
        EXPECT_EQ(e.errorCode(), common::ErrorCode::SEEK_PAST_END);
    }
    EXPECT_EQ(stream->tell(), 5u);
}

TEST(ForwardSeekStreamTest, HugeRelativeSeekIsPastEnd) {
    auto stream = seekable("hello world");
    common::ByteArray buffer;
    stream->read(buffer, 3);
    try {
        stream->seek(std::numeric_limits<int64_t>::max(), common::SeekOrigin::CURRENT);
        FAIL() << "expected SeekError";
    } catch (const common::SeekError& e) {
        EXPECT_EQ(e.errorCode(), common::ErrorCode::SEEK_PAST_END);
    }
    EXPECT_EQ(stream->tell(), 3u);
}

TEST(ForwardSeekStreamTest, SeekToExactEndIsAllowed) {
    auto stream = seekable("short");
    stream->seek(5);
    common::ByteArray buffer;
    stream->read(buffer, 1);
    EXPECT_TRUE(buffer.empty());
}

TEST(ForwardSeekStreamTest, CloseClosesInnerStream) {
    auto inner = std::make_unique<test::MemoryStream>(toBytes("abc"));
    test::MemoryStream* view = inner.get();
    io::ForwardSeekStream stream(std::move(inner));
    stream.close();
    EXPECT_TRUE(view->isClosed());
}

TEST(ForwardSeekStreamTest, PlainStreamsRefuseToSeek) {
    test::MemoryStream stream(toBytes("abc"));
    EXPECT_FALSE(stream.seekable());
    try {
        stream.seek(1);
        FAIL() << "expected SeekError";
    } catch (const common::SeekError& e) {
        EXPECT_EQ(e.errorCode(), common::ErrorCode::SEEK_UNSUPPORTED);
    }
}

TEST(LocalFileStreamTest, NativeSeekFollowsForwardOnlyContract) {
    test::TempDir dir;
    std::string path = dir.write("plain.bin", "hello world");

    io::LocalFileStream stream(path);
    ASSERT_TRUE(stream.getSize().has_value());
    EXPECT_EQ(*stream.getSize(), 11u);

    stream.seek(6);
    common::ByteArray buffer;
    stream.read(buffer, 5);
    EXPECT_EQ(toString(buffer), "world");

    EXPECT_THROW(stream.seek(0), common::SeekError);
    EXPECT_THROW(stream.seek(0, common::SeekOrigin::END), common::SeekError);
    EXPECT_THROW(stream.seek(50), common::SeekError);
}

TEST(LocalFileStreamTest, HugeRelativeSeekIsPastEnd) {
    test::TempDir dir;
    std::string path = dir.write("plain.bin", "hello world");

    io::LocalFileStream stream(path);
    common::ByteArray buffer;
    stream.read(buffer, 3);
    try {
        stream.seek(std::numeric_limits<int64_t>::max(), common::SeekOrigin::CURRENT);
        FAIL() << "expected SeekError";
    } catch (const common::SeekError& e) {
        EXPECT_EQ(e.errorCode(), common::ErrorCode::SEEK_PAST_END);
    }
    EXPECT_EQ(stream.tell(), 3u);
}

TEST(LocalFileStreamTest, MissingFileIsNotFound) {
    test::TempDir dir;
    try {
        io::LocalFileStream stream((dir.path() / "missing").string());
        FAIL() << "expected OpenError";
    } catch (const common::OpenError& e) {
        EXPECT_EQ(e.errorCode(), common::ErrorCode::FILE_NOT_FOUND);
    }
}

TEST(LocalFileStreamTest, DirectoryIsRejected) {
    test::TempDir dir;
    try {
        io::LocalFileStream stream(dir.path().string());
        FAIL() << "expected OpenError";
    } catch (const common::OpenError& e) {
        EXPECT_EQ(e.errorCode(), common::ErrorCode::FILE_READ_ERROR);
    }
}
