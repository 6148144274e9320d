// tests/test_transread.cpp
#include "TestUtils.hpp"
#include "transread/core/TransRead.hpp"
#include <gtest/gtest.h>

using namespace transread;
using common::CompressionType;
using transread::test::TarBuilder;
using transread::test::toString;

class TransReadTest : public ::testing::Test {
protected:
    test::TempDir dir_;

    std::string readAll(core::TransRead& reader, size_t step) {
        std::string out;
        while (true) {
            common::ByteArray chunk = reader.read(step);
            if (chunk.empty()) {
                break;
            }
            out += toString(chunk);
        }
        return out;
    }
};

TEST_F(TransReadTest, ReadsGzipHelloWorld) {
    std::string path = dir_.write("hello.gz", test::gzipCompress("hello world"));
    core::TransRead reader(path);

    EXPECT_TRUE(reader.isCompressed());
    EXPECT_FALSE(reader.isUrl());
    EXPECT_EQ(reader.compressionType(), CompressionType::GZIP);
    EXPECT_FALSE(reader.size().has_value());
    EXPECT_EQ(reader.name(), path);

    EXPECT_EQ(toString(reader.read(5)), "hello");
    EXPECT_EQ(toString(reader.read(6)), " world");
    EXPECT_TRUE(reader.read(1).empty());
}

TEST_F(TransReadTest, SeekSkipsDecompressedBytes) {
    std::string path = dir_.write("hello.gz", test::gzipCompress("hello world"));
    core::TransRead reader(path);

    reader.seek(6);
    EXPECT_EQ(reader.tell(), 6u);
    EXPECT_EQ(toString(reader.read(5)), "world");
}

TEST_F(TransReadTest, ReadsBzip2) {
    std::string path = dir_.write("hello.bz2", test::bzip2Compress("hello world"));
    core::TransRead reader(path);

    EXPECT_EQ(reader.compressionType(), CompressionType::BZIP2);
    EXPECT_EQ(toString(reader.read(100)), "hello world");
}

TEST_F(TransReadTest, ReadsSingleMemberTarballs) {
    std::string tar = TarBuilder().addFile("disk.img", "hello world").buildString();
    std::string tgz = dir_.write("disk.tgz", test::gzipCompress(tar));
    std::string targz = dir_.write("disk.tar.gz", test::gzipCompress(tar));
    std::string tarbz2 = dir_.write("disk.tar.bz2", test::bzip2Compress(tar));

    for (const std::string& path : {tgz, targz, tarbz2}) {
        core::TransRead reader(path);
        EXPECT_TRUE(reader.isCompressed()) << path;
        ASSERT_TRUE(reader.size().has_value()) << path;
        EXPECT_EQ(*reader.size(), 11u) << path;

        reader.seek(6);
        EXPECT_EQ(toString(reader.read(100)), "world") << path;
        EXPECT_TRUE(reader.read(1).empty()) << path;
    }
}

TEST_F(TransReadTest, EmptyTarballIsFormatError) {
    std::string path = dir_.write("empty.tar.gz", test::gzipCompress(std::string(1024, '\0')));
    try {
        core::TransRead reader(path);
        FAIL() << "expected FormatError";
    } catch (const common::FormatError& e) {
        EXPECT_EQ(e.errorCode(), common::ErrorCode::ARCHIVE_EMPTY);
        EXPECT_NE(std::string(e.what()).find("is empty (no files)"), std::string::npos);
    }
}

TEST_F(TransReadTest, MultiMemberTarballIsFormatError) {
    std::string tar = TarBuilder().addFile("a", "1").addFile("b", "2").buildString();
    std::string path = dir_.write("two.tar.bz2", test::bzip2Compress(tar));
    try {
        core::TransRead reader(path);
        FAIL() << "expected FormatError";
    } catch (const common::FormatError& e) {
        EXPECT_EQ(e.errorCode(), common::ErrorCode::ARCHIVE_MULTIPLE_MEMBERS);
        EXPECT_NE(std::string(e.what()).find("contains more than one file"), std::string::npos);
    }
}

TEST_F(TransReadTest, UncompressedFileKeepsSize) {
    std::string path = dir_.write("disk.img", "raw bytes");
    core::TransRead reader(path);

    EXPECT_FALSE(reader.isCompressed());
    ASSERT_TRUE(reader.size().has_value());
    EXPECT_EQ(*reader.size(), 9u);
    EXPECT_TRUE(reader.seekable());

    reader.seek(4);
    EXPECT_EQ(toString(reader.read(100)), "bytes");
}

TEST_F(TransReadTest, NonexistentPathIsOpenError) {
    EXPECT_THROW(core::TransRead((dir_.path() / "missing.img.gz").string()), common::OpenError);
}

TEST_F(TransReadTest, DirectoryIsOpenError) {
    EXPECT_THROW(core::TransRead(dir_.path().string()), common::OpenError);
}

TEST_F(TransReadTest, ReadSizeDoesNotChangeContent) {
    std::string text = test::makePayload(400000);
    std::string path = dir_.write("payload.gz", test::gzipCompress(text));

    core::TransRead byteWise(path);
    std::string slow;
    for (size_t i = 0; i < 5000; ++i) {
        slow += toString(byteWise.read(1));
    }
    slow += readAll(byteWise, 65536);

    core::TransRead whole(path);
    EXPECT_EQ(slow, text);
    EXPECT_EQ(toString(whole.read(text.size() + 1)), text);
}

TEST_F(TransReadTest, SeekMatchesReadAndDrop) {
    std::string text = test::makePayload(250000);
    std::string path = dir_.write("payload.bz2", test::bzip2Compress(text));

    core::TransRead reader(path);
    reader.seek(200000);
    reader.seek(1000, common::SeekOrigin::CURRENT);
    EXPECT_EQ(toString(reader.read(500)), text.substr(201000, 500));
    EXPECT_THROW(reader.seek(10), common::SeekError);
}

TEST_F(TransReadTest, ReadsStayEmptyAtEnd) {
    std::string path = dir_.write("tiny.gz", test::gzipCompress("ab"));
    core::TransRead reader(path);

    EXPECT_EQ(toString(reader.read(10)), "ab");
    EXPECT_TRUE(reader.read(10).empty());
    EXPECT_TRUE(reader.read(10).empty());
    EXPECT_EQ(reader.tell(), 2u);
}

TEST_F(TransReadTest, CloseIsIdempotentAndFinal) {
    std::string path = dir_.write("closing.gz", test::gzipCompress("abc"));
    core::TransRead reader(path);

    reader.close();
    reader.close();
    EXPECT_TRUE(reader.isClosed());
    EXPECT_FALSE(reader.seekable());
    try {
        reader.read(1);
        FAIL() << "expected IOError";
    } catch (const common::IOError& e) {
        EXPECT_EQ(e.errorCode(), common::ErrorCode::STREAM_CLOSED);
    }
}

TEST_F(TransReadTest, SmallChunkConfigurationGivesSameData) {
    std::string text = test::makePayload(10000);
    std::string path = dir_.write("chunked.gz", test::gzipCompress(text));

    common::ReaderConfig config;
    config.minReadChunkSize = 7;
    core::TransRead reader(path, config);
    EXPECT_EQ(readAll(reader, 333), text);
}

TEST_F(TransReadTest, InvalidConfigurationIsRejected) {
    std::string path = dir_.write("x.gz", test::gzipCompress("x"));
    common::ReaderConfig config;
    config.minReadChunkSize = 0;
    EXPECT_THROW(core::TransRead(path, config), common::ConfigError);
}

TEST_F(TransReadTest, ReportsSupportedCompressionTypes) {
    EXPECT_EQ(core::TransRead::supportedCompressionTypes().size(), 5u);
}

struct CompressedFormat {
    const char* suffix;
    bool tarball;
    bool bzip2;
};

class CompressedFormatTest : public ::testing::TestWithParam<CompressedFormat> {
protected:
    test::TempDir dir_;
    std::string text_ = test::makePayload(300000);

    std::string writeSample() {
        const CompressedFormat& format = GetParam();
        std::string body = format.tarball
            ? TarBuilder().addFile("disk.img", text_).buildString()
            : text_;
        common::ByteArray packed = format.bzip2 ? test::bzip2Compress(body)
                                                : test::gzipCompress(body);
        return dir_.write(std::string("sample") + format.suffix, packed);
    }
};

TEST_P(CompressedFormatTest, ByteReadsMatchWholeRead) {
    std::string path = writeSample();

    core::TransRead byteWise(path);
    std::string slow;
    common::ByteArray buffer;
    while (true) {
        byteWise.read(buffer, 1);
        if (buffer.empty()) {
            break;
        }
        slow += toString(buffer);
    }

    core::TransRead whole(path);
    EXPECT_EQ(slow, text_);
    EXPECT_EQ(toString(whole.read(text_.size() + 1)), text_);
    EXPECT_EQ(byteWise.tell(), text_.size());
}

TEST_P(CompressedFormatTest, SeekThenReadMatchesSlice) {
    core::TransRead reader(writeSample());

    reader.seek(123457);
    EXPECT_EQ(reader.tell(), 123457u);
    EXPECT_EQ(toString(reader.read(1000)), text_.substr(123457, 1000));
    EXPECT_EQ(reader.tell(), 124457u);
}

TEST_P(CompressedFormatTest, BackwardSeekIsRejected) {
    core::TransRead reader(writeSample());
    reader.seek(2000);
    try {
        reader.seek(1999);
        FAIL() << "expected SeekError";
    } catch (const common::SeekError& e) {
        EXPECT_EQ(e.errorCode(), common::ErrorCode::SEEK_BACKWARD);
    }
    EXPECT_EQ(reader.tell(), 2000u);
}

TEST_P(CompressedFormatTest, SeekPastEndIsRejected) {
    core::TransRead reader(writeSample());
    try {
        reader.seek(static_cast<int64_t>(text_.size()) + 1);
        FAIL() << "expected SeekError";
    } catch (const common::SeekError& e) {
        EXPECT_EQ(e.errorCode(), common::ErrorCode::SEEK_PAST_END);
    }
}

INSTANTIATE_TEST_SUITE_P(
    AllFormats, CompressedFormatTest,
    ::testing::Values(CompressedFormat{".gz", false, false},
                      CompressedFormat{".bz2", false, true},
                      CompressedFormat{".tar.gz", true, false},
                      CompressedFormat{".tgz", true, false},
                      CompressedFormat{".tar.bz2", true, true}),
    [](const ::testing::TestParamInfo<CompressedFormat>& info) {
        std::string name;
        for (const char* c = info.param.suffix; *c; ++c) {
            if (*c != '.') {
                name += *c;
            }
        }
        return name;
    });
