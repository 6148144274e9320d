// tests/test_tar_reader.cpp
#include "TestUtils.hpp"
#include "transread/archive/TarMemberStream.hpp"
#include "transread/archive/TarReader.hpp"
#include "transread/io/ForwardSeekStream.hpp"
#include "MemoryStream.hpp"
#include <gtest/gtest.h>

using namespace transread;
using transread::test::TarBuilder;
using transread::test::toBytes;
using transread::test::toString;

TEST(TarReaderTest, ListsEntriesInOrder) {
    test::MemoryStream stream(TarBuilder()
                                .addDirectory("data/")
                                .addFile("data/a.txt", "alpha")
                                .addFile("data/b.txt", std::string(1500, 'b'))
                                .build());
    archive::TarReader reader(stream);

    auto dir = reader.nextEntry();
    ASSERT_TRUE(dir.has_value());
    EXPECT_EQ(dir->name, "data/");
    EXPECT_TRUE(dir->isDirectory());

    auto a = reader.nextEntry();
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->name, "data/a.txt");
    EXPECT_EQ(a->size, 5u);
    EXPECT_TRUE(a->isRegularFile());

    auto b = reader.nextEntry();
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->size, 1500u);

    EXPECT_FALSE(reader.nextEntry().has_value());
    EXPECT_FALSE(reader.nextEntry().has_value());
}

TEST(TarReaderTest, CountStopsAtLimit) {
    TarBuilder builder;
    for (int i = 0; i < 5; ++i) {
        builder.addFile("file" + std::to_string(i), "x");
    }
    test::MemoryStream stream(builder.build(), 0);
    archive::TarReader reader(stream);

    EXPECT_EQ(reader.countEntries(2), 2u);
    EXPECT_GT(stream.remaining(), 0u);
}

TEST(TarReaderTest, EmptyInputHasNoEntries) {
    test::MemoryStream empty(common::ByteArray{});
    archive::TarReader emptyReader(empty);
    EXPECT_EQ(emptyReader.countEntries(2), 0u);

    test::MemoryStream trailerOnly(common::ByteArray(1024, 0));
    archive::TarReader trailerReader(trailerOnly);
    EXPECT_EQ(trailerReader.countEntries(2), 0u);
}

TEST(TarReaderTest, MissingTrailerEndsCleanly) {
    test::MemoryStream stream(TarBuilder().addFile("only", "data").build(false));
    archive::TarReader reader(stream);
    EXPECT_EQ(reader.countEntries(2), 1u);
}

TEST(TarReaderTest, PaxPathReplacesHeaderName) {
    std::string longPath = std::string(150, 'p') + "/member.img";
    test::MemoryStream stream(TarBuilder().addFileWithPaxPath(longPath, "payload").build());
    archive::TarReader reader(stream);

    auto entry = reader.nextEntry();
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->name, longPath);
    EXPECT_EQ(entry->size, 7u);
    EXPECT_FALSE(reader.nextEntry().has_value());
}

TEST(TarReaderTest, GnuLongNameReplacesHeaderName) {
    std::string longName = std::string(120, 'n');
    test::MemoryStream stream(TarBuilder().addGnuLongName(longName, "abc").build());
    archive::TarReader reader(stream);

    EXPECT_EQ(reader.nextEntry()->name, longName);
    EXPECT_FALSE(reader.nextEntry().has_value());
}

TEST(TarReaderTest, BadChecksumIsCorrupt) {
    common::ByteArray data = TarBuilder().addFile("file", "content").build();
    data[0] ^= 0x20;
    test::MemoryStream stream(data);
    archive::TarReader reader(stream);

    try {
        reader.nextEntry();
        FAIL() << "expected FormatError";
    } catch (const common::FormatError& e) {
        EXPECT_EQ(e.errorCode(), common::ErrorCode::ARCHIVE_CORRUPT);
    }
}

TEST(TarReaderTest, TruncatedHeaderIsCorrupt) {
    common::ByteArray data = TarBuilder().addFile("file", "content").build();
    data.resize(300);
    test::MemoryStream stream(data);
    archive::TarReader reader(stream);
    EXPECT_THROW(reader.nextEntry(), common::FormatError);
}

TEST(TarReaderTest, TruncatedDataIsCorruptWhenSkipped) {
    common::ByteArray data = TarBuilder().addFile("big", std::string(5000, 'z')).build(false);
    data.resize(512 + 1000);
    test::MemoryStream stream(data);
    archive::TarReader reader(stream);

    ASSERT_TRUE(reader.nextEntry().has_value());
    EXPECT_THROW(reader.nextEntry(), common::FormatError);
}

TEST(TarReaderTest, SkipsThroughSeekableStreams) {
    auto seekableStream = std::make_unique<io::ForwardSeekStream>(std::make_unique<test::MemoryStream>(
        TarBuilder().addFile("one", std::string(3000, '1')).addFile("two", "2").build()));
    archive::TarReader reader(*seekableStream);

    EXPECT_EQ(reader.nextEntry()->name, "one");
    EXPECT_EQ(reader.nextEntry()->name, "two");
    EXPECT_FALSE(reader.nextEntry().has_value());
}

TEST(TarHeaderTest, ParsesOctalAndBase256) {
    const common::Byte octal[12] = {'0', '0', '0', '0', '0', '0', '0', '1', '7', '5', '4', '\0'};
    EXPECT_EQ(archive::tar_header::parseNumeric(octal, sizeof(octal)), 1004u);

    const common::Byte padded[8] = {' ', ' ', '6', '4', '4', ' ', '\0', '\0'};
    EXPECT_EQ(archive::tar_header::parseNumeric(padded, sizeof(padded)), 0644u);

    common::Byte binary[12] = {0x80, 0, 0, 0, 0, 0, 0, 0x02, 0, 0, 0, 0x01};
    EXPECT_EQ(archive::tar_header::parseNumeric(binary, sizeof(binary)), (uint64_t(2) << 32) + 1);

    const common::Byte invalid[4] = {'1', '9', '2', '\0'};
    EXPECT_THROW(archive::tar_header::parseNumeric(invalid, sizeof(invalid)), common::FormatError);
}

TEST(TarMemberStreamTest, ReadsOnlyMemberData) {
    auto archiveStream = std::make_unique<test::MemoryStream>(
        TarBuilder().addFile("image.raw", "hello world").build());
    archive::TarReader reader(*archiveStream);
    auto entry = reader.nextEntry();
    ASSERT_TRUE(entry.has_value());

    archive::TarMemberStream member(std::move(archiveStream), *entry);
    ASSERT_TRUE(member.getSize().has_value());
    EXPECT_EQ(*member.getSize(), 11u);

    common::ByteArray buffer;
    member.read(buffer, 100);
    EXPECT_EQ(toString(buffer), "hello world");
    member.read(buffer, 100);
    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(member.tell(), 11u);
    EXPECT_EQ(member.describe(), "member 'image.raw' of memory");
}

TEST(TarMemberStreamTest, TruncatedMemberIsCorrupt) {
    common::ByteArray data = TarBuilder().addFile("cut", std::string(2000, 'c')).build(false);
    data.resize(512 + 100);
    auto archiveStream = std::make_unique<test::MemoryStream>(data);
    archive::TarReader reader(*archiveStream);
    auto entry = reader.nextEntry();
    ASSERT_TRUE(entry.has_value());

    archive::TarMemberStream member(std::move(archiveStream), *entry);
    common::ByteArray buffer;
    member.read(buffer, 2000);
    EXPECT_EQ(buffer.size(), 100u);
    try {
        member.read(buffer, 2000);
        FAIL() << "expected FormatError";
    } catch (const common::FormatError& e) {
        EXPECT_EQ(e.errorCode(), common::ErrorCode::ARCHIVE_CORRUPT);
    }
}
