// src/archive/TarReader.cpp
#include "transread/archive/TarReader.hpp"
#include "transread/common/Constants.hpp"
#include <algorithm>
#include <cstring>

namespace {

constexpr size_t NAME_OFFSET = 0;
constexpr size_t NAME_LENGTH = 100;
constexpr size_t SIZE_OFFSET = 124;
constexpr size_t SIZE_LENGTH = 12;
constexpr size_t CHECKSUM_OFFSET = 148;
constexpr size_t CHECKSUM_LENGTH = 8;
constexpr size_t TYPE_OFFSET = 156;
constexpr size_t MAGIC_OFFSET = 257;
constexpr size_t PREFIX_OFFSET = 345;
constexpr size_t PREFIX_LENGTH = 155;

// Upper bound for pax and GNU long name records.
constexpr uint64_t MAX_EXTENSION_SIZE = 1048576;

transread::common::FormatError corrupt(const std::string& what) {
    return transread::common::FormatError(transread::common::ErrorCode::ARCHIVE_CORRUPT,
                                          "corrupt tar archive: " + what);
}

bool hasData(char type) {
    // Links, devices, directories and FIFOs carry no data blocks.
    return type == '\0' || std::strchr("123456", type) == nullptr;
}

void parsePaxRecords(const std::string& data, std::optional<std::string>& path,
                     std::optional<uint64_t>& size) {
    size_t pos = 0;
    while (pos < data.size()) {
        size_t space = data.find(' ', pos);
        if (space == std::string::npos) {
            throw corrupt("malformed pax record");
        }

        uint64_t length = 0;
        for (size_t i = pos; i < space; ++i) {
            if (data[i] < '0' || data[i] > '9') {
                throw corrupt("malformed pax record length");
            }
            length = length * 10 + static_cast<uint64_t>(data[i] - '0');
        }
        if (length <= space - pos + 1 || pos + length > data.size()) {
            throw corrupt("malformed pax record length");
        }

        std::string record = data.substr(space + 1, pos + length - space - 2);
        size_t equals = record.find('=');
        if (equals == std::string::npos) {
            throw corrupt("malformed pax record");
        }

        std::string key = record.substr(0, equals);
        std::string value = record.substr(equals + 1);
        if (key == "path") {
            path = value;
        } else if (key == "size") {
            try {
                size = std::stoull(value);
            } catch (const std::exception&) {
                throw corrupt("invalid pax size '" + value + "'");
            }
        }

        pos += length;
    }
}

}

bool transread::archive::tar_header::isZeroBlock(const common::Byte* block) {
    return std::all_of(block, block + common::Constants::TAR_BLOCK_SIZE,
                       [](common::Byte b) { return b == 0; });
}

bool transread::archive::tar_header::verifyChecksum(const common::Byte* block) {
    uint64_t stored = parseNumeric(block + CHECKSUM_OFFSET, CHECKSUM_LENGTH);

    // Some old writers summed signed chars, so accept either.
    int64_t unsignedSum = 0;
    int64_t signedSum = 0;
    for (size_t i = 0; i < common::Constants::TAR_BLOCK_SIZE; ++i) {
        bool inChecksum = i >= CHECKSUM_OFFSET && i < CHECKSUM_OFFSET + CHECKSUM_LENGTH;
        common::Byte b = inChecksum ? static_cast<common::Byte>(' ') : block[i];
        unsignedSum += b;
        signedSum += static_cast<signed char>(b);
    }

    return static_cast<int64_t>(stored) == unsignedSum || static_cast<int64_t>(stored) == signedSum;
}

uint64_t transread::archive::tar_header::parseNumeric(const common::Byte* field, size_t length) {
    if (field[0] & 0x80) {
        // GNU base-256 encoding.
        if (field[0] == 0xff) {
            throw corrupt("negative numeric field");
        }
        uint64_t value = field[0] & 0x7f;
        for (size_t i = 1; i < length; ++i) {
            if (value > (UINT64_MAX >> 8)) {
                throw corrupt("numeric field overflow");
            }
            value = (value << 8) | field[i];
        }
        return value;
    }

    size_t i = 0;
    while (i < length && (field[i] == ' ' || field[i] == '\0')) {
        ++i;
    }

    uint64_t value = 0;
    for (; i < length && field[i] != ' ' && field[i] != '\0'; ++i) {
        if (field[i] < '0' || field[i] > '7') {
            throw corrupt("invalid octal digit in header");
        }
        value = (value << 3) | static_cast<uint64_t>(field[i] - '0');
    }
    return value;
}

std::string transread::archive::tar_header::parseString(const common::Byte* field, size_t length) {
    const common::Byte* end = std::find(field, field + length, 0);
    return std::string(reinterpret_cast<const char*>(field), static_cast<size_t>(end - field));
}

transread::archive::TarReader::TarReader(io::IStream& stream)
    : stream_(stream), remainingData_(0), padding_(0), finished_(false),
      block_(common::Constants::TAR_BLOCK_SIZE) {}

void transread::archive::TarReader::readExact(common::ByteArray& buffer, size_t length) {
    buffer.clear();
    while (buffer.size() < length) {
        stream_.read(scratch_, length - buffer.size());
        if (scratch_.empty()) {
            throw corrupt("unexpected end of data in " + stream_.describe());
        }
        buffer.insert(buffer.end(), scratch_.begin(), scratch_.end());
    }
}

bool transread::archive::TarReader::readBlock() {
    const size_t blockSize = common::Constants::TAR_BLOCK_SIZE;

    stream_.read(scratch_, blockSize);
    if (scratch_.empty()) {
        return false;
    }

    block_.assign(scratch_.begin(), scratch_.end());
    while (block_.size() < blockSize) {
        stream_.read(scratch_, blockSize - block_.size());
        if (scratch_.empty()) {
            throw corrupt("truncated header block");
        }
        block_.insert(block_.end(), scratch_.begin(), scratch_.end());
    }
    return true;
}

void transread::archive::TarReader::discard(uint64_t length) {
    if (length == 0) {
        return;
    }

    if (stream_.seekable()) {
        try {
            stream_.seek(static_cast<int64_t>(length), common::SeekOrigin::CURRENT);
        } catch (const common::SeekError& e) {
            if (e.errorCode() == common::ErrorCode::SEEK_PAST_END) {
                throw corrupt("member data is truncated");
            }
            throw;
        }
        return;
    }

    while (length > 0) {
        size_t toRead = static_cast<size_t>(std::min<uint64_t>(length, common::Constants::MIN_READ_CHUNK_SIZE));
        stream_.read(scratch_, toRead);
        if (scratch_.empty()) {
            throw corrupt("member data is truncated");
        }
        length -= scratch_.size();
    }
}

void transread::archive::TarReader::skipCurrent() {
    discard(remainingData_ + padding_);
    remainingData_ = 0;
    padding_ = 0;
}

std::string transread::archive::TarReader::readExtensionData(uint64_t size) {
    if (size > MAX_EXTENSION_SIZE) {
        throw corrupt("extension header of " + std::to_string(size) + " bytes is too large");
    }

    common::ByteArray data;
    readExact(data, static_cast<size_t>(size));

    const uint64_t blockSize = common::Constants::TAR_BLOCK_SIZE;
    discard((blockSize - size % blockSize) % blockSize);

    return std::string(data.begin(), data.end());
}

std::optional<transread::archive::TarEntry> transread::archive::TarReader::nextEntry() {
    if (finished_) {
        return std::nullopt;
    }

    skipCurrent();

    std::optional<std::string> longName;
    std::optional<std::string> paxPath;
    std::optional<uint64_t> paxSize;

    while (true) {
        if (!readBlock()) {
            finished_ = true;
            if (longName || paxPath || paxSize) {
                throw corrupt("extension header without a following entry");
            }
            return std::nullopt;
        }

        const common::Byte* header = block_.data();
        if (tar_header::isZeroBlock(header)) {
            finished_ = true;
            return std::nullopt;
        }
        if (!tar_header::verifyChecksum(header)) {
            throw corrupt("header checksum mismatch");
        }

        TarEntry entry;
        entry.type = static_cast<char>(header[TYPE_OFFSET]);
        entry.size = tar_header::parseNumeric(header + SIZE_OFFSET, SIZE_LENGTH);
        entry.name = tar_header::parseString(header + NAME_OFFSET, NAME_LENGTH);
        if (std::memcmp(header + MAGIC_OFFSET, "ustar", 5) == 0) {
            std::string prefix = tar_header::parseString(header + PREFIX_OFFSET, PREFIX_LENGTH);
            if (!prefix.empty()) {
                entry.name = prefix + "/" + entry.name;
            }
        }

        switch (entry.type) {
            case 'L': {
                std::string name = readExtensionData(entry.size);
                name.erase(std::find(name.begin(), name.end(), '\0'), name.end());
                longName = name;
                continue;
            }
            case 'x': {
                parsePaxRecords(readExtensionData(entry.size), paxPath, paxSize);
                continue;
            }
            case 'K':
            case 'g':
                readExtensionData(entry.size);
                continue;
            default:
                break;
        }

        if (longName) {
            entry.name = *longName;
        }
        if (paxPath) {
            entry.name = *paxPath;
        }
        if (paxSize) {
            entry.size = *paxSize;
        }

        if (hasData(entry.type)) {
            const uint64_t blockSize = common::Constants::TAR_BLOCK_SIZE;
            remainingData_ = entry.size;
            padding_ = (blockSize - entry.size % blockSize) % blockSize;
        } else {
            remainingData_ = 0;
            padding_ = 0;
        }

        return entry;
    }
}

size_t transread::archive::TarReader::countEntries(size_t limit) {
    size_t count = 0;
    while (count < limit && nextEntry()) {
        ++count;
    }
    return count;
}
