#include "archive/tar_format.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace bigcomp::archive {
namespace {

constexpr std::uint64_t kMaxOctalSize = 077777777777ULL; // 11 octal digits

void writeOctal(Record& record, std::size_t offset, std::size_t width, std::uint64_t value)
{
    // width - 1 digits followed by NUL.
    std::size_t position = offset + width - 1;
    record[position] = '\0';
    while (position > offset) {
        --position;
        record[position] = static_cast<char>('0' + (value & 7U));
        value >>= 3U;
    }
    if (value != 0U) {
        throw std::runtime_error("Value does not fit tar header field");
    }
}

void writeSize(Record& record, std::uint64_t size)
{
    if (size <= kMaxOctalSize) {
        writeOctal(record, field::kSizeOffset, field::kSizeSize, size);
        return;
    }

    // GNU base-256: high bit of the first byte set, big-endian value after it.
    for (std::size_t index = field::kSizeSize; index > 1; --index) {
        record[field::kSizeOffset + index - 1] = static_cast<char>(size & 0xFFU);
        size >>= 8U;
    }
    record[field::kSizeOffset] = static_cast<char>(0x80);
}

std::uint64_t readNumber(const Record& record, std::size_t offset, std::size_t width)
{
    const auto first = static_cast<unsigned char>(record[offset]);
    if ((first & 0x80U) != 0U) {
        std::uint64_t value = first & 0x7FU;
        for (std::size_t index = 1; index < width; ++index) {
            value = (value << 8U) | static_cast<unsigned char>(record[offset + index]);
        }
        return value;
    }

    std::uint64_t value = 0;
    std::size_t index = 0;
    while (index < width && record[offset + index] == ' ') {
        ++index;
    }
    for (; index < width; ++index) {
        const char digit = record[offset + index];
        if (digit == '\0' || digit == ' ') {
            break;
        }
        if (digit < '0' || digit > '7') {
            throw std::runtime_error("Malformed numeric field in tar header");
        }
        value = (value << 3U) | static_cast<std::uint64_t>(digit - '0');
    }
    return value;
}

std::string readString(const Record& record, std::size_t offset, std::size_t width)
{
    const auto* begin = record.data() + offset;
    const auto* end = std::find(begin, begin + width, '\0');
    return std::string(begin, end);
}

std::uint32_t computeChecksum(const Record& record)
{
    std::uint32_t sum = 0;
    for (std::size_t index = 0; index < record.size(); ++index) {
        const bool inChecksumField = index >= field::kChecksumOffset
            && index < field::kChecksumOffset + field::kChecksumSize;
        sum += inChecksumField ? static_cast<unsigned char>(' ') : static_cast<unsigned char>(record[index]);
    }
    return sum;
}

} // namespace

void encodeHeader(const TarHeader& header, const std::string& prefix, Record& record)
{
    if (header.name.size() > field::kNameSize || prefix.size() > field::kPrefixSize) {
        throw std::invalid_argument("Tar header name does not fit: " + header.name);
    }

    record.fill('\0');
    std::memcpy(record.data() + field::kNameOffset, header.name.data(), header.name.size());
    writeOctal(record, field::kModeOffset, field::kModeSize, header.mode & 07777U);
    writeOctal(record, field::kUidOffset, field::kIdSize, 0);
    writeOctal(record, field::kGidOffset, field::kIdSize, 0);
    writeSize(record, header.size);
    writeOctal(record, field::kMtimeOffset, field::kMtimeSize, 0);
    record[field::kTypeFlagOffset] = header.typeFlag;
    std::memcpy(record.data() + field::kMagicOffset, kUstarMagic, sizeof(kUstarMagic));
    std::memcpy(record.data() + field::kVersionOffset, kUstarVersion, sizeof(kUstarVersion));
    std::memcpy(record.data() + field::kPrefixOffset, prefix.data(), prefix.size());

    // Six digits, NUL, space.
    writeOctal(record, field::kChecksumOffset, 7, computeChecksum(record));
    record[field::kChecksumOffset + 7] = ' ';
}

TarHeader decodeHeader(const Record& record)
{
    const auto stored = readNumber(record, field::kChecksumOffset, field::kChecksumSize);
    if (stored != computeChecksum(record)) {
        throw std::runtime_error("Tar header checksum mismatch");
    }

    TarHeader header {};
    header.name = readString(record, field::kNameOffset, field::kNameSize);
    if (std::memcmp(record.data() + field::kMagicOffset, kUstarMagic, 5) == 0) {
        const auto prefix = readString(record, field::kPrefixOffset, field::kPrefixSize);
        if (!prefix.empty()) {
            header.name = prefix + "/" + header.name;
        }
    }
    header.mode = static_cast<std::uint32_t>(readNumber(record, field::kModeOffset, field::kModeSize));
    header.size = readNumber(record, field::kSizeOffset, field::kSizeSize);
    header.typeFlag = record[field::kTypeFlagOffset];
    return header;
}

bool isZeroRecord(const Record& record)
{
    return std::all_of(record.begin(), record.end(), [](char value) { return value == '\0'; });
}

std::uint64_t paddingFor(std::uint64_t size)
{
    const auto remainder = size % kBlockSize;
    return remainder == 0U ? 0U : kBlockSize - remainder;
}

} // namespace bigcomp::archive
