#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace bigcomp::archive {

// POSIX.1-1988 (ustar) layout; field offsets follow <tar.h>.
inline constexpr std::size_t kBlockSize = 512;
inline constexpr std::size_t kEndBlocks = 2;

namespace field {
inline constexpr std::size_t kNameOffset = 0;
inline constexpr std::size_t kNameSize = 100;
inline constexpr std::size_t kModeOffset = 100;
inline constexpr std::size_t kModeSize = 8;
inline constexpr std::size_t kUidOffset = 108;
inline constexpr std::size_t kGidOffset = 116;
inline constexpr std::size_t kIdSize = 8;
inline constexpr std::size_t kSizeOffset = 124;
inline constexpr std::size_t kSizeSize = 12;
inline constexpr std::size_t kMtimeOffset = 136;
inline constexpr std::size_t kMtimeSize = 12;
inline constexpr std::size_t kChecksumOffset = 148;
inline constexpr std::size_t kChecksumSize = 8;
inline constexpr std::size_t kTypeFlagOffset = 156;
inline constexpr std::size_t kMagicOffset = 257;
inline constexpr std::size_t kVersionOffset = 263;
inline constexpr std::size_t kPrefixOffset = 345;
inline constexpr std::size_t kPrefixSize = 155;
} // namespace field

inline constexpr char kUstarMagic[6] = {'u', 's', 't', 'a', 'r', '\0'};
inline constexpr char kUstarVersion[2] = {'0', '0'};
inline constexpr char kLongLinkName[] = "././@LongLink";

enum class TypeFlag : char {
    Regular = '0',
    Directory = '5',
    GnuLongName = 'L'
};

struct TarHeader {
    std::string name;
    std::uint32_t mode {0};
    std::uint64_t size {0};
    char typeFlag {static_cast<char>(TypeFlag::Regular)};

    bool isRegular() const noexcept
    {
        // Pre-POSIX archives mark regular files with NUL.
        return typeFlag == static_cast<char>(TypeFlag::Regular) || typeFlag == '\0';
    }
    bool isDirectory() const noexcept { return typeFlag == static_cast<char>(TypeFlag::Directory); }
};

using Record = std::array<char, kBlockSize>;

// Fills one header record. name and prefix must already fit their fields.
void encodeHeader(const TarHeader& header, const std::string& prefix, Record& record);

// Parses one header record, validating its checksum.
TarHeader decodeHeader(const Record& record);

bool isZeroRecord(const Record& record);

std::uint64_t paddingFor(std::uint64_t size);

} // namespace bigcomp::archive
