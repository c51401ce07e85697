#pragma once

#include <cstddef>
#include <cstdint>

namespace bigcomp::compression::block {

inline constexpr char kStreamMagic[4] = {'B', 'C', 'M', 'P'};
inline constexpr std::uint8_t kFormatVersion = 1;
inline constexpr std::size_t kStreamHeaderSize = 8;

inline constexpr std::size_t kMaxBlockSize = 64 * 1024;
inline constexpr std::size_t kBlockHeaderSize = 13;

inline constexpr std::uint16_t kInitialDictionarySize = 256;
inline constexpr std::uint16_t kMaxDictionarySize = 4096; // 12-bit codes
inline constexpr unsigned kCodeWidth = 12;

// Header plus end block: the shortest stream the encoder can emit.
inline constexpr std::size_t kMinimumStreamSize = kStreamHeaderSize + kBlockHeaderSize;

enum class BlockType : std::uint8_t {
    End = 0,
    Lzw = 1,
    Stored = 2
};

struct BlockHeader {
    BlockType type {BlockType::End};
    std::uint32_t rawSize {0};
    std::uint32_t payloadSize {0};
    std::uint32_t checksum {0};
};

} // namespace bigcomp::compression::block
