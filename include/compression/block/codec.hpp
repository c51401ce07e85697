#pragma once

#include "compression/block/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace bigcomp::compression::block {

// LZW over a single block. The dictionary starts fresh for every block and
// stops growing once it holds kMaxDictionarySize codes.
class LzwEncoder {
public:
    LzwEncoder();

    // Appends the packed 12-bit code stream for [data, data + size) to output.
    void encode(const std::uint8_t* data, std::size_t size, std::vector<std::uint8_t>& output);

private:
    void reset();

    std::unordered_map<std::uint32_t, std::uint16_t> dictionary_;
    std::uint16_t nextCode_ {kInitialDictionarySize};
};

class LzwDecoder {
public:
    LzwDecoder();

    // Decodes exactly rawSize bytes into output; throws on a malformed code stream.
    void decode(const std::uint8_t* codes, std::size_t size, std::size_t rawSize, std::vector<std::uint8_t>& output);

private:
    void reset();
    void appendSequence(std::uint16_t code, std::vector<std::uint8_t>& output);

    std::array<std::uint16_t, kMaxDictionarySize> prefix_ {};
    std::array<std::uint8_t, kMaxDictionarySize> suffix_ {};
    std::array<std::uint8_t, kMaxDictionarySize> first_ {};
    std::vector<std::uint8_t> scratch_;
    std::uint16_t nextCode_ {kInitialDictionarySize};
};

std::uint32_t blockChecksum(const std::uint8_t* data, std::size_t size);

} // namespace bigcomp::compression::block
