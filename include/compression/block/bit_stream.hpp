#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace bigcomp::compression::block {

class BitWriter {
public:
    explicit BitWriter(std::vector<std::uint8_t>& buffer);

    void writeBits(std::uint32_t value, unsigned width);
    void finish();

private:
    std::vector<std::uint8_t>& buffer_;
    std::uint32_t current_ {0};
    unsigned bitCount_ {0};
};

class BitReader {
public:
    BitReader(const std::uint8_t* data, std::size_t size);

    bool readBits(unsigned width, std::uint32_t& value);

private:
    const std::uint8_t* data_ {nullptr};
    std::size_t size_ {0};
    std::size_t byteIndex_ {0};
    std::uint32_t current_ {0};
    unsigned bitCount_ {0};
};

} // namespace bigcomp::compression::block
