#include "compression/block/bit_stream.hpp"

namespace bigcomp::compression::block {

BitWriter::BitWriter(std::vector<std::uint8_t>& buffer)
    : buffer_(buffer)
{
}

void BitWriter::writeBits(std::uint32_t value, unsigned width)
{
    current_ = (current_ << width) | (value & ((1U << width) - 1U));
    bitCount_ += width;
    while (bitCount_ >= 8U) {
        bitCount_ -= 8U;
        buffer_.push_back(static_cast<std::uint8_t>(current_ >> bitCount_));
    }
    current_ &= (1U << bitCount_) - 1U;
}

void BitWriter::finish()
{
    if (bitCount_ > 0U) {
        buffer_.push_back(static_cast<std::uint8_t>(current_ << (8U - bitCount_)));
        current_ = 0;
        bitCount_ = 0;
    }
}

BitReader::BitReader(const std::uint8_t* data, std::size_t size)
    : data_(data)
    , size_(size)
{
}

bool BitReader::readBits(unsigned width, std::uint32_t& value)
{
    while (bitCount_ < width) {
        if (byteIndex_ >= size_) {
            return false;
        }
        current_ = (current_ << 8U) | data_[byteIndex_++];
        bitCount_ += 8U;
    }

    bitCount_ -= width;
    value = (current_ >> bitCount_) & ((1U << width) - 1U);
    current_ &= (1U << bitCount_) - 1U;
    return true;
}

} // namespace bigcomp::compression::block
