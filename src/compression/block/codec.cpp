#include "compression/block/codec.hpp"

#include "compression/block/bit_stream.hpp"

#include <openssl/evp.h>

#include <stdexcept>

namespace bigcomp::compression::block {

LzwEncoder::LzwEncoder()
{
    dictionary_.reserve(kMaxDictionarySize);
}

void LzwEncoder::reset()
{
    dictionary_.clear();
    nextCode_ = kInitialDictionarySize;
}

void LzwEncoder::encode(const std::uint8_t* data, std::size_t size, std::vector<std::uint8_t>& output)
{
    if (size == 0U) {
        return;
    }

    reset();
    BitWriter writer(output);

    std::uint32_t current = data[0];
    for (std::size_t index = 1; index < size; ++index) {
        const std::uint32_t key = (current << 8U) | data[index];

        const auto iterator = dictionary_.find(key);
        if (iterator != dictionary_.end()) {
            current = iterator->second;
            continue;
        }

        writer.writeBits(current, kCodeWidth);
        if (nextCode_ < kMaxDictionarySize) {
            dictionary_.emplace(key, nextCode_++);
        }
        current = data[index];
    }

    writer.writeBits(current, kCodeWidth);
    writer.finish();
}

LzwDecoder::LzwDecoder()
{
    scratch_.reserve(kMaxDictionarySize);
}

void LzwDecoder::reset()
{
    for (std::uint16_t code = 0; code < kInitialDictionarySize; ++code) {
        prefix_[code] = 0;
        suffix_[code] = static_cast<std::uint8_t>(code);
        first_[code] = static_cast<std::uint8_t>(code);
    }
    nextCode_ = kInitialDictionarySize;
}

void LzwDecoder::appendSequence(std::uint16_t code, std::vector<std::uint8_t>& output)
{
    scratch_.clear();
    while (code >= kInitialDictionarySize) {
        scratch_.push_back(suffix_[code]);
        code = prefix_[code];
    }
    scratch_.push_back(static_cast<std::uint8_t>(code));
    output.insert(output.end(), scratch_.rbegin(), scratch_.rend());
}

void LzwDecoder::decode(const std::uint8_t* codes,
                        std::size_t size,
                        std::size_t rawSize,
                        std::vector<std::uint8_t>& output)
{
    if (rawSize == 0U) {
        return;
    }

    reset();
    BitReader reader(codes, size);
    const auto start = output.size();

    std::uint32_t value = 0;
    if (!reader.readBits(kCodeWidth, value)) {
        throw std::runtime_error("LZW block is missing its first code");
    }
    if (value >= kInitialDictionarySize) {
        throw std::runtime_error("Invalid first LZW code");
    }

    auto previous = static_cast<std::uint16_t>(value);
    appendSequence(previous, output);

    while (output.size() - start < rawSize) {
        if (!reader.readBits(kCodeWidth, value)) {
            throw std::runtime_error("LZW block ended before its declared size");
        }

        const auto code = static_cast<std::uint16_t>(value);
        if (code > nextCode_ || (code == nextCode_ && nextCode_ >= kMaxDictionarySize)) {
            throw std::runtime_error("Invalid LZW code encountered during decoding");
        }

        const auto firstByte = code < nextCode_ ? first_[code] : first_[previous];
        if (nextCode_ < kMaxDictionarySize) {
            prefix_[nextCode_] = previous;
            suffix_[nextCode_] = firstByte;
            first_[nextCode_] = first_[previous];
            ++nextCode_;
        }

        appendSequence(code, output);
        previous = code;
    }

    if (output.size() - start != rawSize) {
        throw std::runtime_error("LZW block decoded past its declared size");
    }
}

std::uint32_t blockChecksum(const std::uint8_t* data, std::size_t size)
{
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestSize = 0;
    if (EVP_Digest(data, size, digest, &digestSize, EVP_sha256(), nullptr) != 1 || digestSize < 4U) {
        throw std::runtime_error("Failed to compute block checksum");
    }

    return static_cast<std::uint32_t>(digest[0])
        | (static_cast<std::uint32_t>(digest[1]) << 8U)
        | (static_cast<std::uint32_t>(digest[2]) << 16U)
        | (static_cast<std::uint32_t>(digest[3]) << 24U);
}

} // namespace bigcomp::compression::block
