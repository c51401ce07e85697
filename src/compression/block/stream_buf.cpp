#include "compression/block/stream_buf.hpp"

#include <cstring>
#include <iterator>
#include <stdexcept>
#include <string>

namespace bigcomp::compression::block {
namespace {

void appendValue(std::vector<std::uint8_t>& output, std::uint32_t value)
{
    for (unsigned shift = 0; shift < 32U; shift += 8U) {
        output.push_back(static_cast<std::uint8_t>(value >> shift));
    }
}

std::uint32_t loadValue(const std::uint8_t* input)
{
    return static_cast<std::uint32_t>(input[0])
        | (static_cast<std::uint32_t>(input[1]) << 8U)
        | (static_cast<std::uint32_t>(input[2]) << 16U)
        | (static_cast<std::uint32_t>(input[3]) << 24U);
}

void appendBlockHeader(std::vector<std::uint8_t>& output, const BlockHeader& header)
{
    output.push_back(static_cast<std::uint8_t>(header.type));
    appendValue(output, header.rawSize);
    appendValue(output, header.payloadSize);
    appendValue(output, header.checksum);
}

BlockHeader parseBlockHeader(const std::uint8_t* input)
{
    BlockHeader header {};
    header.type = static_cast<BlockType>(input[0]);
    header.rawSize = loadValue(input + 1);
    header.payloadSize = loadValue(input + 5);
    header.checksum = loadValue(input + 9);
    return header;
}

bool hasStreamHeader(const std::uint8_t* data, std::size_t size)
{
    return size >= kStreamHeaderSize
        && std::memcmp(data, kStreamMagic, sizeof(kStreamMagic)) == 0
        && data[4] == kFormatVersion;
}

} // namespace

CompressingStreamBuf::CompressingStreamBuf()
    : block_(kMaxBlockSize)
{
    packed_.reserve(kMaxBlockSize * 2);
}

void CompressingStreamBuf::reset(std::vector<std::uint8_t>& sink)
{
    sink_ = &sink;
    rawBytes_ = 0;
    finished_ = false;
    setp(block_.data(), block_.data() + block_.size());

    sink.insert(sink.end(), std::begin(kStreamMagic), std::end(kStreamMagic));
    sink.push_back(kFormatVersion);
    sink.insert(sink.end(), 3, std::uint8_t {0});
}

void CompressingStreamBuf::finish()
{
    requireOpen();
    flushBlock();
    appendBlockHeader(*sink_, BlockHeader {});
    finished_ = true;
    setp(nullptr, nullptr);
}

std::uint64_t CompressingStreamBuf::rawBytes() const noexcept
{
    return rawBytes_;
}

CompressingStreamBuf::int_type CompressingStreamBuf::overflow(int_type character)
{
    requireOpen();
    flushBlock();
    if (!traits_type::eq_int_type(character, traits_type::eof())) {
        *pptr() = traits_type::to_char_type(character);
        pbump(1);
    }
    return traits_type::not_eof(character);
}

int CompressingStreamBuf::sync()
{
    // Blocks are only cut when full or at finish(); a flush has nothing to do.
    return 0;
}

void CompressingStreamBuf::requireOpen() const
{
    if (finished_ || sink_ == nullptr) {
        throw std::logic_error("Compressed stream is not open for writing");
    }
}

void CompressingStreamBuf::flushBlock()
{
    const auto size = static_cast<std::size_t>(pptr() - pbase());
    if (size == 0U) {
        return;
    }

    const auto* raw = reinterpret_cast<const std::uint8_t*>(pbase());
    packed_.clear();
    encoder_.encode(raw, size, packed_);

    BlockHeader header {};
    header.rawSize = static_cast<std::uint32_t>(size);
    header.checksum = blockChecksum(raw, size);

    if (packed_.size() < size) {
        header.type = BlockType::Lzw;
        header.payloadSize = static_cast<std::uint32_t>(packed_.size());
        appendBlockHeader(*sink_, header);
        sink_->insert(sink_->end(), packed_.begin(), packed_.end());
    } else {
        header.type = BlockType::Stored;
        header.payloadSize = header.rawSize;
        appendBlockHeader(*sink_, header);
        sink_->insert(sink_->end(), raw, raw + size);
    }

    rawBytes_ += size;
    setp(block_.data(), block_.data() + block_.size());
}

DecompressingStreamBuf::DecompressingStreamBuf()
{
    block_.reserve(kMaxBlockSize);
}

void DecompressingStreamBuf::reset(const std::uint8_t* data, std::size_t size)
{
    data_ = data;
    size_ = size;
    position_ = 0;
    finished_ = false;
    block_.clear();
    setg(nullptr, nullptr, nullptr);

    if (size < kStreamHeaderSize || std::memcmp(data, kStreamMagic, sizeof(kStreamMagic)) != 0) {
        throw std::runtime_error("Invalid compressed stream magic");
    }
    if (data[4] != kFormatVersion) {
        throw std::runtime_error("Unsupported compressed stream version: " + std::to_string(data[4]));
    }
    position_ = kStreamHeaderSize;
}

bool DecompressingStreamBuf::finished() const noexcept
{
    return finished_;
}

std::size_t DecompressingStreamBuf::consumed() const noexcept
{
    return position_;
}

DecompressingStreamBuf::int_type DecompressingStreamBuf::underflow()
{
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }

    while (!finished_) {
        readBlock();
        if (!block_.empty()) {
            auto* begin = reinterpret_cast<char*>(block_.data());
            setg(begin, begin, begin + block_.size());
            return traits_type::to_int_type(*gptr());
        }
    }

    return traits_type::eof();
}

void DecompressingStreamBuf::readBlock()
{
    if (size_ - position_ < kBlockHeaderSize) {
        throw std::runtime_error("Compressed stream truncated inside a block header");
    }

    const auto header = parseBlockHeader(data_ + position_);
    position_ += kBlockHeaderSize;
    block_.clear();

    if (header.type == BlockType::End) {
        if (header.rawSize != 0U || header.payloadSize != 0U) {
            throw std::runtime_error("Malformed end block in compressed stream");
        }
        finished_ = true;
        return;
    }

    if (header.rawSize == 0U || header.rawSize > kMaxBlockSize) {
        throw std::runtime_error("Compressed block declares invalid size: " + std::to_string(header.rawSize));
    }
    if (size_ - position_ < header.payloadSize) {
        throw std::runtime_error("Compressed stream truncated inside a block payload");
    }

    const auto* payload = data_ + position_;
    switch (header.type) {
    case BlockType::Lzw:
        decoder_.decode(payload, header.payloadSize, header.rawSize, block_);
        break;
    case BlockType::Stored:
        if (header.payloadSize != header.rawSize) {
            throw std::runtime_error("Stored block size mismatch");
        }
        block_.assign(payload, payload + header.payloadSize);
        break;
    default:
        throw std::runtime_error("Unknown compressed block type: " + std::to_string(static_cast<int>(header.type)));
    }
    position_ += header.payloadSize;

    if (blockChecksum(block_.data(), block_.size()) != header.checksum) {
        throw std::runtime_error("Compressed block checksum mismatch");
    }
}

std::optional<std::size_t> measureFrame(const std::uint8_t* data, std::size_t size)
{
    if (!hasStreamHeader(data, size)) {
        return std::nullopt;
    }

    std::size_t position = kStreamHeaderSize;
    while (size - position >= kBlockHeaderSize) {
        const auto header = parseBlockHeader(data + position);
        position += kBlockHeaderSize;

        if (header.type == BlockType::End) {
            return position;
        }
        if (size - position < header.payloadSize) {
            return std::nullopt;
        }
        position += header.payloadSize;
    }

    return std::nullopt;
}

} // namespace bigcomp::compression::block
