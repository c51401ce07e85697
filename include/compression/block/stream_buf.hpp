#pragma once

#include "compression/block/codec.hpp"
#include "compression/block/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <streambuf>
#include <vector>

namespace bigcomp::compression::block {

// Output side of the block compressor. Bytes written through an std::ostream
// bound to this buffer are cut into blocks of at most kMaxBlockSize and
// appended, framed, to the sink given to reset(). The instance is meant to be
// reused: reset() starts a brand new stream and drops any leftover state.
class CompressingStreamBuf : public std::streambuf {
public:
    CompressingStreamBuf();

    CompressingStreamBuf(const CompressingStreamBuf&) = delete;
    CompressingStreamBuf& operator=(const CompressingStreamBuf&) = delete;

    void reset(std::vector<std::uint8_t>& sink);

    // Flushes the pending block and writes the end block. Nothing may be
    // written afterwards until the next reset().
    void finish();

    std::uint64_t rawBytes() const noexcept;

protected:
    int_type overflow(int_type character) override;
    int sync() override;

private:
    void flushBlock();
    void requireOpen() const;

    std::vector<char> block_;
    std::vector<std::uint8_t> packed_;
    std::vector<std::uint8_t>* sink_ {nullptr};
    LzwEncoder encoder_;
    std::uint64_t rawBytes_ {0};
    bool finished_ {true};
};

// Input side: decodes one stream from a byte range, a block at a time.
class DecompressingStreamBuf : public std::streambuf {
public:
    DecompressingStreamBuf();

    DecompressingStreamBuf(const DecompressingStreamBuf&) = delete;
    DecompressingStreamBuf& operator=(const DecompressingStreamBuf&) = delete;

    void reset(const std::uint8_t* data, std::size_t size);

    // True once the end block has been read.
    bool finished() const noexcept;
    // Compressed bytes consumed so far, stream header included.
    std::size_t consumed() const noexcept;

protected:
    int_type underflow() override;

private:
    void readBlock();

    const std::uint8_t* data_ {nullptr};
    std::size_t size_ {0};
    std::size_t position_ {0};
    std::vector<std::uint8_t> block_;
    LzwDecoder decoder_;
    bool finished_ {false};
};

// Length of the complete stream that starts at data, or nullopt when the
// bytes do not hold one (wrong magic, or a block runs past size).
std::optional<std::size_t> measureFrame(const std::uint8_t* data, std::size_t size);

} // namespace bigcomp::compression::block
