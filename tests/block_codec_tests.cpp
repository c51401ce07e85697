#include "compression/block/codec.hpp"
#include "compression/block/stream_buf.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <iterator>
#include <ostream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace bigcomp::compression::block;

std::vector<std::uint8_t> toBytes(const std::string& text)
{
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

std::vector<std::uint8_t> randomBytes(std::size_t size, std::uint32_t seed)
{
    std::mt19937 generator(seed);
    std::uniform_int_distribution<int> distribution(0, 255);
    std::vector<std::uint8_t> bytes(size);
    for (auto& byte : bytes) {
        byte = static_cast<std::uint8_t>(distribution(generator));
    }
    return bytes;
}

std::vector<std::uint8_t> lzwRoundTrip(const std::vector<std::uint8_t>& input)
{
    std::vector<std::uint8_t> packed;
    LzwEncoder encoder;
    encoder.encode(input.data(), input.size(), packed);

    std::vector<std::uint8_t> output;
    LzwDecoder decoder;
    decoder.decode(packed.data(), packed.size(), input.size(), output);
    return output;
}

std::vector<std::uint8_t> compressStream(const std::vector<std::uint8_t>& input)
{
    std::vector<std::uint8_t> sink;
    CompressingStreamBuf buffer;
    buffer.reset(sink);

    std::ostream stream(&buffer);
    stream.exceptions(std::ios::badbit);
    stream.write(reinterpret_cast<const char*>(input.data()), static_cast<std::streamsize>(input.size()));
    buffer.finish();
    return sink;
}

std::vector<std::uint8_t> decompressStream(const std::vector<std::uint8_t>& compressed)
{
    DecompressingStreamBuf buffer;
    buffer.reset(compressed.data(), compressed.size());

    std::vector<std::uint8_t> output;
    for (std::istreambuf_iterator<char> it(&buffer), end; it != end; ++it) {
        output.push_back(static_cast<std::uint8_t>(*it));
    }
    EXPECT_TRUE(buffer.finished());
    EXPECT_EQ(buffer.consumed(), compressed.size());
    return output;
}

} // namespace

TEST(LzwCodecTest, RoundTripsRepetitiveText)
{
    const auto input = toBytes("TOBEORNOTTOBEORTOBEORNOT#TOBEORNOTTOBEORTOBEORNOT");
    EXPECT_EQ(lzwRoundTrip(input), input);
}

TEST(LzwCodecTest, HandlesCodeDefinedByItsOwnUse)
{
    // "aaaa..." makes the decoder meet a code one step before it is defined.
    const auto input = toBytes(std::string(1000, 'a'));
    EXPECT_EQ(lzwRoundTrip(input), input);

    const auto pattern = toBytes("abababababababab");
    EXPECT_EQ(lzwRoundTrip(pattern), pattern);
}

TEST(LzwCodecTest, KeepsWorkingAfterDictionaryFills)
{
    std::vector<std::uint8_t> input;
    std::mt19937 generator(7);
    std::uniform_int_distribution<int> distribution(0, 15);
    for (std::size_t index = 0; index < kMaxBlockSize; ++index) {
        input.push_back(static_cast<std::uint8_t>('a' + distribution(generator)));
    }

    EXPECT_EQ(lzwRoundTrip(input), input);
}

TEST(LzwCodecTest, SingleByteRoundTrips)
{
    const std::vector<std::uint8_t> input {0x42};
    EXPECT_EQ(lzwRoundTrip(input), input);
}

TEST(LzwCodecTest, RejectsShortCodeStream)
{
    const auto input = toBytes(std::string(200, 'x') + "yzyzyzyz");
    std::vector<std::uint8_t> packed;
    LzwEncoder encoder;
    encoder.encode(input.data(), input.size(), packed);

    std::vector<std::uint8_t> output;
    LzwDecoder decoder;
    EXPECT_THROW(decoder.decode(packed.data(), packed.size() / 2, input.size(), output), std::runtime_error);
}

TEST(BlockChecksumTest, DependsOnContent)
{
    const auto first = toBytes("chunk payload");
    auto second = first;
    second.back() ^= 0x01;

    EXPECT_EQ(blockChecksum(first.data(), first.size()), blockChecksum(first.data(), first.size()));
    EXPECT_NE(blockChecksum(first.data(), first.size()), blockChecksum(second.data(), second.size()));
}

TEST(BlockStreamTest, EmptyStreamIsHeaderAndEndBlock)
{
    const auto compressed = compressStream({});

    ASSERT_EQ(compressed.size(), kMinimumStreamSize);
    EXPECT_EQ(std::string(compressed.begin(), compressed.begin() + 4), "BCMP");
    EXPECT_EQ(compressed[4], kFormatVersion);
    EXPECT_EQ(compressed[kStreamHeaderSize], static_cast<std::uint8_t>(BlockType::End));
    EXPECT_TRUE(decompressStream(compressed).empty());
}

TEST(BlockStreamTest, CompressibleDataShrinksAndRoundTrips)
{
    std::string text;
    for (int line = 0; line < 5000; ++line) {
        text += "line " + std::to_string(line % 40) + " of a fairly repetitive log file\n";
    }
    const auto input = toBytes(text);
    ASSERT_GT(input.size(), 2 * kMaxBlockSize);

    const auto compressed = compressStream(input);
    EXPECT_LT(compressed.size(), input.size() / 2);
    EXPECT_EQ(compressed[kStreamHeaderSize], static_cast<std::uint8_t>(BlockType::Lzw));
    EXPECT_EQ(decompressStream(compressed), input);
}

TEST(BlockStreamTest, IncompressibleDataFallsBackToStoredBlocks)
{
    const auto input = randomBytes(kMaxBlockSize + 1000, 99);

    const auto compressed = compressStream(input);
    EXPECT_EQ(compressed[kStreamHeaderSize], static_cast<std::uint8_t>(BlockType::Stored));
    // Two stored blocks plus framing.
    EXPECT_EQ(compressed.size(), input.size() + kStreamHeaderSize + 3 * kBlockHeaderSize);
    EXPECT_EQ(decompressStream(compressed), input);
}

TEST(BlockStreamTest, BufferIsReusableAcrossStreams)
{
    CompressingStreamBuf buffer;
    std::ostream stream(&buffer);

    std::vector<std::uint8_t> first;
    buffer.reset(first);
    stream << "first stream";
    buffer.finish();

    std::vector<std::uint8_t> second;
    buffer.reset(second);
    stream << "second";
    buffer.finish();
    EXPECT_EQ(buffer.rawBytes(), 6U);

    EXPECT_EQ(decompressStream(first), toBytes("first stream"));
    EXPECT_EQ(decompressStream(second), toBytes("second"));
}

TEST(BlockStreamTest, WritingAfterFinishIsRejected)
{
    std::vector<std::uint8_t> sink;
    CompressingStreamBuf buffer;
    buffer.reset(sink);
    buffer.finish();

    EXPECT_THROW(buffer.finish(), std::logic_error);
}

TEST(BlockStreamTest, DetectsCorruptedPayload)
{
    const auto input = randomBytes(4096, 3);
    auto compressed = compressStream(input);
    compressed[kStreamHeaderSize + kBlockHeaderSize + 100] ^= 0xFF;

    EXPECT_THROW(decompressStream(compressed), std::runtime_error);
}

TEST(BlockStreamTest, DetectsTruncation)
{
    const auto input = toBytes(std::string(10000, 'q'));
    auto compressed = compressStream(input);
    compressed.resize(compressed.size() - kBlockHeaderSize - 1);

    EXPECT_THROW(decompressStream(compressed), std::runtime_error);
}

TEST(BlockStreamTest, RejectsWrongMagic)
{
    auto compressed = compressStream(toBytes("hello"));
    compressed[0] = 'X';

    DecompressingStreamBuf buffer;
    EXPECT_THROW(buffer.reset(compressed.data(), compressed.size()), std::runtime_error);
}

TEST(MeasureFrameTest, MeasuresCompleteStream)
{
    const auto compressed = compressStream(randomBytes(70000, 11));

    const auto length = measureFrame(compressed.data(), compressed.size());
    ASSERT_TRUE(length.has_value());
    EXPECT_EQ(*length, compressed.size());
}

TEST(MeasureFrameTest, StopsAtTheEndBlock)
{
    auto compressed = compressStream(toBytes("abc"));
    const auto expected = compressed.size();
    compressed.insert(compressed.end(), {'_', 'c', 'H', 'u', 'N', 'K', '_'});

    const auto length = measureFrame(compressed.data(), compressed.size());
    ASSERT_TRUE(length.has_value());
    EXPECT_EQ(*length, expected);
}

TEST(MeasureFrameTest, RejectsPartialOrForeignBytes)
{
    const auto compressed = compressStream(randomBytes(5000, 5));

    EXPECT_FALSE(measureFrame(compressed.data(), compressed.size() - 1).has_value());
    EXPECT_FALSE(measureFrame(compressed.data(), 1000).has_value());
    EXPECT_FALSE(measureFrame(compressed.data() + 1, compressed.size() - 1).has_value());
    EXPECT_FALSE(measureFrame(compressed.data(), 4).has_value());
}
