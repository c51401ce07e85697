#pragma once

#include "archive/chunk_decoder.hpp"
#include "archive/chunk_encoder.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <vector>

namespace bigcomp::core {

inline constexpr std::size_t kDefaultMaxDecompressBufferSize = 256 * 1024 * 1024;

struct Config {
    // Regular-file bytes per chunk before a new chunk is started. Required.
    std::uint64_t maxPrecompressChunkSize {0};
    // Largest compressed chunk the decompressor will buffer.
    std::size_t maxDecompressBufferSize {kDefaultMaxDecompressBufferSize};
    bool combineChunks {false};
    std::size_t copyBufferSize {archive::kDefaultCopyBufferSize};
    // Check marker hits against the compressed framing before splitting.
    bool validateBoundaries {true};
};

struct ChunkEvent {
    std::size_t index {0};
    std::size_t entryCount {0};
    std::uint64_t sourceBytes {0};
    // Size of the tar stream before compression; compress only.
    std::uint64_t archiveBytes {0};
    std::uint64_t compressedBytes {0};
};

struct CompressionReport {
    std::size_t chunkCount {0};
    std::size_t entryCount {0};
    std::size_t skippedEntries {0};
    std::uint64_t sourceBytes {0};
    std::uint64_t bytesWritten {0};
};

struct DecompressionReport {
    std::size_t inputsScanned {0};
    std::size_t tokensDecoded {0};
    std::size_t tokensDiscarded {0};
    std::size_t filesRestored {0};
    std::uint64_t bytesRestored {0};
};

// One compression session. Owns the chunk buffer and the encoder/decoder
// state reused from chunk to chunk, so an instance must not be shared between
// concurrent operations; separate instances are independent.
class BigCompressor {
public:
    using ChunkObserver = std::function<void(const ChunkEvent&)>;

    explicit BigCompressor(Config config);

    BigCompressor(const BigCompressor&) = delete;
    BigCompressor& operator=(const BigCompressor&) = delete;

    const Config& config() const noexcept;
    void setMaxDecompressBufferSize(std::size_t size);

    // Called after each chunk is written (compress) or replayed (decompress).
    void setChunkObserver(ChunkObserver observer);

    CompressionReport compress(const std::filesystem::path& sourceDirectory,
                               const std::filesystem::path& destination);

    // source is either a combined file or the common prefix of per-chunk
    // files (source_0, source_1, ...).
    DecompressionReport decompress(const std::filesystem::path& source,
                                   const std::filesystem::path& destinationDirectory);

private:
    void scanInput(const std::filesystem::path& input,
                   const std::filesystem::path& destinationDirectory,
                   DecompressionReport& report);
    void notify(const ChunkEvent& event) const;

    Config config_;
    std::vector<std::uint8_t> buffer_;
    archive::ChunkEncoder encoder_;
    archive::ChunkDecoder decoder_;
    ChunkObserver observer_;
};

// Inputs decompress() would read for source, in order.
std::vector<std::filesystem::path> resolveInputs(const std::filesystem::path& source);

} // namespace bigcomp::core
