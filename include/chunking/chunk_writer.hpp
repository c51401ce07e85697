#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string_view>
#include <vector>

namespace bigcomp::chunking {

inline constexpr std::string_view kChunkSeparator = "_cHuNK_";

enum class OutputMode {
    PerChunkFiles,
    Combined
};

// "<destination>_<index>", the file a chunk gets in per-chunk mode.
std::filesystem::path chunkPath(const std::filesystem::path& destination, std::size_t index);

class ChunkWriter {
public:
    ChunkWriter(std::filesystem::path destination, OutputMode mode);

    ChunkWriter(const ChunkWriter&) = delete;
    ChunkWriter& operator=(const ChunkWriter&) = delete;

    // Persists the buffer for chunk index and clears it for the next chunk.
    void write(std::size_t index, std::vector<std::uint8_t>& buffer);

    // Flushes and closes the combined output, if any, then removes chunk
    // files and combined output left behind by an earlier, larger run.
    void close();

    std::uint64_t bytesWritten() const noexcept;

private:
    void writeCombined(const std::vector<std::uint8_t>& buffer);
    void writeSeparate(std::size_t index, const std::vector<std::uint8_t>& buffer);
    void removeStaleOutputs();
    void removeOutput(const std::filesystem::path& path);

    std::filesystem::path destination_;
    OutputMode mode_;
    std::ofstream combined_;
    std::uint64_t bytesWritten_ {0};
    std::size_t chunkFiles_ {0};
    bool closed_ {false};
};

} // namespace bigcomp::chunking
