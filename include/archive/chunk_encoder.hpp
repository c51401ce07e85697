#pragma once

#include "archive/tar_writer.hpp"
#include "chunking/chunk_planner.hpp"
#include "compression/block/stream_buf.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace bigcomp::archive {

inline constexpr std::size_t kDefaultCopyBufferSize = 32 * 1024;

// Turns one chunk into a compressed tar stream. The compressor and the copy
// buffer live as long as the encoder and are reset for every chunk.
class ChunkEncoder {
public:
    explicit ChunkEncoder(std::size_t copyBufferSize = kDefaultCopyBufferSize);

    // Appends the compressed stream for chunk to buffer.
    void encode(const chunking::Chunk& chunk, std::vector<std::uint8_t>& buffer);

    // Size of the tar stream produced by the last encode().
    std::uint64_t lastArchiveSize() const noexcept;

private:
    void appendFile(TarWriter& writer, const filesystem::Entry& entry);

    compression::block::CompressingStreamBuf compressor_;
    std::vector<char> copyBuffer_;
    std::uint64_t lastArchiveSize_ {0};
};

} // namespace bigcomp::archive
