#pragma once

#include "archive/chunk_encoder.hpp"
#include "archive/tar_reader.hpp"
#include "compression/block/stream_buf.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace bigcomp::archive {

struct ReplayResult {
    std::size_t filesRestored {0};
    std::uint64_t bytesRestored {0};
};

// Decompresses one chunk and writes its regular files under a destination
// root. Directory entries are not materialized on their own; parents are
// created on demand for the files that need them.
class ChunkDecoder {
public:
    explicit ChunkDecoder(std::size_t copyBufferSize = kDefaultCopyBufferSize);

    ReplayResult replay(const std::uint8_t* data, std::size_t size, const std::filesystem::path& destination);

private:
    std::uint64_t restoreFile(TarReader& reader, const TarHeader& header, const std::filesystem::path& target);

    compression::block::DecompressingStreamBuf decompressor_;
    std::vector<char> copyBuffer_;
};

// Maps an archive name onto a relative path, rejecting absolute names and
// names that climb out of the destination.
std::filesystem::path sanitizeEntryName(const std::string& name);

} // namespace bigcomp::archive
