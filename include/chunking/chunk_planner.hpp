#pragma once

#include "filesystem/path_walker.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace bigcomp::chunking {

struct Chunk {
    std::size_t index {0};
    std::vector<filesystem::Entry> entries;
    std::uintmax_t totalSize {0};
};

// Greedy partition of the walk order. An entry that would push the running
// total past the threshold opens the next chunk; an oversized entry still gets
// a chunk of its own. Directories weigh nothing and ride along with the entry
// that follows them. Always returns at least one (possibly empty) chunk.
std::vector<Chunk> planChunks(const std::vector<filesystem::Entry>& entries, std::uintmax_t threshold);
std::vector<Chunk> planChunks(filesystem::PathWalker& walker, std::uintmax_t threshold);

} // namespace bigcomp::chunking
