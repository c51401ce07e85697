#include "archive/chunk_encoder.hpp"

#include <algorithm>
#include <fstream>
#include <ostream>
#include <stdexcept>
#include <string>

namespace bigcomp::archive {
namespace {

TarHeader makeHeader(const filesystem::Entry& entry)
{
    TarHeader header {};
    header.name = entry.relativePath.generic_string();
    header.mode = static_cast<std::uint32_t>(entry.permissions);

    if (entry.isDirectory()) {
        header.name.push_back('/');
        header.typeFlag = static_cast<char>(TypeFlag::Directory);
        header.size = 0;
    } else {
        header.typeFlag = static_cast<char>(TypeFlag::Regular);
        header.size = entry.size;
    }
    return header;
}

} // namespace

ChunkEncoder::ChunkEncoder(std::size_t copyBufferSize)
    : copyBuffer_(std::max<std::size_t>(copyBufferSize, 1))
{
}

void ChunkEncoder::encode(const chunking::Chunk& chunk, std::vector<std::uint8_t>& buffer)
{
    compressor_.reset(buffer);

    std::ostream stream(&compressor_);
    stream.exceptions(std::ios::badbit);

    TarWriter writer(stream);
    for (const auto& entry : chunk.entries) {
        writer.writeHeader(makeHeader(entry));
        if (!entry.isDirectory()) {
            appendFile(writer, entry);
        }
    }

    // The trailer has to reach the compressor before its final block is cut.
    writer.close();
    compressor_.finish();
    lastArchiveSize_ = compressor_.rawBytes();
}

std::uint64_t ChunkEncoder::lastArchiveSize() const noexcept
{
    return lastArchiveSize_;
}

void ChunkEncoder::appendFile(TarWriter& writer, const filesystem::Entry& entry)
{
    std::ifstream input(entry.absolutePath, std::ios::binary);
    if (!input) {
        throw std::runtime_error("Failed to open file for reading: " + entry.absolutePath.string());
    }

    std::uint64_t copied = 0;
    while (copied < entry.size) {
        const auto wanted = std::min<std::uint64_t>(copyBuffer_.size(), entry.size - copied);
        input.read(copyBuffer_.data(), static_cast<std::streamsize>(wanted));
        const auto got = input.gcount();
        if (got <= 0) {
            throw std::runtime_error("File shrank while being archived: " + entry.absolutePath.string());
        }
        writer.write(copyBuffer_.data(), static_cast<std::size_t>(got));
        copied += static_cast<std::uint64_t>(got);
    }

    if (input.peek() != std::ifstream::traits_type::eof()) {
        throw std::runtime_error("File grew while being archived: " + entry.absolutePath.string());
    }
}

} // namespace bigcomp::archive
