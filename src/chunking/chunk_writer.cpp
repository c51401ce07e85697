#include "chunking/chunk_writer.hpp"

#include "utils/file_io.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace bigcomp::chunking {

std::filesystem::path chunkPath(const std::filesystem::path& destination, std::size_t index)
{
    auto path = destination;
    path += "_" + std::to_string(index);
    return path;
}

ChunkWriter::ChunkWriter(std::filesystem::path destination, OutputMode mode)
    : destination_(std::move(destination))
    , mode_(mode)
{
    if (mode_ == OutputMode::Combined) {
        combined_.open(destination_, std::ios::binary | std::ios::trunc);
        if (!combined_) {
            throw std::runtime_error("Failed to open output for writing: " + destination_.string());
        }
    }
}

void ChunkWriter::write(std::size_t index, std::vector<std::uint8_t>& buffer)
{
    if (mode_ == OutputMode::Combined) {
        writeCombined(buffer);
    } else {
        writeSeparate(index, buffer);
    }
    buffer.clear();
}

void ChunkWriter::close()
{
    if (closed_) {
        return;
    }

    if (combined_.is_open()) {
        combined_.close();
        if (!combined_) {
            throw std::runtime_error("Failed to close output: " + destination_.string());
        }
    }

    removeStaleOutputs();
    closed_ = true;
}

std::uint64_t ChunkWriter::bytesWritten() const noexcept
{
    return bytesWritten_;
}

void ChunkWriter::writeCombined(const std::vector<std::uint8_t>& buffer)
{
    combined_.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    combined_.write(kChunkSeparator.data(), static_cast<std::streamsize>(kChunkSeparator.size()));
    if (!combined_) {
        throw std::runtime_error("Failed to write chunk to: " + destination_.string());
    }
    bytesWritten_ += buffer.size() + kChunkSeparator.size();
}

void ChunkWriter::writeSeparate(std::size_t index, const std::vector<std::uint8_t>& buffer)
{
    utils::writeBufferToFile(chunkPath(destination_, index), buffer);
    bytesWritten_ += buffer.size();
    chunkFiles_ = std::max(chunkFiles_, index + 1);
}

void ChunkWriter::removeStaleOutputs()
{
    // Decompression reads <destination> if it exists, else <destination>_0.. up
    // to the first gap, so output left by an earlier run must not survive.
    std::error_code ec;
    if (mode_ == OutputMode::PerChunkFiles && std::filesystem::is_regular_file(destination_, ec)) {
        removeOutput(destination_);
    }

    for (auto index = chunkFiles_;; ++index) {
        const auto path = chunkPath(destination_, index);
        if (!std::filesystem::is_regular_file(path, ec)) {
            break;
        }
        removeOutput(path);
    }
}

void ChunkWriter::removeOutput(const std::filesystem::path& path)
{
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        throw std::filesystem::filesystem_error("Failed to remove stale output", path, ec);
    }
}

} // namespace bigcomp::chunking
