#include "core/big_compressor.hpp"

#include "chunking/boundary_scanner.hpp"
#include "chunking/chunk_planner.hpp"
#include "chunking/chunk_writer.hpp"
#include "core/errors.hpp"
#include "filesystem/path_walker.hpp"
#include "utils/file_io.hpp"

#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace bigcomp::core {
namespace {

void validateScanBufferSize(std::size_t size)
{
    if (size <= chunking::kChunkSeparator.size()) {
        throw std::invalid_argument("Maximum decompression buffer size must exceed "
                                    + std::to_string(chunking::kChunkSeparator.size()) + " bytes");
    }
}

bool isCompleteFrame(const std::uint8_t* data, std::size_t size)
{
    const auto length = compression::block::measureFrame(data, size);
    return length.has_value() && *length == size;
}

} // namespace

BigCompressor::BigCompressor(Config config)
    : config_(std::move(config))
    , encoder_(config_.copyBufferSize)
    , decoder_(config_.copyBufferSize)
{
}

const Config& BigCompressor::config() const noexcept
{
    return config_;
}

void BigCompressor::setMaxDecompressBufferSize(std::size_t size)
{
    validateScanBufferSize(size);
    config_.maxDecompressBufferSize = size;
}

void BigCompressor::setChunkObserver(ChunkObserver observer)
{
    observer_ = std::move(observer);
}

CompressionReport BigCompressor::compress(const std::filesystem::path& sourceDirectory,
                                          const std::filesystem::path& destination)
{
    if (config_.maxPrecompressChunkSize == 0U) {
        throw std::invalid_argument("Maximum pre-compression chunk size must be greater than zero");
    }

    filesystem::PathWalker walker(sourceDirectory);
    const auto chunks = chunking::planChunks(walker, config_.maxPrecompressChunkSize);

    utils::ensureParentDirectory(destination);
    chunking::ChunkWriter writer(destination,
                                 config_.combineChunks ? chunking::OutputMode::Combined
                                                       : chunking::OutputMode::PerChunkFiles);

    CompressionReport report {};
    report.chunkCount = chunks.size();
    report.skippedEntries = walker.skippedCount();

    for (const auto& chunk : chunks) {
        buffer_.clear();

        ChunkEvent event {};
        event.index = chunk.index;
        event.entryCount = chunk.entries.size();
        event.sourceBytes = chunk.totalSize;

        try {
            encoder_.encode(chunk, buffer_);
            event.archiveBytes = encoder_.lastArchiveSize();
            event.compressedBytes = buffer_.size();
            writer.write(chunk.index, buffer_);
        } catch (const std::exception& ex) {
            buffer_.clear();
            throw ChunkError(chunk.index, ex.what());
        }

        report.entryCount += event.entryCount;
        report.sourceBytes += event.sourceBytes;
        notify(event);
    }

    writer.close();
    report.bytesWritten = writer.bytesWritten();
    return report;
}

DecompressionReport BigCompressor::decompress(const std::filesystem::path& source,
                                              const std::filesystem::path& destinationDirectory)
{
    validateScanBufferSize(config_.maxDecompressBufferSize);

    const auto inputs = resolveInputs(source);

    const auto ec = utils::createDirectoryTree(destinationDirectory);
    if (ec) {
        throw DirectoryCreationError(destinationDirectory, ec);
    }

    DecompressionReport report {};
    for (const auto& input : inputs) {
        scanInput(input, destinationDirectory, report);
        ++report.inputsScanned;
    }

    buffer_.clear();
    return report;
}

void BigCompressor::scanInput(const std::filesystem::path& input,
                              const std::filesystem::path& destinationDirectory,
                              DecompressionReport& report)
{
    std::ifstream stream(input, std::ios::binary);
    if (!stream) {
        throw std::runtime_error("Failed to open compressed input: " + input.string());
    }

    chunking::BoundaryScanner::Validator validator;
    if (config_.validateBoundaries) {
        validator = isCompleteFrame;
    }

    chunking::BoundaryScanner scanner(stream,
                                      chunking::kChunkSeparator,
                                      config_.maxDecompressBufferSize,
                                      compression::block::kMinimumStreamSize,
                                      std::move(validator));

    const auto discardedBefore = report.tokensDiscarded;
    while (scanner.next(buffer_)) {
        const auto index = report.tokensDecoded;

        archive::ReplayResult result {};
        try {
            result = decoder_.replay(buffer_.data(), buffer_.size(), destinationDirectory);
        } catch (const DirectoryCreationError&) {
            throw;
        } catch (const std::exception& ex) {
            throw ChunkError(index, ex.what());
        }

        ChunkEvent event {};
        event.index = index;
        event.entryCount = result.filesRestored;
        event.sourceBytes = result.bytesRestored;
        event.compressedBytes = buffer_.size();

        ++report.tokensDecoded;
        report.filesRestored += result.filesRestored;
        report.bytesRestored += result.bytesRestored;
        buffer_.clear();
        notify(event);
    }
    report.tokensDiscarded = discardedBefore + scanner.discardedCount();
}

void BigCompressor::notify(const ChunkEvent& event) const
{
    if (observer_) {
        observer_(event);
    }
}

std::vector<std::filesystem::path> resolveInputs(const std::filesystem::path& source)
{
    std::error_code ec;
    if (std::filesystem::is_regular_file(source, ec)) {
        return {source};
    }

    std::vector<std::filesystem::path> inputs;
    for (std::size_t index = 0;; ++index) {
        auto candidate = chunking::chunkPath(source, index);
        if (!std::filesystem::is_regular_file(candidate, ec)) {
            break;
        }
        inputs.push_back(std::move(candidate));
    }

    if (inputs.empty()) {
        throw std::runtime_error("Compressed input not found: " + source.string());
    }
    return inputs;
}

} // namespace bigcomp::core
