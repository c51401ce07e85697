#pragma once

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace bigcomp::core {

// A compressed chunk is larger than the decompression scan buffer. Raising
// the limit and retrying is expected to succeed.
class ScanBufferOverflowError : public std::runtime_error {
public:
    explicit ScanBufferOverflowError(std::size_t limit)
        : std::runtime_error("Chunk separator not found within " + std::to_string(limit)
                             + " bytes; increase the maximum decompression buffer size")
        , limit_(limit)
    {
    }

    std::size_t limit() const noexcept { return limit_; }

private:
    std::size_t limit_;
};

// Replay could not create a directory it needs. Nothing else in the
// operation can succeed after this, so it is never wrapped or retried.
class DirectoryCreationError : public std::runtime_error {
public:
    DirectoryCreationError(std::filesystem::path path, std::error_code code)
        : std::runtime_error("Failed to create directory " + path.string() + ": " + code.message())
        , path_(std::move(path))
        , code_(code)
    {
    }

    const std::filesystem::path& path() const noexcept { return path_; }
    const std::error_code& code() const noexcept { return code_; }

private:
    std::filesystem::path path_;
    std::error_code code_;
};

// Any other failure while encoding or replaying a single chunk.
class ChunkError : public std::runtime_error {
public:
    ChunkError(std::size_t chunkIndex, const std::string& message)
        : std::runtime_error("Chunk " + std::to_string(chunkIndex) + ": " + message)
        , chunkIndex_(chunkIndex)
    {
    }

    std::size_t chunkIndex() const noexcept { return chunkIndex_; }

private:
    std::size_t chunkIndex_;
};

} // namespace bigcomp::core
