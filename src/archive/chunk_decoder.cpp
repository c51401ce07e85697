#include "archive/chunk_decoder.hpp"

#include "core/errors.hpp"
#include "utils/file_io.hpp"

#include <algorithm>
#include <fstream>
#include <istream>
#include <limits>
#include <stdexcept>
#include <string>
#include <system_error>

namespace bigcomp::archive {
namespace {

void ensureDirectory(const std::filesystem::path& directory)
{
    if (directory.empty()) {
        return;
    }

    const auto ec = utils::createDirectoryTree(directory);
    if (ec) {
        throw core::DirectoryCreationError(directory, ec);
    }
}

} // namespace

std::filesystem::path sanitizeEntryName(const std::string& name)
{
    const auto path = std::filesystem::path(name).lexically_normal();
    if (path.empty() || path.has_root_path()) {
        throw std::runtime_error("Refusing to extract archive entry with unsafe name: " + name);
    }

    for (const auto& component : path) {
        if (component == "..") {
            throw std::runtime_error("Refusing to extract archive entry with unsafe name: " + name);
        }
    }
    return path;
}

ChunkDecoder::ChunkDecoder(std::size_t copyBufferSize)
    : copyBuffer_(std::max<std::size_t>(copyBufferSize, 1))
{
}

ReplayResult ChunkDecoder::replay(const std::uint8_t* data,
                                  std::size_t size,
                                  const std::filesystem::path& destination)
{
    decompressor_.reset(data, size);

    std::istream stream(&decompressor_);
    stream.exceptions(std::ios::badbit);

    ReplayResult result {};
    TarReader reader(stream);
    while (const auto header = reader.next()) {
        if (!header->isRegular()) {
            continue;
        }

        const auto target = destination / sanitizeEntryName(header->name);
        ensureDirectory(target.parent_path());
        result.bytesRestored += restoreFile(reader, *header, target);
        ++result.filesRestored;
    }

    // Read through to the end block so every checksum is verified.
    stream.ignore(std::numeric_limits<std::streamsize>::max());
    if (!decompressor_.finished()) {
        throw std::runtime_error("Compressed stream ended without an end block");
    }
    if (decompressor_.consumed() != size) {
        throw std::runtime_error("Unexpected " + std::to_string(size - decompressor_.consumed())
                                 + " bytes after the end of the compressed stream");
    }

    return result;
}

std::uint64_t ChunkDecoder::restoreFile(TarReader& reader,
                                        const TarHeader& header,
                                        const std::filesystem::path& target)
{
    // An earlier restore may have left a read-only file (or a symlink) here;
    // replace it rather than open it.
    std::error_code ec;
    const auto existing = std::filesystem::symlink_status(target, ec);
    if (!ec && std::filesystem::exists(existing) && !std::filesystem::is_directory(existing)) {
        std::filesystem::remove(target, ec);
        if (ec) {
            throw std::filesystem::filesystem_error("Failed to replace existing file", target, ec);
        }
    }

    {
        std::ofstream output(target, std::ios::binary | std::ios::trunc);
        if (!output) {
            throw std::runtime_error("Failed to open file for writing: " + target.string());
        }

        std::size_t count = 0;
        while ((count = reader.read(copyBuffer_.data(), copyBuffer_.size())) > 0U) {
            output.write(copyBuffer_.data(), static_cast<std::streamsize>(count));
            if (!output) {
                throw std::runtime_error("Failed to write file contents: " + target.string());
            }
        }

        output.close();
        if (!output) {
            throw std::runtime_error("Failed to close file: " + target.string());
        }
    }

    std::filesystem::permissions(target,
                                 static_cast<std::filesystem::perms>(header.mode) & std::filesystem::perms::mask,
                                 std::filesystem::perm_options::replace,
                                 ec);
    if (ec) {
        throw std::filesystem::filesystem_error("permissions", target, ec);
    }

    return header.size;
}

} // namespace bigcomp::archive
