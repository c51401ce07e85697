#include "utils/file_io.hpp"

#include <fstream>
#include <stdexcept>

namespace bigcomp::utils {

std::error_code createDirectoryTree(const std::filesystem::path& directory)
{
    std::error_code ec;
    if (std::filesystem::is_directory(directory, ec)) {
        return {};
    }

    std::filesystem::create_directories(directory, ec);
    if (!ec && !std::filesystem::is_directory(directory, ec)) {
        ec = std::make_error_code(std::errc::not_a_directory);
    }
    return ec;
}

void ensureParentDirectory(const std::filesystem::path& path)
{
    const auto parent = path.parent_path();
    if (parent.empty()) {
        return;
    }

    const auto ec = createDirectoryTree(parent);
    if (ec) {
        throw std::filesystem::filesystem_error("create_directories", parent, ec);
    }
}

void writeBufferToFile(const std::filesystem::path& path, const std::vector<std::uint8_t>& data)
{
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw std::runtime_error("Failed to open file for writing: " + path.string());
    }

    output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    output.close();
    if (!output) {
        throw std::runtime_error("Failed to write file: " + path.string());
    }
}

} // namespace bigcomp::utils
