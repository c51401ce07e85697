#pragma once

#include <cstdint>
#include <filesystem>
#include <system_error>
#include <vector>

namespace bigcomp::utils {

// Creates directory and any missing parents. Fails with not_a_directory when
// something other than a directory already occupies the path.
std::error_code createDirectoryTree(const std::filesystem::path& directory);

void ensureParentDirectory(const std::filesystem::path& path);

// Replaces the file at path with data.
void writeBufferToFile(const std::filesystem::path& path, const std::vector<std::uint8_t>& data);

} // namespace bigcomp::utils
