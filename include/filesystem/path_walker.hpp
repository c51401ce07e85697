#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <vector>

namespace bigcomp::filesystem {

enum class EntryType {
    File,
    Directory
};

struct Entry {
    std::filesystem::path absolutePath;
    std::filesystem::path relativePath;
    std::filesystem::perms permissions {std::filesystem::perms::none};
    EntryType type {EntryType::File};
    std::uintmax_t size {0};

    bool isDirectory() const noexcept { return type == EntryType::Directory; }
};

// Builds the entry for a path under root. Returns false for anything that is
// neither a regular file nor a directory (symlinks are never followed).
bool describeEntry(const std::filesystem::path& path, const std::filesystem::path& root, Entry& entry);

// Pre-order walk of a directory tree. Siblings are visited sorted by name so
// that two walks of the same tree always agree. The root is not reported.
class PathWalker {
public:
    using Visitor = std::function<void(const Entry&)>;

    explicit PathWalker(std::filesystem::path rootPath);

    const std::filesystem::path& root() const noexcept;

    void forEach(const Visitor& visitor);
    std::vector<Entry> listEntries();

    std::size_t skippedCount() const noexcept;

private:
    void walkDirectory(const std::filesystem::path& directory, const Visitor& visitor);

    std::filesystem::path rootPath_;
    std::size_t skipped_ {0};
};

} // namespace bigcomp::filesystem
