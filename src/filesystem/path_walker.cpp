#include "filesystem/path_walker.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace bigcomp::filesystem {

namespace {

std::filesystem::path makeAbsolute(const std::filesystem::path& path)
{
    std::error_code ec;
    auto absolute = std::filesystem::weakly_canonical(path, ec);
    if (!ec) {
        return absolute;
    }

    absolute = std::filesystem::absolute(path, ec);
    if (!ec) {
        return absolute;
    }

    return path;
}

std::vector<std::filesystem::path> sortedChildren(const std::filesystem::path& directory)
{
    std::error_code ec;
    std::filesystem::directory_iterator iterator(directory, std::filesystem::directory_options::none, ec);
    if (ec) {
        throw std::filesystem::filesystem_error("directory_iterator", directory, ec);
    }

    std::vector<std::filesystem::path> children;
    const std::filesystem::directory_iterator end;
    while (iterator != end) {
        children.push_back(iterator->path());
        iterator.increment(ec);
        if (ec) {
            throw std::filesystem::filesystem_error("directory_iterator", directory, ec);
        }
    }

    std::sort(children.begin(), children.end(), [](const auto& left, const auto& right) {
        return left.filename().native() < right.filename().native();
    });
    return children;
}

} // namespace

bool describeEntry(const std::filesystem::path& path, const std::filesystem::path& root, Entry& entry)
{
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(path, ec);
    if (ec) {
        throw std::filesystem::filesystem_error("symlink_status", path, ec);
    }

    if (std::filesystem::is_directory(status)) {
        entry.type = EntryType::Directory;
        entry.size = 0;
    } else if (std::filesystem::is_regular_file(status)) {
        entry.type = EntryType::File;
        entry.size = std::filesystem::file_size(path, ec);
        if (ec) {
            throw std::filesystem::filesystem_error("file_size", path, ec);
        }
    } else {
        return false;
    }

    entry.absolutePath = path;
    entry.relativePath = path.lexically_relative(root);
    entry.permissions = status.permissions() & std::filesystem::perms::mask;
    return true;
}

PathWalker::PathWalker(std::filesystem::path rootPath)
    : rootPath_(makeAbsolute(std::move(rootPath)))
{
    std::error_code ec;
    if (!std::filesystem::is_directory(rootPath_, ec)) {
        throw std::invalid_argument("PathWalker requires an existing directory: " + rootPath_.string());
    }
}

const std::filesystem::path& PathWalker::root() const noexcept
{
    return rootPath_;
}

void PathWalker::forEach(const Visitor& visitor)
{
    skipped_ = 0;
    walkDirectory(rootPath_, visitor);
}

std::vector<Entry> PathWalker::listEntries()
{
    std::vector<Entry> entries;
    forEach([&entries](const Entry& entry) { entries.push_back(entry); });
    return entries;
}

std::size_t PathWalker::skippedCount() const noexcept
{
    return skipped_;
}

void PathWalker::walkDirectory(const std::filesystem::path& directory, const Visitor& visitor)
{
    for (const auto& child : sortedChildren(directory)) {
        Entry entry {};
        if (!describeEntry(child, rootPath_, entry)) {
            ++skipped_;
            continue;
        }

        visitor(entry);

        if (entry.isDirectory()) {
            walkDirectory(child, visitor);
        }
    }
}

} // namespace bigcomp::filesystem
