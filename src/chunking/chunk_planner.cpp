#include "chunking/chunk_planner.hpp"

#include <stdexcept>
#include <utility>

namespace bigcomp::chunking {

namespace {

class Planner {
public:
    explicit Planner(std::uintmax_t threshold)
        : threshold_(threshold)
    {
        if (threshold_ == 0U) {
            throw std::invalid_argument("Chunk size threshold must be greater than zero");
        }
        chunks_.emplace_back();
    }

    void add(const filesystem::Entry& entry)
    {
        if (entry.isDirectory()) {
            pendingDirectories_.push_back(entry);
            return;
        }

        auto* current = &chunks_.back();
        const bool fits = current->totalSize + entry.size <= threshold_;
        if (!fits && !current->entries.empty()) {
            Chunk next {};
            next.index = chunks_.size();
            chunks_.push_back(std::move(next));
            current = &chunks_.back();
        }

        flushDirectories(*current);
        current->entries.push_back(entry);
        current->totalSize += entry.size;
    }

    std::vector<Chunk> finish()
    {
        flushDirectories(chunks_.back());
        return std::move(chunks_);
    }

private:
    void flushDirectories(Chunk& chunk)
    {
        for (auto& directory : pendingDirectories_) {
            chunk.entries.push_back(std::move(directory));
        }
        pendingDirectories_.clear();
    }

    std::uintmax_t threshold_;
    std::vector<Chunk> chunks_;
    std::vector<filesystem::Entry> pendingDirectories_;
};

} // namespace

std::vector<Chunk> planChunks(const std::vector<filesystem::Entry>& entries, std::uintmax_t threshold)
{
    Planner planner(threshold);
    for (const auto& entry : entries) {
        planner.add(entry);
    }
    return planner.finish();
}

std::vector<Chunk> planChunks(filesystem::PathWalker& walker, std::uintmax_t threshold)
{
    Planner planner(threshold);
    walker.forEach([&planner](const filesystem::Entry& entry) { planner.add(entry); });
    return planner.finish();
}

} // namespace bigcomp::chunking
