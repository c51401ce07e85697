#include "chunking/chunk_planner.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using bigcomp::filesystem::Entry;
using bigcomp::filesystem::EntryType;

Entry file(const std::string& name, std::uintmax_t size)
{
    Entry entry {};
    entry.absolutePath = "/src/" + name;
    entry.relativePath = name;
    entry.type = EntryType::File;
    entry.size = size;
    return entry;
}

Entry directory(const std::string& name)
{
    Entry entry {};
    entry.absolutePath = "/src/" + name;
    entry.relativePath = name;
    entry.type = EntryType::Directory;
    return entry;
}

std::vector<std::string> names(const bigcomp::chunking::Chunk& chunk)
{
    std::vector<std::string> result;
    for (const auto& entry : chunk.entries) {
        result.push_back(entry.relativePath.generic_string());
    }
    return result;
}

} // namespace

TEST(ChunkPlannerTest, DirectoryTravelsWithTheFileThatFollowsIt)
{
    const std::vector<Entry> entries {
        file("a.txt", 5000),
        directory("b"),
        file("b/b1.txt", 5000),
        file("b/b2.txt", 5000),
    };

    const auto chunks = bigcomp::chunking::planChunks(entries, 8000);
    ASSERT_EQ(chunks.size(), 3U);

    EXPECT_EQ(chunks[0].index, 0U);
    EXPECT_EQ(names(chunks[0]), (std::vector<std::string>{"a.txt"}));
    EXPECT_EQ(chunks[0].totalSize, 5000U);

    EXPECT_EQ(chunks[1].index, 1U);
    EXPECT_EQ(names(chunks[1]), (std::vector<std::string>{"b", "b/b1.txt"}));
    EXPECT_EQ(chunks[1].totalSize, 5000U);

    EXPECT_EQ(chunks[2].index, 2U);
    EXPECT_EQ(names(chunks[2]), (std::vector<std::string>{"b/b2.txt"}));
    EXPECT_EQ(chunks[2].totalSize, 5000U);
}

TEST(ChunkPlannerTest, FillsUpToTheThresholdInclusive)
{
    const std::vector<Entry> entries {file("one", 3000), file("two", 5000), file("three", 1)};

    const auto chunks = bigcomp::chunking::planChunks(entries, 8000);
    ASSERT_EQ(chunks.size(), 2U);
    EXPECT_EQ(names(chunks[0]), (std::vector<std::string>{"one", "two"}));
    EXPECT_EQ(chunks[0].totalSize, 8000U);
    EXPECT_EQ(names(chunks[1]), (std::vector<std::string>{"three"}));
}

TEST(ChunkPlannerTest, OversizedFileGetsItsOwnChunk)
{
    const std::vector<Entry> entries {file("small", 10), file("huge", 50000), file("tail", 10)};

    const auto chunks = bigcomp::chunking::planChunks(entries, 100);
    ASSERT_EQ(chunks.size(), 3U);
    EXPECT_EQ(names(chunks[1]), (std::vector<std::string>{"huge"}));
    EXPECT_EQ(chunks[1].totalSize, 50000U);
    EXPECT_EQ(names(chunks[2]), (std::vector<std::string>{"tail"}));
}

TEST(ChunkPlannerTest, OversizedFirstFileStaysInChunkZero)
{
    const auto chunks = bigcomp::chunking::planChunks({file("huge", 500)}, 100);
    ASSERT_EQ(chunks.size(), 1U);
    EXPECT_EQ(names(chunks[0]), (std::vector<std::string>{"huge"}));
}

TEST(ChunkPlannerTest, EmptyInputYieldsOneEmptyChunk)
{
    const auto chunks = bigcomp::chunking::planChunks(std::vector<Entry> {}, 100);
    ASSERT_EQ(chunks.size(), 1U);
    EXPECT_EQ(chunks[0].index, 0U);
    EXPECT_TRUE(chunks[0].entries.empty());
    EXPECT_EQ(chunks[0].totalSize, 0U);
}

TEST(ChunkPlannerTest, TrailingDirectoriesJoinTheLastChunk)
{
    const std::vector<Entry> entries {file("a", 90), file("b", 90), directory("empty"), directory("empty/nested")};

    const auto chunks = bigcomp::chunking::planChunks(entries, 100);
    ASSERT_EQ(chunks.size(), 2U);
    EXPECT_EQ(names(chunks[1]), (std::vector<std::string>{"b", "empty", "empty/nested"}));
}

TEST(ChunkPlannerTest, ChunkCountNeverGrowsWithTheThreshold)
{
    std::vector<Entry> entries;
    entries.push_back(directory("d"));
    for (int index = 0; index < 40; ++index) {
        entries.push_back(file("d/f" + std::to_string(index), static_cast<std::uintmax_t>((index * 37) % 500 + 1)));
    }

    std::size_t previous = std::numeric_limits<std::size_t>::max();
    for (std::uintmax_t threshold = 1; threshold <= 20000; threshold = threshold * 2 + 1) {
        const auto count = bigcomp::chunking::planChunks(entries, threshold).size();
        EXPECT_LE(count, previous) << "threshold " << threshold;
        previous = count;
    }
    EXPECT_EQ(previous, 1U);
}

TEST(ChunkPlannerTest, KeepsEveryEntryInWalkOrder)
{
    const std::vector<Entry> entries {
        directory("x"), file("x/1", 70), file("x/2", 70), directory("y"), file("y/3", 10), file("y/4", 95),
    };

    const auto chunks = bigcomp::chunking::planChunks(entries, 100);

    std::vector<std::string> flattened;
    for (const auto& chunk : chunks) {
        const auto chunkNames = names(chunk);
        flattened.insert(flattened.end(), chunkNames.begin(), chunkNames.end());
    }
    EXPECT_EQ(flattened, (std::vector<std::string>{"x", "x/1", "x/2", "y", "y/3", "y/4"}));
}

TEST(ChunkPlannerTest, RejectsZeroThreshold)
{
    EXPECT_THROW(bigcomp::chunking::planChunks({file("a", 1)}, 0), std::invalid_argument);
}
