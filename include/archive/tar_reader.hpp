#pragma once

#include "archive/tar_format.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>

namespace bigcomp::archive {

class TarReader {
public:
    explicit TarReader(std::istream& input);

    TarReader(const TarReader&) = delete;
    TarReader& operator=(const TarReader&) = delete;

    // Advances to the next entry, skipping whatever is left of the current
    // one. Returns nullopt at the trailer or at a clean end of input.
    std::optional<TarHeader> next();

    // Reads up to size bytes of the current entry; 0 once it is exhausted.
    std::size_t read(char* data, std::size_t size);

    std::uint64_t remaining() const noexcept;

private:
    bool readRecord(Record& record);
    void readExact(char* data, std::size_t size);
    void skip(std::uint64_t count);

    std::istream& input_;
    Record record_ {};
    std::uint64_t remaining_ {0};
    std::uint64_t padding_ {0};
    bool ended_ {false};
};

} // namespace bigcomp::archive
