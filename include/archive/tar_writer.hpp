#pragma once

#include "archive/tar_format.hpp"

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace bigcomp::archive {

// Streaming ustar writer. Each entry is a header followed by exactly
// header.size bytes passed to write(); padding is added automatically.
class TarWriter {
public:
    explicit TarWriter(std::ostream& output);

    TarWriter(const TarWriter&) = delete;
    TarWriter& operator=(const TarWriter&) = delete;

    void writeHeader(const TarHeader& header);
    void write(const char* data, std::size_t size);

    // Finishes the open entry and writes the two trailer records.
    void close();

private:
    void finishEntry();
    void writeRecord(const Record& record);
    void writeLongName(const std::string& name);
    void writeZeros(std::uint64_t count);
    std::string describeEntry() const;

    std::ostream& output_;
    std::string currentName_;
    Record record_ {};
    std::uint64_t remaining_ {0};
    std::uint64_t padding_ {0};
    bool closed_ {false};
};

} // namespace bigcomp::archive
