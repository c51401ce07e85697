#include "archive/tar_reader.hpp"

#include <algorithm>
#include <istream>
#include <stdexcept>
#include <string>

namespace bigcomp::archive {

namespace {

constexpr std::uint64_t kMaxLongNameSize = 64 * 1024;

} // namespace

TarReader::TarReader(std::istream& input)
    : input_(input)
{
}

std::optional<TarHeader> TarReader::next()
{
    if (ended_) {
        return std::nullopt;
    }

    skip(remaining_ + padding_);
    remaining_ = 0;
    padding_ = 0;

    std::string longName;
    for (;;) {
        if (!readRecord(record_) || isZeroRecord(record_)) {
            ended_ = true;
            return std::nullopt;
        }

        auto header = decodeHeader(record_);
        if (header.typeFlag == static_cast<char>(TypeFlag::GnuLongName)) {
            if (header.size == 0U || header.size > kMaxLongNameSize) {
                throw std::runtime_error("Invalid GNU long name record");
            }
            longName.assign(static_cast<std::size_t>(header.size), '\0');
            readExact(longName.data(), longName.size());
            skip(paddingFor(header.size));
            longName.erase(std::find(longName.begin(), longName.end(), '\0'), longName.end());
            continue;
        }

        if (!longName.empty()) {
            header.name = std::move(longName);
        }
        if (header.isRegular()) {
            remaining_ = header.size;
            padding_ = paddingFor(header.size);
        } else {
            // Only regular files carry data in the archives this reader accepts.
            skip(header.size + paddingFor(header.size));
        }
        return header;
    }
}

std::size_t TarReader::read(char* data, std::size_t size)
{
    const auto count = static_cast<std::size_t>(std::min<std::uint64_t>(size, remaining_));
    if (count == 0U) {
        return 0;
    }

    readExact(data, count);
    remaining_ -= count;
    return count;
}

std::uint64_t TarReader::remaining() const noexcept
{
    return remaining_;
}

bool TarReader::readRecord(Record& record)
{
    input_.read(record.data(), static_cast<std::streamsize>(record.size()));
    const auto got = input_.gcount();
    if (got == 0 && input_.eof()) {
        return false;
    }
    if (got != static_cast<std::streamsize>(record.size())) {
        throw std::runtime_error("Tar archive truncated inside a header");
    }
    return true;
}

void TarReader::readExact(char* data, std::size_t size)
{
    input_.read(data, static_cast<std::streamsize>(size));
    if (input_.gcount() != static_cast<std::streamsize>(size)) {
        throw std::runtime_error("Tar archive truncated inside an entry");
    }
}

void TarReader::skip(std::uint64_t count)
{
    while (count > 0U) {
        const auto chunk = static_cast<std::size_t>(std::min<std::uint64_t>(count, record_.size()));
        readExact(record_.data(), chunk);
        count -= chunk;
    }
}

} // namespace bigcomp::archive
