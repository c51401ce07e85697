#include "archive/tar_writer.hpp"

#include <algorithm>
#include <ostream>
#include <stdexcept>
#include <string>

namespace bigcomp::archive {
namespace {

// Splits name into a ustar prefix and name at a '/', if some split fits.
bool splitName(const std::string& fullName, std::string& prefix, std::string& name)
{
    auto slash = fullName.rfind('/', field::kPrefixSize);
    while (slash != std::string::npos && slash > 0) {
        const auto tail = fullName.size() - slash - 1;
        if (tail > field::kNameSize) {
            return false;
        }
        if (tail > 0) {
            prefix = fullName.substr(0, slash);
            name = fullName.substr(slash + 1);
            return true;
        }
        slash = fullName.rfind('/', slash - 1);
    }
    return false;
}

} // namespace

TarWriter::TarWriter(std::ostream& output)
    : output_(output)
{
}

void TarWriter::writeHeader(const TarHeader& header)
{
    if (closed_) {
        throw std::logic_error("Tar archive is already closed");
    }
    finishEntry();
    currentName_ = header.name;

    auto entry = header;
    std::string prefix;
    if (entry.name.size() > field::kNameSize) {
        std::string shortName;
        if (splitName(header.name, prefix, shortName)) {
            entry.name = std::move(shortName);
        } else {
            writeLongName(header.name);
            entry.name = header.name.substr(0, field::kNameSize);
        }
    }

    encodeHeader(entry, prefix, record_);
    writeRecord(record_);

    remaining_ = entry.size;
    padding_ = paddingFor(entry.size);
}

void TarWriter::write(const char* data, std::size_t size)
{
    if (size > remaining_) {
        throw std::logic_error("Write exceeds the size declared in the tar header");
    }

    output_.write(data, static_cast<std::streamsize>(size));
    if (!output_) {
        throw std::runtime_error("Failed to write tar entry data" + describeEntry());
    }
    remaining_ -= size;
}

void TarWriter::close()
{
    if (closed_) {
        return;
    }
    finishEntry();
    currentName_.clear();
    writeZeros(kBlockSize * kEndBlocks);
    closed_ = true;
}

void TarWriter::finishEntry()
{
    if (remaining_ != 0U) {
        throw std::runtime_error("Tar entry is missing " + std::to_string(remaining_) + " bytes of data"
                                 + describeEntry());
    }
    writeZeros(padding_);
    padding_ = 0;
}

void TarWriter::writeRecord(const Record& record)
{
    output_.write(record.data(), static_cast<std::streamsize>(record.size()));
    if (!output_) {
        throw std::runtime_error("Failed to write tar header" + describeEntry());
    }
}

void TarWriter::writeLongName(const std::string& name)
{
    TarHeader longName {};
    longName.name = kLongLinkName;
    longName.size = name.size() + 1;
    longName.typeFlag = static_cast<char>(TypeFlag::GnuLongName);

    encodeHeader(longName, std::string(), record_);
    writeRecord(record_);

    output_.write(name.c_str(), static_cast<std::streamsize>(name.size() + 1));
    if (!output_) {
        throw std::runtime_error("Failed to write tar long name" + describeEntry());
    }
    writeZeros(paddingFor(longName.size));
}

void TarWriter::writeZeros(std::uint64_t count)
{
    static const Record zeros {};
    while (count > 0U) {
        const auto chunk = std::min<std::uint64_t>(count, zeros.size());
        output_.write(zeros.data(), static_cast<std::streamsize>(chunk));
        if (!output_) {
            throw std::runtime_error(currentName_.empty() ? std::string("Failed to write tar end-of-archive records")
                                                          : "Failed to write tar padding" + describeEntry());
        }
        count -= chunk;
    }
}

std::string TarWriter::describeEntry() const
{
    return currentName_.empty() ? std::string() : " for " + currentName_;
}

} // namespace bigcomp::archive
