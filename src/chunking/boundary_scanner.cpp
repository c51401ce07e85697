#include "chunking/boundary_scanner.hpp"

#include "core/errors.hpp"

#include <algorithm>
#include <istream>
#include <stdexcept>
#include <utility>

namespace bigcomp::chunking {
namespace {

constexpr std::size_t kReadSize = 64 * 1024;

} // namespace

BoundaryScanner::BoundaryScanner(std::istream& input,
                                 std::string_view marker,
                                 std::size_t maxBufferSize,
                                 std::size_t minTokenLength,
                                 Validator validator)
    : input_(input)
    , marker_(marker)
    , maxBufferSize_(maxBufferSize)
    , minTokenLength_(minTokenLength)
    , validator_(std::move(validator))
{
    if (marker_.empty()) {
        throw std::invalid_argument("Chunk separator must not be empty");
    }
    if (maxBufferSize_ <= marker_.size()) {
        throw std::invalid_argument("Maximum scan buffer size must exceed the separator length");
    }
}

bool BoundaryScanner::next(std::vector<std::uint8_t>& token)
{
    for (;;) {
        const auto begin = window_.begin() + static_cast<std::ptrdiff_t>(start_);
        const auto found = std::search(begin + static_cast<std::ptrdiff_t>(searchFrom_),
                                       window_.end(),
                                       marker_.begin(),
                                       marker_.end(),
                                       [](std::uint8_t left, char right) {
                                           return left == static_cast<std::uint8_t>(right);
                                       });

        if (found != window_.end()) {
            const auto length = static_cast<std::size_t>(found - begin);
            if (length >= minTokenLength_ && validator_ && !validator_(window_.data() + start_, length)) {
                // Marker bytes inside chunk data, not a boundary.
                searchFrom_ = length + 1;
                continue;
            }
            if (emit(length, length + marker_.size(), token)) {
                return true;
            }
            continue;
        }

        const auto pending = window_.size() - start_;
        if (pending >= marker_.size()) {
            searchFrom_ = std::max(searchFrom_, pending - marker_.size() + 1);
        }

        if (exhausted_) {
            if (pending == 0U) {
                return false;
            }
            if (emit(pending, pending, token)) {
                return true;
            }
            continue;
        }

        fill();
    }
}

std::size_t BoundaryScanner::discardedCount() const noexcept
{
    return discarded_;
}

bool BoundaryScanner::emit(std::size_t length, std::size_t advance, std::vector<std::uint8_t>& token)
{
    const auto begin = window_.begin() + static_cast<std::ptrdiff_t>(start_);
    const bool keep = length >= minTokenLength_;
    if (keep) {
        token.assign(begin, begin + static_cast<std::ptrdiff_t>(length));
    } else {
        ++discarded_;
    }

    start_ += advance;
    searchFrom_ = 0;
    return keep;
}

void BoundaryScanner::fill()
{
    if (start_ > 0U) {
        window_.erase(window_.begin(), window_.begin() + static_cast<std::ptrdiff_t>(start_));
        start_ = 0;
    }

    if (window_.size() >= maxBufferSize_) {
        // A full window is only an overflow if more input follows it.
        if (input_.peek() == std::istream::traits_type::eof()) {
            if (input_.bad()) {
                throw std::runtime_error("Failed to read compressed input");
            }
            exhausted_ = true;
            return;
        }
        throw core::ScanBufferOverflowError(maxBufferSize_);
    }

    const auto offset = window_.size();
    const auto wanted = std::min(kReadSize, maxBufferSize_ - offset);
    window_.resize(offset + wanted);

    input_.read(reinterpret_cast<char*>(window_.data() + offset), static_cast<std::streamsize>(wanted));
    const auto got = static_cast<std::size_t>(input_.gcount());
    window_.resize(offset + got);

    if (got < wanted) {
        if (!input_.eof()) {
            throw std::runtime_error("Failed to read compressed input");
        }
        exhausted_ = true;
    }
}

} // namespace bigcomp::chunking
