#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace bigcomp::chunking {

// Splits an input into tokens separated by a marker, buffering at most
// maxBufferSize bytes while looking for the next marker.
//
// Without a validator every marker occurrence ends a token, so marker bytes
// that happen to appear inside a chunk cause a false split. With a validator
// an occurrence only ends a token when the validator accepts the bytes before
// it; otherwise the search continues past it.
class BoundaryScanner {
public:
    using Validator = std::function<bool(const std::uint8_t* data, std::size_t size)>;

    BoundaryScanner(std::istream& input,
                    std::string_view marker,
                    std::size_t maxBufferSize,
                    std::size_t minTokenLength,
                    Validator validator = {});

    // Fills token with the next candidate chunk. Returns false once the input
    // is exhausted. Throws core::ScanBufferOverflowError when no boundary is
    // found within maxBufferSize bytes.
    bool next(std::vector<std::uint8_t>& token);

    // Tokens dropped for being shorter than minTokenLength.
    std::size_t discardedCount() const noexcept;

private:
    bool emit(std::size_t length, std::size_t advance, std::vector<std::uint8_t>& token);
    void fill();

    std::istream& input_;
    std::string marker_;
    std::size_t maxBufferSize_;
    std::size_t minTokenLength_;
    Validator validator_;

    std::vector<std::uint8_t> window_;
    std::size_t start_ {0};
    std::size_t searchFrom_ {0};
    std::size_t discarded_ {0};
    bool exhausted_ {false};
};

} // namespace bigcomp::chunking
