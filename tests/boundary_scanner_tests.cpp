#include "chunking/boundary_scanner.hpp"
#include "core/errors.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using bigcomp::chunking::BoundaryScanner;

constexpr const char* kMarker = "_cHuNK_";

std::vector<std::string> scanAll(BoundaryScanner& scanner)
{
    std::vector<std::string> tokens;
    std::vector<std::uint8_t> token;
    while (scanner.next(token)) {
        tokens.emplace_back(token.begin(), token.end());
    }
    return tokens;
}

} // namespace

TEST(BoundaryScannerTest, SplitsOnEveryMarker)
{
    std::istringstream input("first_cHuNK_second_cHuNK_third_cHuNK_");
    BoundaryScanner scanner(input, kMarker, 1024, 1);

    EXPECT_EQ(scanAll(scanner), (std::vector<std::string>{"first", "second", "third"}));
    EXPECT_EQ(scanner.discardedCount(), 0U);
}

TEST(BoundaryScannerTest, EmitsUnterminatedFinalToken)
{
    std::istringstream input("alpha_cHuNK_omega");
    BoundaryScanner scanner(input, kMarker, 1024, 1);

    EXPECT_EQ(scanAll(scanner), (std::vector<std::string>{"alpha", "omega"}));
}

TEST(BoundaryScannerTest, DiscardsTokensBelowMinimumLength)
{
    std::istringstream input("_cHuNK_long enough_cHuNK_ab_cHuNK_\n");
    BoundaryScanner scanner(input, kMarker, 1024, 5);

    EXPECT_EQ(scanAll(scanner), (std::vector<std::string>{"long enough"}));
    EXPECT_EQ(scanner.discardedCount(), 3U);
}

TEST(BoundaryScannerTest, EmptyInputYieldsNothing)
{
    std::istringstream input("");
    BoundaryScanner scanner(input, kMarker, 1024, 1);

    EXPECT_TRUE(scanAll(scanner).empty());
}

TEST(BoundaryScannerTest, FindsMarkersAcrossReadBoundaries)
{
    // Put a marker across the 64 KiB read size so it arrives in two reads.
    const std::string first(64 * 1024 - 3, 'a');
    const std::string second(100000, 'b');
    std::istringstream input(first + kMarker + second + kMarker);
    BoundaryScanner scanner(input, kMarker, 512 * 1024, 1);

    const auto tokens = scanAll(scanner);
    ASSERT_EQ(tokens.size(), 2U);
    EXPECT_EQ(tokens[0], first);
    EXPECT_EQ(tokens[1], second);
}

TEST(BoundaryScannerTest, ThrowsWhenTokenExceedsBuffer)
{
    std::istringstream input(std::string(5000, 'x') + kMarker);
    BoundaryScanner scanner(input, kMarker, 4096, 1);

    std::vector<std::uint8_t> token;
    try {
        scanner.next(token);
        FAIL() << "expected ScanBufferOverflowError";
    } catch (const bigcomp::core::ScanBufferOverflowError& ex) {
        EXPECT_EQ(ex.limit(), 4096U);
    }
}

TEST(BoundaryScannerTest, TokensUpToTheBufferSizeFit)
{
    const std::string token(4000, 'y');
    std::istringstream input(token + kMarker + "z");
    BoundaryScanner scanner(input, kMarker, 4096, 1);

    EXPECT_EQ(scanAll(scanner), (std::vector<std::string>{token, "z"}));
}

TEST(BoundaryScannerTest, UnterminatedTokenFillingTheBufferExactlyFits)
{
    const std::string token(4096, 'y');
    std::istringstream input(token);
    BoundaryScanner scanner(input, kMarker, 4096, 1);

    EXPECT_EQ(scanAll(scanner), (std::vector<std::string>{token}));
}

TEST(BoundaryScannerTest, UnterminatedTokenOneByteOverTheBufferOverflows)
{
    std::istringstream input(std::string(4097, 'y'));
    BoundaryScanner scanner(input, kMarker, 4096, 1);

    std::vector<std::uint8_t> token;
    EXPECT_THROW(scanner.next(token), bigcomp::core::ScanBufferOverflowError);
}

TEST(BoundaryScannerTest, ValidatorSkipsMarkersInsideData)
{
    // Tokens are valid only when they start with '[' and end with ']'.
    const auto validator = [](const std::uint8_t* data, std::size_t size) {
        return size >= 2 && data[0] == '[' && data[size - 1] == ']';
    };
    std::istringstream input("[one_cHuNK_still one]_cHuNK_[two]_cHuNK_");
    BoundaryScanner scanner(input, kMarker, 1024, 1, validator);

    EXPECT_EQ(scanAll(scanner), (std::vector<std::string>{"[one_cHuNK_still one]", "[two]"}));
}

TEST(BoundaryScannerTest, WithoutValidatorMarkersInsideDataSplit)
{
    std::istringstream input("[one_cHuNK_still one]_cHuNK_[two]_cHuNK_");
    BoundaryScanner scanner(input, kMarker, 1024, 1);

    EXPECT_EQ(scanAll(scanner), (std::vector<std::string>{"[one", "still one]", "[two]"}));
}

TEST(BoundaryScannerTest, RejectsBufferNotLargerThanMarker)
{
    std::istringstream input("data");
    EXPECT_THROW(BoundaryScanner(input, kMarker, 7, 1), std::invalid_argument);
    EXPECT_THROW(BoundaryScanner(input, "", 1024, 1), std::invalid_argument);
}
