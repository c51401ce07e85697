#include "cli/application.hpp"

#include "core/big_compressor.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <filesystem>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

namespace {

enum class Command {
    Compress,
    Decompress,
    Help
};

struct Options {
    Command command {Command::Help};
    std::filesystem::path input;
    std::filesystem::path output;
    std::uint64_t maxChunkSize {0};
    std::uint64_t maxBufferSize {bigcomp::core::kDefaultMaxDecompressBufferSize};
    bool combine {false};
    bool validate {true};
    bool verbose {false};
};

void printUsage()
{
    std::cout << "Usage:\n"
              << "  bigcomp help\n"
              << "  bigcomp compress --input <dir> --output <path> --max-chunk-size <size> [--combine] [--verbose]\n"
              << "  bigcomp decompress --input <path> --output <dir> [--max-buffer-size <size>] [--no-validate] [--verbose]\n\n"
              << "Notes:\n"
              << "  - Sizes are bytes, optionally suffixed with K, M or G (powers of 1024).\n"
              << "  - Without --combine every chunk goes to <path>_<index>; with it all chunks\n"
              << "    go to <path>, each followed by the chunk separator.\n"
              << "  - decompress accepts a combined file or the <path> prefix of per-chunk files.\n"
              << "  - --max-buffer-size bounds the largest compressed chunk decompress will hold\n"
              << "    in memory (default 256M).\n"
              << "  - --no-validate splits on every separator occurrence, even inside chunk data.\n";
}

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

Command parseCommand(const std::string& argument)
{
    const auto lowered = toLower(argument);
    if (lowered == "compress") {
        return Command::Compress;
    }
    if (lowered == "decompress") {
        return Command::Decompress;
    }
    if (lowered == "help" || lowered == "--help" || lowered == "-h") {
        return Command::Help;
    }
    throw std::invalid_argument("Unknown command: " + argument);
}

Options parseOptions(int argc, char** argv)
{
    Options options {};

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    options.command = parseCommand(argv[1]);
    if (options.command == Command::Help) {
        return options;
    }

    bool haveChunkSize = false;
    for (int index = 2; index < argc; ++index) {
        const std::string argument = argv[index];

        if ((argument == "--input" || argument == "-i") && index + 1 < argc) {
            options.input = std::filesystem::path(argv[++index]);
        } else if ((argument == "--output" || argument == "-o") && index + 1 < argc) {
            options.output = std::filesystem::path(argv[++index]);
        } else if ((argument == "--max-chunk-size" || argument == "-s") && index + 1 < argc) {
            options.maxChunkSize = bigcomp::cli::parseByteSize(argv[++index]);
            haveChunkSize = true;
        } else if ((argument == "--max-buffer-size" || argument == "-b") && index + 1 < argc) {
            options.maxBufferSize = bigcomp::cli::parseByteSize(argv[++index]);
        } else if (argument == "--combine" || argument == "-c") {
            options.combine = true;
        } else if (argument == "--no-validate") {
            options.validate = false;
        } else if (argument == "--verbose" || argument == "-v") {
            options.verbose = true;
        } else if (argument == "--help" || argument == "-h") {
            options.command = Command::Help;
            return options;
        } else {
            throw std::invalid_argument("Unrecognized argument: " + argument);
        }
    }

    if (options.input.empty()) {
        throw std::invalid_argument("Missing required --input argument");
    }
    if (options.output.empty()) {
        throw std::invalid_argument("Missing required --output argument");
    }
    if (options.command == Command::Compress && !haveChunkSize) {
        throw std::invalid_argument("Missing required --max-chunk-size argument");
    }
    if (options.maxBufferSize > std::numeric_limits<std::size_t>::max()) {
        throw std::invalid_argument("--max-buffer-size is too large for this platform");
    }
    return options;
}

bigcomp::core::Config makeConfig(const Options& options)
{
    bigcomp::core::Config config {};
    config.maxPrecompressChunkSize = options.maxChunkSize;
    config.maxDecompressBufferSize = static_cast<std::size_t>(options.maxBufferSize);
    config.combineChunks = options.combine;
    config.validateBoundaries = options.validate;
    return config;
}

void attachProgress(bigcomp::core::BigCompressor& compressor, const char* verb)
{
    compressor.setChunkObserver([verb](const bigcomp::core::ChunkEvent& event) {
        std::cout << verb << " chunk " << event.index << ": " << event.entryCount << " entries, "
                  << event.sourceBytes << " bytes, ";
        if (event.archiveBytes > 0U) {
            std::cout << event.archiveBytes << " bytes archived, ";
        }
        std::cout << event.compressedBytes << " bytes compressed\n";
    });
}

void compress(const Options& options)
{
    if (!std::filesystem::is_directory(options.input)) {
        throw std::runtime_error("Input directory does not exist: " + options.input.string());
    }

    bigcomp::core::BigCompressor compressor(makeConfig(options));
    if (options.verbose) {
        attachProgress(compressor, "Wrote");
    }

    const auto report = compressor.compress(options.input, options.output);
    std::cout << "Compressed " << report.entryCount << " entries (" << report.sourceBytes << " bytes) into "
              << report.chunkCount << " chunk(s), " << report.bytesWritten << " bytes written\n";
    if (report.skippedEntries > 0U) {
        std::cout << "Skipped " << report.skippedEntries << " symlink(s) or special file(s)\n";
    }
}

void decompress(const Options& options)
{
    bigcomp::core::BigCompressor compressor(makeConfig(options));
    if (options.verbose) {
        attachProgress(compressor, "Restored");
    }

    const auto report = compressor.decompress(options.input, options.output);
    std::cout << "Restored " << report.filesRestored << " file(s) (" << report.bytesRestored << " bytes) from "
              << report.tokensDecoded << " chunk(s)\n";
    if (report.tokensDiscarded > 0U) {
        std::cout << "Ignored " << report.tokensDiscarded << " fragment(s) too short to be a chunk\n";
    }
}

} // namespace

namespace bigcomp::cli {

std::uint64_t parseByteSize(const std::string& text)
{
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) {
        throw std::invalid_argument("Invalid size: " + text);
    }

    std::size_t consumed = 0;
    std::uint64_t value = 0;
    try {
        value = std::stoull(text, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid size: " + text);
    }

    const auto suffix = toLower(text.substr(consumed));
    unsigned shift = 0;
    if (suffix.empty() || suffix == "b") {
        shift = 0;
    } else if (suffix == "k" || suffix == "kb") {
        shift = 10;
    } else if (suffix == "m" || suffix == "mb") {
        shift = 20;
    } else if (suffix == "g" || suffix == "gb") {
        shift = 30;
    } else {
        throw std::invalid_argument("Invalid size suffix: " + text);
    }

    if (value > (std::numeric_limits<std::uint64_t>::max() >> shift)) {
        throw std::invalid_argument("Size out of range: " + text);
    }
    return value << shift;
}

int run(int argc, char** argv)
{
    try {
        const auto options = parseOptions(argc, argv);

        if (options.command == Command::Help) {
            printUsage();
            return 0;
        }

        if (options.command == Command::Compress) {
            compress(options);
            std::cout << "Compression completed successfully\n";
            return 0;
        }

        if (options.command == Command::Decompress) {
            decompress(options);
            std::cout << "Decompression completed successfully\n";
            return 0;
        }

        printUsage();
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}

} // namespace bigcomp::cli
