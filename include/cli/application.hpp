#pragma once

#include <cstdint>
#include <string>

namespace bigcomp::cli {

int run(int argc, char** argv);

// Parses "4096", "64K", "16M" or "2G" (binary multiples) into bytes.
std::uint64_t parseByteSize(const std::string& text);

} // namespace bigcomp::cli
