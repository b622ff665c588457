#pragma once

#include <xxhash.h>

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "vm.hxx"

inline std::uint64_t hashOutput(std::string_view s) { return XXH64(s.data(), s.size(), 0); }

// Runs raw program text against a string input and returns everything it wrote.
inline std::string runProgram(std::string_view code, std::vector<uint8_t>& cells, size_t& cellPtr,
                              const std::string& input = "",
                              brisk::EofBehaviour eof = brisk::EofBehaviour::Zero,
                              brisk::Status* statusOut = nullptr,
                              brisk::ProfileInfo* profile = nullptr) {
    std::istringstream in(input);
    std::ostringstream out;
    brisk::Status status = brisk::execute(cells, cellPtr, code, eof, in, out, profile);
    if (statusOut) *statusOut = status;
    return out.str();
}
