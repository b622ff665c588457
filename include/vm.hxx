/*
    Brisk - A direct brainfuck interpreter
    VM API declarations
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "vm/config.hxx"

enum class insType : uint8_t {
    PTR_RGT,
    PTR_LFT,
    INC,
    DEC,
    PUT_CHR,
    RAD_CHR,
    JMP_ZER,
    JMP_NOT_ZER,
    END,
};

namespace brisk {

enum class Status : int { Ok = 0, UnmatchedClose = 1, UnmatchedOpen = 2 };

enum class EofBehaviour : int { Unchanged = 0, Zero = 1, Max = 2 };

struct Config {
    std::size_t programMax = BRISK_PROGRAM_MAX;
    std::size_t tapeSize = BRISK_TAPE_SIZE;
    EofBehaviour eof = static_cast<EofBehaviour>(BRISK_DEFAULT_EOF_BEHAVIOUR);
};

// Matching bracket positions, indexed by instruction position. Entries at
// positions that do not hold the corresponding bracket are unspecified.
struct JumpTable {
    std::vector<std::size_t> openToClose;
    std::vector<std::size_t> closeToOpen;
};

struct ProfileInfo {
    std::uint64_t instructions = 0;
    double seconds = 0.0;
};

const char* statusMessage(Status status);
}  // namespace brisk

#include "vm/sanitizer.hxx"
#include "vm/brackets.hxx"
#include "vm/executor.hxx"
