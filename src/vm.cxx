/*
    Brisk - A direct brainfuck interpreter
    VM implementation
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "vm.hxx"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {
constexpr std::array<insType, 256> charToOpcode = [] {
    std::array<insType, 256> table{};
    table.fill(insType::END);
    table[static_cast<unsigned char>('>')] = insType::PTR_RGT;
    table[static_cast<unsigned char>('<')] = insType::PTR_LFT;
    table[static_cast<unsigned char>('+')] = insType::INC;
    table[static_cast<unsigned char>('-')] = insType::DEC;
    table[static_cast<unsigned char>('.')] = insType::PUT_CHR;
    table[static_cast<unsigned char>(',')] = insType::RAD_CHR;
    table[static_cast<unsigned char>('[')] = insType::JMP_ZER;
    table[static_cast<unsigned char>(']')] = insType::JMP_NOT_ZER;
    return table;
}();
}  // namespace

void brisk::run(std::string_view code, const JumpTable& table, std::vector<uint8_t>& cells,
                size_t& cellPtr, EofBehaviour eof, std::istream& in, std::ostream& out,
                ProfileInfo* profile) {
    std::chrono::steady_clock::time_point start;
    if (profile) {
        profile->instructions = 0;
        start = std::chrono::steady_clock::now();
    }
    if (cells.empty()) cells.assign(BRISK_TAPE_SIZE, 0);

    static void* jtable[] = {&&_PTR_RGT, &&_PTR_LFT, &&_INC,         &&_DEC, &&_PUT_CHR,
                             &&_RAD_CHR, &&_JMP_ZER, &&_JMP_NOT_ZER, &&_END};

    // One dispatch target per instruction, plus the terminating END at code.length().
    std::vector<void*> ops(code.length() + 1);
    for (size_t i = 0; i < code.length(); ++i) {
        ops[i] = jtable[static_cast<size_t>(charToOpcode[static_cast<unsigned char>(code[i])])];
    }
    ops.back() = jtable[static_cast<size_t>(insType::END)];

    const size_t* openToClose = table.openToClose.data();
    const size_t* closeToOpen = table.closeToOpen.data();
    const size_t tapeSize = cells.size();
    uint8_t* const tape = cells.data();
    size_t cell = cellPtr % tapeSize;
    size_t ip = 0;

    goto* ops[ip];

#define LOOP()                            \
    ++ip;                                 \
    if (profile) ++profile->instructions; \
    goto* ops[ip]
#define JUMP(target)                      \
    ip = (target);                        \
    if (profile) ++profile->instructions; \
    goto* ops[ip]

_PTR_RGT:
    if (++cell == tapeSize) cell = 0;
    LOOP();

_PTR_LFT:
    cell = (cell == 0 ? tapeSize : cell) - 1;
    LOOP();

_INC:
    tape[cell] = static_cast<uint8_t>(tape[cell] + 1u);
    LOOP();

_DEC:
    tape[cell] = static_cast<uint8_t>(tape[cell] - 1u);
    LOOP();

_PUT_CHR:
    out.put(static_cast<char>(tape[cell]));
    out.flush();
    LOOP();

_RAD_CHR: {
    const int ch = in.get();
    if (ch == std::char_traits<char>::eof()) {
        switch (eof) {
            case EofBehaviour::Unchanged:
                break;
            case EofBehaviour::Zero:
                tape[cell] = 0;
                break;
            case EofBehaviour::Max:
                tape[cell] = 255;
                break;
        }
    } else {
        tape[cell] = static_cast<uint8_t>(ch);
    }
    LOOP();
}

_JMP_ZER:
    if (!tape[cell]) [[unlikely]] {
        JUMP(openToClose[ip] + 1);
    }
    LOOP();

_JMP_NOT_ZER:
    if (tape[cell]) [[likely]] {
        JUMP(closeToOpen[ip] + 1);
    }
    LOOP();

#undef LOOP
#undef JUMP

_END:
    cellPtr = cell;
    if (profile)
        profile->seconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

brisk::Status brisk::execute(std::vector<uint8_t>& cells, size_t& cellPtr, std::string_view code,
                             EofBehaviour eof, std::istream& in, std::ostream& out,
                             ProfileInfo* profile) {
    const std::string program = sanitize(code, code.size());
    JumpTable table;
    const Status status = resolveBrackets(program, table);
    if (status != Status::Ok) return status;
    run(program, table, cells, cellPtr, eof, in, out, profile);
    return Status::Ok;
}
