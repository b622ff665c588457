/*
    Brisk - A direct brainfuck interpreter
    Tape dump
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "ansi.hxx"

namespace brisk {
// Prints the tape up to the last non-zero cell or the data pointer, whichever is
// further, ten cells per row. The cell under the data pointer is highlighted
// when colour is on, bracketed otherwise.
inline void dumpMemory(const std::vector<uint8_t>& cells, size_t cellPtr, std::ostream& out,
                       bool colour = false) {
    if (cells.empty()) {
        out << "Memory dump:" << '\n' << "<empty>" << std::endl;
        return;
    }
    size_t lastNonEmpty = cells.size() - 1;
    while (lastNonEmpty > cellPtr && lastNonEmpty > 0 && !cells[lastNonEmpty]) {
        --lastNonEmpty;
    }
    out << "Memory dump:" << '\n';
    if (colour) out << ansi::underline;
    out << "row+col |0  |1  |2  |3  |4  |5  |6  |7  |8  |9  |";
    if (colour) out << ansi::reset;
    out << '\n';
    const size_t end = std::max(lastNonEmpty, std::min(cellPtr, cells.size() - 1));
    for (size_t i = 0, row = 0; i <= end; ++i) {
        if (i % 10 == 0) {
            if (row) out << '\n';
            std::string rowStr = std::to_string(row);
            size_t rowPad = rowStr.length() < 8 ? 8 - rowStr.length() : 0;
            out << rowStr << std::string(rowPad, ' ') << "|";
            row += 10;
        }
        std::string cellStr = std::to_string(cells[i]);
        if (i == cellPtr && !colour) cellStr = "[" + cellStr + "]";
        size_t cellPad = cellStr.length() < 3 ? 3 - cellStr.length() : 0;
        if (i == cellPtr && colour) {
            out << ansi::green << cellStr << ansi::reset;
        } else {
            out << cellStr;
        }
        out << std::string(cellPad, ' ') << "|";
    }
    out << std::endl;
}
}  // namespace brisk
