/*
    Brisk - A direct brainfuck interpreter
    Bracket resolution
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <vector>

#include "vm.hxx"

brisk::Status brisk::resolveBrackets(std::string_view code, JumpTable& table,
                                     std::size_t* errorPos) {
    table.openToClose.assign(code.length(), 0);
    table.closeToOpen.assign(code.length(), 0);
    std::vector<std::size_t> stack;
    for (std::size_t i = 0; i < code.length(); ++i) {
        const char ch = code[i];
        if (ch == '[') {
            stack.push_back(i);
        } else if (ch == ']') {
            if (stack.empty()) {
                if (errorPos) *errorPos = i;
                return Status::UnmatchedClose;
            }
            const std::size_t start = stack.back();
            stack.pop_back();
            table.openToClose[start] = i;
            table.closeToOpen[i] = start;
        }
    }
    if (!stack.empty()) {
        if (errorPos) *errorPos = stack.front();
        return Status::UnmatchedOpen;
    }
    return Status::Ok;
}

const char* brisk::statusMessage(Status status) {
    switch (status) {
        case Status::Ok:
            return "OK";
        case Status::UnmatchedClose:
            return "Unmatched close bracket";
        case Status::UnmatchedOpen:
            return "Unmatched open bracket";
    }
    return "Unknown status";
}
