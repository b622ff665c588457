#pragma once

#include <cstddef>
#include <string_view>

namespace brisk {
struct JumpTable;
enum class Status : int;

/// @brief Pair every bracket of a sanitized program with its match.
/// @param code Sanitized program.
/// @param table Filled with both directions of the pairing, sized to the program.
/// @param errorPos On failure, the position of the offending bracket: the stray `]`,
/// or the leftmost `[` left open.
/// @return Status::Ok, Status::UnmatchedClose or Status::UnmatchedOpen.
Status resolveBrackets(std::string_view code, JumpTable& table, std::size_t* errorPos = nullptr);
}  // namespace brisk
