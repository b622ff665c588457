#pragma once

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string_view>
#include <vector>

namespace brisk {
struct JumpTable;
struct ProfileInfo;
enum class Status : int;
enum class EofBehaviour : int;

/// @brief Run a sanitized program whose brackets are already resolved.
/// @param code Sanitized program, only `><+-.,[]`.
/// @param table Jump table produced by resolveBrackets for this program.
/// @param cells Tape. Its size is the tape size; the data pointer wraps at both ends.
/// An empty tape is replaced by a zeroed tape of BRISK_TAPE_SIZE cells.
/// @param cellPtr Data pointer, read at start (reduced modulo the tape size) and
/// written back when the program ends.
/// @param eof What `,` stores when the input is exhausted.
void run(std::string_view code, const JumpTable& table, std::vector<uint8_t>& cells,
         size_t& cellPtr, EofBehaviour eof, std::istream& in = std::cin,
         std::ostream& out = std::cout, ProfileInfo* profile = nullptr);

/// @brief Sanitize, resolve and run. Nothing executes when the brackets do not balance.
/// @return Status::Ok after the program ran to completion, otherwise the bracket error.
Status execute(std::vector<uint8_t>& cells, size_t& cellPtr, std::string_view code,
               EofBehaviour eof, std::istream& in = std::cin, std::ostream& out = std::cout,
               ProfileInfo* profile = nullptr);
}  // namespace brisk
