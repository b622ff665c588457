#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

#include "vm/config.hxx"

namespace brisk {

inline constexpr std::array<bool, 256> instructionTable = [] {
    std::array<bool, 256> table{};
    for (unsigned char c : std::string_view{"><+-.,[]"}) table[c] = true;
    return table;
}();

inline bool isInstruction(char c) { return instructionTable[static_cast<unsigned char>(c)]; }

/// @brief Accumulates the instruction characters of a raw source, chunk by chunk.
///
/// Every byte outside `><+-.,[]` is dropped. Once `capacity` instructions have been
/// collected, further instruction bytes are discarded and `truncated()` turns true;
/// the program collected so far stays usable.
class Sanitizer {
   public:
    explicit Sanitizer(std::size_t capacity = BRISK_PROGRAM_MAX);

    /// @brief Filter a chunk onto the end of the program.
    /// @return false once the program is full and no more input is useful.
    bool feed(std::string_view chunk);

    bool full() const { return code_.size() >= capacity_; }
    bool truncated() const { return truncated_; }
    std::size_t capacity() const { return capacity_; }
    const std::string& code() const { return code_; }
    std::string release();

   private:
    std::size_t capacity_;
    std::string code_;
    bool truncated_ = false;
};

/// One-shot sanitization of a complete source.
std::string sanitize(std::string_view source, std::size_t capacity = BRISK_PROGRAM_MAX,
                     bool* truncated = nullptr);
}  // namespace brisk
