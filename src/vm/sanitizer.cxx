/*
    Brisk - A direct brainfuck interpreter
    Source sanitization
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <algorithm>
#include <cstdint>
#include <utility>

#include "simde/x86/avx2.h"
#include "vm.hxx"

#define TZCNT32(x) __builtin_ctz((unsigned)(x))

namespace {
constexpr std::size_t kBlock = 32;

// Bit i set when byte i of the block is one of the eight instructions.
inline uint32_t instructionMask(const char* p) {
    const simde__m256i v = simde_mm256_loadu_si256(reinterpret_cast<const simde__m256i*>(p));
    simde__m256i hit = simde_mm256_cmpeq_epi8(v, simde_mm256_set1_epi8('>'));
    hit = simde_mm256_or_si256(hit, simde_mm256_cmpeq_epi8(v, simde_mm256_set1_epi8('<')));
    hit = simde_mm256_or_si256(hit, simde_mm256_cmpeq_epi8(v, simde_mm256_set1_epi8('+')));
    hit = simde_mm256_or_si256(hit, simde_mm256_cmpeq_epi8(v, simde_mm256_set1_epi8('-')));
    hit = simde_mm256_or_si256(hit, simde_mm256_cmpeq_epi8(v, simde_mm256_set1_epi8('.')));
    hit = simde_mm256_or_si256(hit, simde_mm256_cmpeq_epi8(v, simde_mm256_set1_epi8(',')));
    hit = simde_mm256_or_si256(hit, simde_mm256_cmpeq_epi8(v, simde_mm256_set1_epi8('[')));
    hit = simde_mm256_or_si256(hit, simde_mm256_cmpeq_epi8(v, simde_mm256_set1_epi8(']')));
    return static_cast<uint32_t>(simde_mm256_movemask_epi8(hit));
}
}  // namespace

brisk::Sanitizer::Sanitizer(std::size_t capacity) : capacity_(capacity) {
    code_.reserve(std::min<std::size_t>(capacity_, 1 << 16));
}

bool brisk::Sanitizer::feed(std::string_view chunk) {
    const char* p = chunk.data();
    const std::size_t n = chunk.size();
    std::size_t i = 0;
    while (i + kBlock <= n) {
        uint32_t mask = instructionMask(p + i);
        if (mask == 0) {
            i += kBlock;
            continue;
        }
        const std::size_t room = capacity_ - code_.size();
        if (mask == 0xFFFFFFFFu && room >= kBlock) {
            code_.append(p + i, kBlock);
            i += kBlock;
            continue;
        }
        while (mask) {
            if (code_.size() >= capacity_) {
                truncated_ = true;
                return false;
            }
            code_.push_back(p[i + TZCNT32(mask)]);
            mask &= mask - 1;
        }
        i += kBlock;
    }
    for (; i < n; ++i) {
        if (!isInstruction(p[i])) continue;
        if (code_.size() >= capacity_) {
            truncated_ = true;
            return false;
        }
        code_.push_back(p[i]);
    }
    return !full();
}

std::string brisk::Sanitizer::release() {
    std::string out = std::move(code_);
    code_.clear();
    return out;
}

std::string brisk::sanitize(std::string_view source, std::size_t capacity, bool* truncated) {
    Sanitizer sanitizer(capacity);
    sanitizer.feed(source);
    if (truncated) *truncated = sanitizer.truncated();
    return sanitizer.release();
}
