#pragma once
#include <unistd.h>

#include <cstdlib>
#include <string_view>

namespace ansi {
inline constexpr std::string_view red{"\x1b[31m"};
inline constexpr std::string_view green{"\x1b[32m"};
inline constexpr std::string_view yellow{"\x1b[33m"};
inline constexpr std::string_view reset{"\x1b[0m"};
inline constexpr std::string_view underline{"\x1b[4m"};

// Escape codes are only written to terminals, and never when NO_COLOR is set.
inline bool enabled(int fd) { return isatty(fd) == 1 && std::getenv("NO_COLOR") == nullptr; }
}  // namespace ansi
