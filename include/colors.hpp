#pragma once

#include <unistd.h>  // for isatty(), STDOUT_FILENO

#include <string>  // for std::string

namespace formula {
namespace Color {
inline bool supports_color(int fd = STDOUT_FILENO) {
    return isatty(fd);
}
const std::string reset = "\033[0m";

// Standard
const std::string red = "\033[31m";
const std::string green = "\033[32m";
const std::string yellow = "\033[33m";
const std::string cyan = "\033[36m";

// Bright versions
const std::string bright_black = "\033[90m";  // gray
const std::string bright_red = "\033[91m";
const std::string bright_magenta = "\033[95m";
const std::string bright_cyan = "\033[96m";

inline std::string paint(const std::string& color, const std::string& s, bool enabled) {
    return enabled ? color + s + reset : s;
}
}  // namespace Color
}  // namespace formula
