#pragma once

#include <unistd.h>  // for isatty()

#include <string>  // for std::string

namespace pytch {
namespace Color {
inline bool supports_color(int fd = STDERR_FILENO) {
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

// Wraps `text` in `code` ... reset when `enabled`.
inline std::string paint(bool enabled, const std::string& code, const std::string& text) {
    return enabled ? code + text + reset : text;
}
}  // namespace Color
}  // namespace pytch
