#pragma once

namespace linkscan::cli {

struct AnsiColors {
  const char* red;
  const char* yellow;
  const char* dim;
  const char* reset;
};

inline constexpr AnsiColors kColor{"\033[31m", "\033[33m", "\033[2m", "\033[0m"};

}  // namespace linkscan::cli
