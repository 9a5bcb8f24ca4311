#include "cli_utils.h"

#include <cstdio>
#include <cstdlib>
#include <unistd.h>

#include "color.h"

namespace linkscan::cli {

Logger::Logger(std::ostream& err, bool verbose, bool color)
    : err_(err), verbose_(verbose), color_(color) {}

void Logger::info(const std::string& message) const {
  if (!verbose_) return;
  if (color_) err_ << kColor.dim;
  err_ << message;
  if (color_) err_ << kColor.reset;
  err_ << std::endl;
}

void Logger::warning(const std::string& message) const {
  if (color_) err_ << kColor.yellow;
  err_ << "Warning: " << message;
  if (color_) err_ << kColor.reset;
  err_ << std::endl;
}

void Logger::error(const std::string& message) const {
  if (color_) err_ << kColor.red;
  err_ << "Error: " << message;
  if (color_) err_ << kColor.reset;
  err_ << std::endl;
}

std::optional<std::string> env_value(const char* name) {
  const char* raw = std::getenv(name);
  if (!raw || !*raw) return std::nullopt;
  return std::string(raw);
}

bool stderr_is_tty() {
  return isatty(fileno(stderr)) != 0;
}

}  // namespace linkscan::cli
