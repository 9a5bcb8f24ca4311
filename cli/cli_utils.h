#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace linkscan::cli {

/// Writes progress and problems to stderr the way the rest of the CLI does.
/// info lines appear only in verbose mode; warnings and errors always appear.
class Logger {
 public:
  Logger(std::ostream& err, bool verbose, bool color);

  void info(const std::string& message) const;
  void warning(const std::string& message) const;
  void error(const std::string& message) const;

 private:
  std::ostream& err_;
  bool verbose_;
  bool color_;
};

/// Returns a non-empty environment value, or nullopt.
std::optional<std::string> env_value(const char* name);
/// True when stderr is attached to a terminal.
bool stderr_is_tty();

}  // namespace linkscan::cli
