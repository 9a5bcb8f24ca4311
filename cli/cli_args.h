#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>

#include "linkscan/config.h"

namespace linkscan::cli {

/// Parsed command line; unset optionals leave the config file/default value in place.
struct CliOptions {
  std::string site_dir;
  std::string config_path;
  std::optional<size_t> jobs;
  std::optional<std::string> extension;
  std::optional<std::string> index_file;
  std::optional<std::string> format;
  bool check_duplicate_ids = false;
  bool verbose = false;
  bool color = true;
  bool show_help = false;
  bool show_version = false;
};

/// Prints usage, flags and exit codes.
/// MUST stay synchronized with supported flags and MUST not throw on stream errors.
void print_help(std::ostream& os);

/// Parses argv into typed options so main can dispatch consistently.
/// MUST return false for invalid flags with a message in error.
/// Inputs are argc/argv; outputs are CliOptions or an error message without side effects.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

/// Overlays explicitly given flags on config.
/// Throws std::invalid_argument for an unknown --format value.
/// Inputs are parsed options; outputs are the updated config with no IO.
void apply_cli_options(const CliOptions& options, Config& config);

}  // namespace linkscan::cli
