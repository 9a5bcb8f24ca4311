#include "cli_args.h"

#include <cctype>
#include <string>

namespace linkscan::cli {

namespace {

bool parse_count(const std::string& value, size_t& out) {
  if (value.empty() || value.size() > 6) return false;
  size_t parsed = 0;
  for (char c : value) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    parsed = parsed * 10 + static_cast<size_t>(c - '0');
  }
  out = parsed;
  return true;
}

}  // namespace

void print_help(std::ostream& os) {
  os << "linkscan - verify links, images and fragments of a rendered static site\n\n";
  os << "Usage: linkscan [options] <site-dir>\n\n";
  os << "Options:\n";
  os << "  --config <file>         JSON configuration file (default: $LINKSCAN_CONFIG)\n";
  os << "  --jobs <n>              parallel scan workers (default 1)\n";
  os << "  --extension <ext>       page extension to scan (default .html)\n";
  os << "  --index-file <name>     file served for directory links (default index.html)\n";
  os << "  --check-duplicate-ids   report ids defined more than once in a page\n";
  os << "  --format text|json      report format (default text)\n";
  os << "  --verbose               progress information on stderr\n";
  os << "  --color=disabled        disable ANSI colors\n";
  os << "  --help\n";
  os << "  --version\n\n";
  os << "External URLs are never fetched; only internal targets are checked.\n";
  os << "Exit codes: 0=no problems, 1=broken references or unscannable page, 2=CLI/IO usage error.\n";
}

bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  CliOptions parsed = options;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto next_value = [&](std::string& out) {
      if (i + 1 >= argc) {
        error = "Missing value for " + arg;
        return false;
      }
      out = argv[++i];
      return true;
    };

    std::string value;
    if (arg == "--config") {
      if (!next_value(parsed.config_path)) return false;
    } else if (arg == "--jobs") {
      if (!next_value(value)) return false;
      size_t jobs = 0;
      if (!parse_count(value, jobs) || jobs == 0) {
        error = "Invalid --jobs value (use a positive integer)";
        return false;
      }
      parsed.jobs = jobs;
    } else if (arg == "--extension") {
      if (!next_value(value)) return false;
      if (value.empty()) {
        error = "Invalid --extension value (must not be empty)";
        return false;
      }
      parsed.extension = value;
    } else if (arg == "--index-file") {
      if (!next_value(value)) return false;
      if (value.empty()) {
        error = "Invalid --index-file value (must not be empty)";
        return false;
      }
      parsed.index_file = value;
    } else if (arg == "--format") {
      if (!next_value(value)) return false;
      if (value != "text" && value != "json") {
        error = "Invalid --format value (use text|json)";
        return false;
      }
      parsed.format = value;
    } else if (arg == "--check-duplicate-ids") {
      parsed.check_duplicate_ids = true;
    } else if (arg == "--verbose") {
      parsed.verbose = true;
    } else if (arg == "--color=disabled") {
      parsed.color = false;
    } else if (arg == "--help") {
      parsed.show_help = true;
    } else if (arg == "--version") {
      parsed.show_version = true;
    } else if (!arg.empty() && arg[0] == '-') {
      error = "Unknown argument: " + arg;
      return false;
    } else if (parsed.site_dir.empty()) {
      parsed.site_dir = arg;
    } else {
      error = "Unexpected extra argument: " + arg;
      return false;
    }
  }
  options = parsed;
  return true;
}

void apply_cli_options(const CliOptions& options, Config& config) {
  if (options.jobs.has_value()) config.index.jobs = *options.jobs;
  if (options.extension.has_value()) config.index.extension = *options.extension;
  if (options.index_file.has_value()) config.validate.index_file = *options.index_file;
  if (options.format.has_value()) config.format = parse_report_format(*options.format);
  if (options.check_duplicate_ids) config.validate.check_duplicate_ids = true;
}

}  // namespace linkscan::cli
