#pragma once

#include <string>

#include "linkscan/scanner.h"
#include "linkscan/site_index.h"
#include "linkscan/validate.h"

namespace linkscan {

/// Output format of the findings report.
enum class ReportFormat {
  Text,
  Json,
};

/// Complete run configuration assembled from defaults, a JSON file and CLI flags.
struct Config {
  IndexOptions index;
  SelectorConfig selectors;
  ValidateOptions validate;
  ReportFormat format = ReportFormat::Text;
};

/// Parses "text" / "json"; throws std::invalid_argument for anything else.
ReportFormat parse_report_format(const std::string& value);
std::string report_format_name(ReportFormat format);

/// Applies a JSON configuration document on top of config.
/// MUST reject unknown keys and wrong value types with a message naming the key.
/// Throws std::runtime_error on malformed JSON or invalid values.
/// Inputs are JSON text and a config; outputs are the updated config with no IO.
void apply_config_json(const std::string& json_text, Config& config);

/// Loads a JSON configuration file on top of config.
/// Throws std::runtime_error on IO errors or invalid content; the message names the file.
/// Inputs are a file path and a config; outputs are the updated config after one file read.
void load_config_file(const std::string& path, Config& config);

}  // namespace linkscan
