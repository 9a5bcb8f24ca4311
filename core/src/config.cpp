#include "linkscan/config.h"

#include <stdexcept>

#include <nlohmann/json.hpp>

#include "io.h"

namespace linkscan {

namespace {

using json = nlohmann::json;

[[noreturn]] void reject_key(const std::string& key, const std::string& reason) {
  throw std::runtime_error("Invalid config key '" + key + "': " + reason);
}

std::string read_string(const json& value, const std::string& key) {
  if (!value.is_string()) reject_key(key, "expected a string");
  return value.get<std::string>();
}

void apply_selectors(const json& selectors, SelectorConfig& out) {
  if (!selectors.is_object()) reject_key("selectors", "expected an object");
  for (auto it = selectors.begin(); it != selectors.end(); ++it) {
    const std::string key = "selectors." + it.key();
    if (it.key() == "links") {
      out.links = read_string(it.value(), key);
    } else if (it.key() == "images") {
      out.images = read_string(it.value(), key);
    } else if (it.key() == "fragments") {
      out.fragments = read_string(it.value(), key);
    } else {
      reject_key(key, "unknown key");
    }
  }
}

}  // namespace

ReportFormat parse_report_format(const std::string& value) {
  if (value == "text") return ReportFormat::Text;
  if (value == "json") return ReportFormat::Json;
  throw std::invalid_argument("Invalid report format '" + value + "' (use text|json)");
}

std::string report_format_name(ReportFormat format) {
  switch (format) {
    case ReportFormat::Text:
      return "text";
    case ReportFormat::Json:
      return "json";
  }
  return "text";
}

void apply_config_json(const std::string& json_text, Config& config) {
  const json root = json::parse(json_text, nullptr, false);
  if (root.is_discarded()) {
    throw std::runtime_error("Config is not valid JSON");
  }
  if (!root.is_object()) {
    throw std::runtime_error("Config must be a JSON object");
  }

  // Applied to a copy so a rejected document leaves config untouched.
  Config next = config;
  for (auto it = root.begin(); it != root.end(); ++it) {
    const std::string& key = it.key();
    const json& value = it.value();
    if (key == "extension") {
      next.index.extension = read_string(value, key);
      if (next.index.extension.empty()) reject_key(key, "must not be empty");
    } else if (key == "jobs") {
      if (!value.is_number_unsigned()) reject_key(key, "expected a non-negative integer");
      next.index.jobs = value.get<size_t>();
    } else if (key == "index_file") {
      next.validate.index_file = read_string(value, key);
      if (next.validate.index_file.empty()) reject_key(key, "must not be empty");
    } else if (key == "check_duplicate_ids") {
      if (!value.is_boolean()) reject_key(key, "expected true or false");
      next.validate.check_duplicate_ids = value.get<bool>();
    } else if (key == "format") {
      try {
        next.format = parse_report_format(read_string(value, key));
      } catch (const std::invalid_argument& ex) {
        reject_key(key, ex.what());
      }
    } else if (key == "selectors") {
      apply_selectors(value, next.selectors);
    } else {
      reject_key(key, "unknown key");
    }
  }
  config = next;
}

void load_config_file(const std::string& path, Config& config) {
  std::string text = internal::read_file(path);
  try {
    apply_config_json(text, config);
  } catch (const std::runtime_error& ex) {
    throw std::runtime_error(path + ": " + ex.what());
  }
}

}  // namespace linkscan
