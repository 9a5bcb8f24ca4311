#include "linkscan/report.h"

#include <sstream>

#include <nlohmann/json.hpp>

namespace linkscan {

namespace {

using json = nlohmann::json;

std::string plural(size_t count, const std::string& word) {
  return std::to_string(count) + " " + word + (count == 1 ? "" : "s");
}

}  // namespace

std::string link_source_name(LinkSource source) {
  switch (source) {
    case LinkSource::Href:
      return "href";
    case LinkSource::Image:
      return "image";
  }
  return "href";
}

std::string render_report_text(const ValidationReport& report) {
  std::ostringstream out;
  for (const auto& link : report.broken_links) {
    out << link.from_file << ": broken "
        << (link.source == LinkSource::Image ? "image" : "link") << " -> " << link.target
        << "\n";
  }
  for (const auto& fragment : report.broken_fragments) {
    out << fragment.from_file << ": broken fragment -> " << fragment.target_file
        << fragment.fragment << "\n";
  }
  for (const auto& duplicate : report.duplicate_fragments) {
    out << duplicate.file << ": duplicate id " << duplicate.fragment << "\n";
  }
  out << "Checked " << plural(report.pages_checked, "page") << " ("
      << plural(report.links_checked, "link") << ", "
      << plural(report.images_checked, "image") << "): ";
  if (report.clean()) {
    out << "no problems found.";
  } else {
    out << plural(report.finding_count(), "problem") << ".";
  }
  return out.str();
}

std::string render_report_json(const ValidationReport& report) {
  json out = json::object();
  out["summary"] = {
      {"pages", report.pages_checked},
      {"links", report.links_checked},
      {"images", report.images_checked},
      {"findings", report.finding_count()},
  };

  json links = json::array();
  for (const auto& link : report.broken_links) {
    links.push_back({
        {"from", link.from_file},
        {"target", link.target},
        {"resolved", link.resolved},
        {"kind", link_source_name(link.source)},
    });
  }
  out["broken_links"] = std::move(links);

  json fragments = json::array();
  for (const auto& fragment : report.broken_fragments) {
    fragments.push_back({
        {"from", fragment.from_file},
        {"target", fragment.target_file},
        {"fragment", fragment.fragment},
    });
  }
  out["broken_fragments"] = std::move(fragments);

  json duplicates = json::array();
  for (const auto& duplicate : report.duplicate_fragments) {
    duplicates.push_back({
        {"file", duplicate.file},
        {"fragment", duplicate.fragment},
    });
  }
  out["duplicate_fragments"] = std::move(duplicates);
  // Decoded paths and file names may hold bytes that are not UTF-8.
  return out.dump(2, ' ', false, json::error_handler_t::replace);
}

}  // namespace linkscan
