#include "linkscan/validate.h"

#include <algorithm>
#include <filesystem>
#include <optional>
#include <tuple>

namespace linkscan {

namespace {

namespace fs = std::filesystem;

std::string normal_string(const fs::path& path) {
  std::string out = path.lexically_normal().generic_string();
  while (out.size() > 1 && out.back() == '/') {
    out.pop_back();
  }
  return out;
}

bool inside_root(const SiteIndex& index, const std::string& path) {
  fs::path rel = fs::path(path).lexically_relative(fs::path(index.root));
  if (rel.empty()) return false;
  return *rel.begin() != "..";
}

/// Returns the existing file a resolved target names, trying the directory index second.
std::optional<std::string> locate(const SiteIndex& index,
                                  const std::string& resolved,
                                  const ValidateOptions& options) {
  if (!inside_root(index, resolved)) return std::nullopt;
  if (index.has_file(resolved)) return resolved;
  std::string dir_index = normal_string(fs::path(resolved) / options.index_file);
  if (index.has_file(dir_index)) return dir_index;
  return std::nullopt;
}

void check_fragment(const SiteIndex& index,
                    const std::string& from_file,
                    const std::string& target_file,
                    const std::string& fragment,
                    ValidationReport& report) {
  const ParsedFile* target = index.find_page(target_file);
  // Non-page targets (feeds, downloads) have no id set to check against.
  if (!target) return;
  std::string wanted = "#" + fragment;
  if (target->fragments.count(wanted) == 0) {
    report.broken_fragments.push_back(
        BrokenFragment{index.relative(from_file), index.relative(target_file), wanted});
  }
}

void check_page(const SiteIndex& index,
                const ParsedFile& page,
                const ValidateOptions& options,
                ValidationReport& report) {
  for (const auto& link : page.links) {
    ++report.links_checked;
    if (link.is_external()) continue;
    if (link.is_self_reference()) {
      if (link.fragment().has_value()) {
        check_fragment(index, page.path, page.path, *link.fragment(), report);
      }
      continue;
    }
    std::string resolved = resolve_target(index, page.path, *link.path());
    std::optional<std::string> found = locate(index, resolved, options);
    if (!found.has_value()) {
      report.broken_links.push_back(BrokenLink{index.relative(page.path), link.to_string(),
                                               resolved, LinkSource::Href});
      continue;
    }
    if (link.fragment().has_value()) {
      check_fragment(index, page.path, *found, *link.fragment(), report);
    }
  }

  for (const auto& image : page.images) {
    ++report.images_checked;
    if (image.is_external() || !image.path().has_value()) continue;
    std::string resolved = resolve_target(index, page.path, *image.path());
    if (!locate(index, resolved, options).has_value()) {
      report.broken_links.push_back(BrokenLink{index.relative(page.path), image.to_string(),
                                               resolved, LinkSource::Image});
    }
  }

  if (options.check_duplicate_ids) {
    for (const auto& fragment : page.duplicate_fragments) {
      report.duplicate_fragments.push_back(DuplicateFragment{index.relative(page.path), fragment});
    }
  }
}

}  // namespace

std::string resolve_target(const SiteIndex& index,
                           const std::string& from_file,
                           const std::string& url_path) {
  if (!url_path.empty() && url_path[0] == '/') {
    return normal_string(fs::path(index.root) / fs::path(url_path.substr(1)));
  }
  return normal_string(fs::path(from_file).parent_path() / fs::path(url_path));
}

ValidationReport validate_index(const SiteIndex& index, const ValidateOptions& options) {
  ValidationReport report;

  std::vector<const ParsedFile*> pages;
  pages.reserve(index.pages.size());
  for (const auto& entry : index.pages) {
    pages.push_back(&entry.second);
  }
  std::sort(pages.begin(), pages.end(),
            [](const ParsedFile* a, const ParsedFile* b) { return a->path < b->path; });

  for (const ParsedFile* page : pages) {
    ++report.pages_checked;
    check_page(index, *page, options, report);
  }

  std::sort(report.broken_links.begin(), report.broken_links.end(),
            [](const BrokenLink& a, const BrokenLink& b) {
              return std::tie(a.from_file, a.source, a.target) <
                     std::tie(b.from_file, b.source, b.target);
            });
  std::sort(report.broken_fragments.begin(), report.broken_fragments.end(),
            [](const BrokenFragment& a, const BrokenFragment& b) {
              return std::tie(a.from_file, a.target_file, a.fragment) <
                     std::tie(b.from_file, b.target_file, b.fragment);
            });
  std::sort(report.duplicate_fragments.begin(), report.duplicate_fragments.end(),
            [](const DuplicateFragment& a, const DuplicateFragment& b) {
              return std::tie(a.file, a.fragment) < std::tie(b.file, b.fragment);
            });
  return report;
}

}  // namespace linkscan
