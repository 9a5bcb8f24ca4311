#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "linkscan/html_document.h"
#include "linkscan/scanner.h"
#include "linkscan/url.h"

namespace linkscan {

/// Everything extracted from one scanned page.
/// MUST keep links/images/fragments derived purely from document.
struct ParsedFile {
  std::string path;
  std::string content;
  HtmlDocument document;
  std::unordered_set<HrefUrl> links;
  std::unordered_set<ImgUrl> images;
  std::unordered_set<std::string> fragments;
  std::unordered_set<std::string> duplicate_fragments;
};

/// Controls discovery and scanning of the site tree.
struct IndexOptions {
  /// Files with this extension (compared case-insensitively) are scanned as pages.
  std::string extension = ".html";
  /// Number of scan workers; 0 and 1 both mean a sequential walk.
  size_t jobs = 1;
};

/// In-memory index of a rendered site, built once per verification run.
/// pages holds one record per scanned page keyed by canonical path; files holds
/// every regular file under root so non-page targets (images, feeds) can be checked.
struct SiteIndex {
  std::string root;
  std::unordered_map<std::string, ParsedFile> pages;
  std::set<std::string> files;

  const ParsedFile* find_page(const std::string& path) const;
  bool has_file(const std::string& path) const { return files.count(path) != 0; }
  /// Path relative to root, for reports.
  std::string relative(const std::string& path) const;
};

/// Lists every regular file under root, sorted, as canonical path strings.
/// Directories and symlinks that do not resolve to regular files are skipped.
/// Inputs are a directory path; outputs are sorted paths after read-only IO.
std::vector<std::string> discover_files(const std::string& root);

/// Reads, parses and scans one page.
/// Throws IndexError naming path when the page contains an unclassifiable URL.
ParsedFile scan_file(const std::string& path, const ScanSelectors& selectors);

/// Walks root and builds the complete index, failing fast on the first bad page.
/// MUST either return a complete index or throw; partial indexes are never exposed.
/// Throws IndexError for scan failures and std::runtime_error for IO failures.
/// Inputs are a root, options and selectors; outputs are an immutable index after read-only IO.
SiteIndex build_index(const std::string& root,
                      const IndexOptions& options,
                      const ScanSelectors& selectors);

}  // namespace linkscan
