#pragma once

#include <string>
#include <vector>

#include "linkscan/site_index.h"

namespace linkscan {

/// Which attribute produced a broken target.
enum class LinkSource {
  Href,
  Image,
};

/// An internal href/src whose path names no file in the site.
/// target is the normalized URL as written; resolved is the filesystem path tried.
struct BrokenLink {
  std::string from_file;
  std::string target;
  std::string resolved;
  LinkSource source = LinkSource::Href;
};

/// An internal href whose target page exists but defines no matching id.
/// fragment is stored with its leading '#'.
struct BrokenFragment {
  std::string from_file;
  std::string target_file;
  std::string fragment;
};

/// An id defined on more than one element of the same page.
struct DuplicateFragment {
  std::string file;
  std::string fragment;
};

struct ValidateOptions {
  /// Name tried inside a directory when a link names the directory itself.
  std::string index_file = "index.html";
  bool check_duplicate_ids = false;
};

/// All findings of one run, each list sorted by file then target.
struct ValidationReport {
  std::vector<BrokenLink> broken_links;
  std::vector<BrokenFragment> broken_fragments;
  std::vector<DuplicateFragment> duplicate_fragments;
  size_t pages_checked = 0;
  size_t links_checked = 0;
  size_t images_checked = 0;

  bool clean() const {
    return broken_links.empty() && broken_fragments.empty() && duplicate_fragments.empty();
  }
  size_t finding_count() const {
    return broken_links.size() + broken_fragments.size() + duplicate_fragments.size();
  }
};

/// Resolves an internal URL path against the page containing it.
/// Returns the lexically normalized absolute path string; path must be set on the URL.
std::string resolve_target(const SiteIndex& index,
                           const std::string& from_file,
                           const std::string& url_path);

/// Checks every internal link, fragment and image reference in the index.
/// MUST collect every finding rather than stop at the first and MUST NOT throw on findings.
/// External URLs are never resolved; image fragments are never checked.
/// Inputs are a completed index and options; outputs are sorted findings with no IO.
ValidationReport validate_index(const SiteIndex& index, const ValidateOptions& options);

}  // namespace linkscan
