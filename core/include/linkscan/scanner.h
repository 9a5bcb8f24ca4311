#pragma once

#include <memory>
#include <string>
#include <unordered_set>

#include <libxml/xpath.h>

#include "linkscan/html_document.h"
#include "linkscan/url.h"

namespace linkscan {

/// CSS attribute selectors choosing which elements feed each collection.
/// Supported form: an optional tag name followed by one or more [attr] tests,
/// with ',' separating alternatives (e.g. "a[href], link[href]").
struct SelectorConfig {
  std::string links = "[href]";
  std::string images = "[src]";
  std::string fragments = "[id]";
};

/// Translates a supported CSS attribute selector into an XPath expression.
/// Throws std::invalid_argument naming the selector when it is outside the supported form.
/// Inputs are selector strings; outputs are XPath strings with no side effects.
std::string css_to_xpath(const std::string& selector);

/// Compiled selector set built once and passed by reference into scans.
/// MUST be constructed before scanning starts; construction validates every selector.
/// A compiled set is not shared across threads; each worker builds its own from config().
class ScanSelectors {
 public:
  explicit ScanSelectors(SelectorConfig config = SelectorConfig());

  const SelectorConfig& config() const { return config_; }
  xmlXPathCompExpr* links() const { return links_.get(); }
  xmlXPathCompExpr* images() const { return images_.get(); }
  xmlXPathCompExpr* fragments() const { return fragments_.get(); }

 private:
  using CompiledXPath = std::unique_ptr<xmlXPathCompExpr, void (*)(xmlXPathCompExprPtr)>;
  static CompiledXPath compile(const std::string& selector);

  SelectorConfig config_;
  CompiledXPath links_;
  CompiledXPath images_;
  CompiledXPath fragments_;
};

/// The three unordered collections extracted from one document.
/// duplicate_fragments lists "#id" values defined on more than one element.
struct ScanResult {
  std::unordered_set<HrefUrl> links;
  std::unordered_set<ImgUrl> images;
  std::unordered_set<std::string> fragments;
  std::unordered_set<std::string> duplicate_fragments;
};

/// Extracts links, images and fragment ids from a parsed document.
/// MUST yield the same sets for the same tree regardless of traversal order.
/// Throws ScanError carrying the offending element when an href/src cannot be classified.
/// Inputs are a parsed tree and compiled selectors; outputs are value sets with no side effects.
ScanResult scan_document(const HtmlDocument& document, const ScanSelectors& selectors);

/// Parses then scans; convenience for callers holding only the text.
ScanResult scan_html(const std::string& html, const ScanSelectors& selectors);

}  // namespace linkscan
