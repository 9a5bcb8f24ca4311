#pragma once

#include <memory>
#include <optional>
#include <string>

#include <libxml/tree.h>

namespace linkscan {

/// Owns a parsed libxml2 HTML tree; copies share the same tree.
/// MUST be treated as immutable once returned by parse_html_document.
class HtmlDocument {
 public:
  HtmlDocument() = default;

  /// Root xmlDoc, or nullptr when the input produced no tree at all.
  xmlDoc* get() const { return doc_.get(); }
  bool empty() const { return doc_ == nullptr; }

 private:
  friend HtmlDocument parse_html_document(const std::string& html);
  explicit HtmlDocument(xmlDoc* doc);

  std::shared_ptr<xmlDoc> doc_;
};

/// Parses HTML leniently the way browsers tolerate it (unclosed tags, unknown attributes).
/// MUST NOT throw on imperfect markup and MUST NOT touch the network.
/// Inputs are UTF-8 text; outputs are a shared tree with no side effects.
HtmlDocument parse_html_document(const std::string& html);

/// Returns the attribute value, or nullopt when the element does not carry it.
/// Inputs are an element node and attribute name; outputs are copied strings with no side effects.
std::optional<std::string> attribute_value(const xmlNode* node, const std::string& name);

/// Serializes the element's start tag (name plus attributes) for error messages.
std::string describe_element(const xmlNode* node);

}  // namespace linkscan
