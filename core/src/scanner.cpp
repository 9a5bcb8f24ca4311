#include "linkscan/scanner.h"

#include <cctype>
#include <functional>
#include <memory>
#include <stdexcept>
#include <utility>

#include "linkscan/errors.h"
#include "util/string_util.h"

namespace linkscan {

namespace {

bool is_name_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

[[noreturn]] void reject_selector(const std::string& selector, const std::string& reason) {
  throw std::invalid_argument("Invalid selector '" + selector + "': " + reason);
}

std::string read_name(const std::string& s, size_t& i) {
  size_t start = i;
  while (i < s.size() && is_name_char(s[i])) {
    ++i;
  }
  return util::to_lower(s.substr(start, i - start));
}

std::string simple_selector_to_xpath(const std::string& full, const std::string& simple) {
  if (simple.empty()) reject_selector(full, "empty alternative");
  size_t i = 0;
  std::string tag;
  if (simple[0] == '*') {
    tag = "*";
    ++i;
  } else if (std::isalpha(static_cast<unsigned char>(simple[0]))) {
    tag = read_name(simple, i);
  }

  std::string tests;
  while (i < simple.size()) {
    if (simple[i] != '[') {
      reject_selector(full, std::string("unexpected character '") + simple[i] + "'");
    }
    ++i;
    std::string attr = read_name(simple, i);
    if (attr.empty()) reject_selector(full, "missing attribute name");
    if (i < simple.size() && simple[i] == '=') {
      ++i;
      std::string value;
      if (i < simple.size() && (simple[i] == '"' || simple[i] == '\'')) {
        char quote = simple[i++];
        size_t close = simple.find(quote, i);
        if (close == std::string::npos) reject_selector(full, "unterminated attribute value");
        value = simple.substr(i, close - i);
        i = close + 1;
      } else {
        size_t close = simple.find(']', i);
        if (close == std::string::npos) reject_selector(full, "missing ']'");
        value = simple.substr(i, close - i);
        i = close;
      }
      if (value.find('"') != std::string::npos) {
        reject_selector(full, "attribute value may not contain '\"'");
      }
      tests += "[@" + attr + "=\"" + value + "\"]";
    } else {
      tests += "[@" + attr + "]";
    }
    if (i >= simple.size() || simple[i] != ']') reject_selector(full, "missing ']'");
    ++i;
  }
  if (tag.empty() && tests.empty()) reject_selector(full, "nothing to match");
  return "//" + (tag.empty() ? std::string("*") : tag) + tests;
}

/// Evaluates a compiled selector and hands every matched element to fn.
void for_each_match(const HtmlDocument& document,
                    xmlXPathCompExpr* selector,
                    const std::function<void(xmlNode*)>& fn) {
  std::unique_ptr<xmlXPathContext, void (*)(xmlXPathContextPtr)> context(
      xmlXPathNewContext(document.get()), xmlXPathFreeContext);
  if (!context) {
    throw std::runtime_error("Failed to create XPath context");
  }
  std::unique_ptr<xmlXPathObject, void (*)(xmlXPathObjectPtr)> result(
      xmlXPathCompiledEval(selector, context.get()), xmlXPathFreeObject);
  if (!result) {
    throw std::runtime_error("Failed to evaluate selector");
  }
  xmlNodeSetPtr nodes = result->nodesetval;
  for (int i = 0; i < xmlXPathNodeSetGetLength(nodes); ++i) {
    xmlNode* node = xmlXPathNodeSetItem(nodes, i);
    if (node && node->type == XML_ELEMENT_NODE) {
      fn(node);
    }
  }
}

template <typename Url>
void collect_urls(const HtmlDocument& document,
                  xmlXPathCompExpr* selector,
                  const std::string& attribute,
                  std::unordered_set<Url>& out) {
  for_each_match(document, selector, [&](xmlNode* node) {
    std::optional<std::string> value = attribute_value(node, attribute);
    if (!value.has_value()) return;
    try {
      out.insert(Url::parse(*value));
    } catch (const MalformedUrlError& err) {
      throw ScanError(ScanFailure{describe_element(node), attribute, err.detail()});
    }
  });
}

}  // namespace

std::string css_to_xpath(const std::string& selector) {
  std::string out;
  for (const auto& simple : util::split_trimmed(selector, ',')) {
    if (!out.empty()) out += " | ";
    out += simple_selector_to_xpath(selector, simple);
  }
  return out;
}

ScanSelectors::CompiledXPath ScanSelectors::compile(const std::string& selector) {
  std::string xpath = css_to_xpath(selector);
  CompiledXPath compiled(xmlXPathCompile(reinterpret_cast<const xmlChar*>(xpath.c_str())),
                         xmlXPathFreeCompExpr);
  if (!compiled) {
    reject_selector(selector, "could not compile '" + xpath + "'");
  }
  return compiled;
}

ScanSelectors::ScanSelectors(SelectorConfig config)
    : config_(std::move(config)),
      links_(compile(config_.links)),
      images_(compile(config_.images)),
      fragments_(compile(config_.fragments)) {}

ScanResult scan_document(const HtmlDocument& document, const ScanSelectors& selectors) {
  ScanResult result;
  if (document.empty()) return result;

  collect_urls(document, selectors.links(), "href", result.links);
  collect_urls(document, selectors.images(), "src", result.images);
  for_each_match(document, selectors.fragments(), [&](xmlNode* node) {
    std::optional<std::string> id = attribute_value(node, "id");
    if (!id.has_value()) return;
    std::string fragment = "#" + *id;
    if (!result.fragments.insert(fragment).second) {
      result.duplicate_fragments.insert(fragment);
    }
  });
  return result;
}

ScanResult scan_html(const std::string& html, const ScanSelectors& selectors) {
  return scan_document(parse_html_document(html), selectors);
}

}  // namespace linkscan
