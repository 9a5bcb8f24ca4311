#include "linkscan/html_document.h"

#include <climits>

#include <libxml/HTMLparser.h>
#include <libxml/parser.h>

namespace linkscan {

namespace {

std::string xml_string(const xmlChar* value) {
  return value ? std::string(reinterpret_cast<const char*>(value)) : std::string();
}

std::string escape_attribute(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    switch (c) {
      case '"':
        out += "&quot;";
        break;
      case '&':
        out += "&amp;";
        break;
      default:
        out.push_back(c);
        break;
    }
  }
  return out;
}

}  // namespace

HtmlDocument::HtmlDocument(xmlDoc* doc) : doc_(doc, xmlFreeDoc) {}

HtmlDocument parse_html_document(const std::string& html) {
  if (html.empty() || html.size() > static_cast<size_t>(INT_MAX)) {
    return HtmlDocument();
  }
  htmlDocPtr html_doc = htmlReadMemory(
      html.data(),
      static_cast<int>(html.size()),
      nullptr,
      "UTF-8",
      HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET);
  if (!html_doc) {
    return HtmlDocument();
  }
  return HtmlDocument(html_doc);
}

std::optional<std::string> attribute_value(const xmlNode* node, const std::string& name) {
  if (!node || node->type != XML_ELEMENT_NODE) return std::nullopt;
  xmlChar* value = xmlGetProp(node, reinterpret_cast<const xmlChar*>(name.c_str()));
  if (!value) return std::nullopt;
  std::string out = xml_string(value);
  xmlFree(value);
  return out;
}

std::string describe_element(const xmlNode* node) {
  if (!node) return "";
  std::string out = "<" + xml_string(node->name);
  for (xmlAttr* attr = node->properties; attr != nullptr; attr = attr->next) {
    out += " " + xml_string(attr->name);
    xmlChar* value = xmlNodeListGetString(node->doc, attr->children, 1);
    if (value) {
      out += "=\"" + escape_attribute(xml_string(value)) + "\"";
      xmlFree(value);
    }
  }
  out += ">";
  return out;
}

}  // namespace linkscan
