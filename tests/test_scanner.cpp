#include <stdexcept>
#include <string>

#include "linkscan/errors.h"
#include "linkscan/scanner.h"
#include "test_harness.h"
#include "test_utils.h"

namespace {

using linkscan::HrefUrl;
using linkscan::ImgUrl;

const char* kPage =
    "<!DOCTYPE html><html><head>"
    "<link rel=\"stylesheet\" href=\"/css/site.css\">"
    "</head><body>"
    "<h1 id=\"top\">Title</h1>"
    "<h2 id=\"intro\">Intro</h2>"
    "<a href=\"about.html\">About</a>"
    "<a href=\"./about.html\">About again</a>"
    "<a href=\"https://example.com/x\">Elsewhere</a>"
    "<a href=\"#intro\">Jump</a>"
    "<img src=\"img/logo.png\" alt=\"\">"
    "<img src=\"img/logo.png\">"
    "</body></html>";

void test_collects_links_images_fragments() {
  auto result = scan(kPage);
  expect_eq(result.links.size(), 4, "link count (duplicates collapsed)");
  expect_true(result.links.count(HrefUrl::parse("about.html")) == 1, "relative link found");
  expect_true(result.links.count(HrefUrl::parse("/css/site.css")) == 1,
              "non-anchor href elements are collected");
  expect_true(result.links.count(HrefUrl::parse("https://example.com/x")) == 1,
              "external link found");
  expect_true(result.links.count(HrefUrl::parse("#intro")) == 1, "fragment link found");
  expect_eq(result.images.size(), 1, "image count (duplicates collapsed)");
  expect_true(result.images.count(ImgUrl::parse("img/logo.png")) == 1, "image found");
  expect_eq(result.fragments.size(), 2, "fragment count");
}

void test_fragment_normalization() {
  auto result = scan("<h2 id=\"intro\">Intro</h2>");
  expect_eq(result.fragments.size(), 1, "one fragment");
  expect_true(result.fragments.count("#intro") == 1, "id becomes #intro exactly");
}

void test_same_href_twice_is_one_link() {
  auto result = scan("<a href=\"x.html\">1</a><p><a href=\"x.html\">2</a></p>");
  expect_eq(result.links.size(), 1, "duplicate href collapses");
}

void test_scan_is_deterministic() {
  auto first = scan(kPage);
  auto second = scan(kPage);
  expect_true(first.links == second.links, "links identical across scans");
  expect_true(first.images == second.images, "images identical across scans");
  expect_true(first.fragments == second.fragments, "fragments identical across scans");
}

void test_element_order_does_not_matter() {
  auto forward = scan("<a href=\"a.html\"></a><a href=\"b.html\"></a><i id=\"x\"></i>");
  auto reversed = scan("<i id=\"x\"></i><a href=\"b.html\"></a><a href=\"a.html\"></a>");
  expect_true(forward.links == reversed.links, "link set independent of element order");
  expect_true(forward.fragments == reversed.fragments, "fragment set independent of order");
}

void test_duplicate_ids_tolerated() {
  auto result = scan("<p id=\"dup\"></p><div id=\"dup\"></div><span id=\"once\"></span>");
  expect_eq(result.fragments.size(), 2, "duplicate id stored once");
  expect_eq(result.duplicate_fragments.size(), 1, "duplicate recorded");
  expect_true(result.duplicate_fragments.count("#dup") == 1, "duplicate is #dup");
}

void test_bad_href_reports_element() {
  bool threw = false;
  try {
    scan("<p><a class=\"nav\" href=\"ht!tp://bad\">bad</a></p>");
  } catch (const linkscan::ScanError& err) {
    threw = true;
    expect_eq(err.detail().attribute, "href", "attribute named");
    expect_true(err.detail().element.find("<a") == 0, "element serialized as start tag");
    expect_true(err.detail().element.find("class=\"nav\"") != std::string::npos,
                "element keeps attributes");
    expect_eq(err.detail().cause.raw, "ht!tp://bad", "cause carries raw string");
    expect_true(std::string(err.what()).find("ht!tp://bad") != std::string::npos,
                "message is self-contained");
  }
  expect_true(threw, "unclassifiable href aborts the scan");
}

void test_bad_src_reports_element() {
  bool threw = false;
  try {
    scan("<img src=\"\" alt=\"empty\">");
  } catch (const linkscan::ScanError& err) {
    threw = true;
    expect_eq(err.detail().attribute, "src", "src attribute named");
    expect_true(err.detail().element.find("<img") == 0, "img element serialized");
  }
  expect_true(threw, "empty src aborts the scan");
}

void test_custom_selectors() {
  linkscan::SelectorConfig config;
  config.links = "a[href]";
  config.images = "img[src]";
  const linkscan::ScanSelectors selectors(config);
  auto result = linkscan::scan_html(kPage, selectors);
  expect_true(result.links.count(HrefUrl::parse("/css/site.css")) == 0,
              "link[href] excluded by a[href]");
  expect_eq(result.links.size(), 3, "only anchors collected");
}

void test_selector_list_union() {
  linkscan::SelectorConfig config;
  config.links = "a[href], link[href]";
  const linkscan::ScanSelectors selectors(config);
  auto result = linkscan::scan_html(kPage, selectors);
  expect_eq(result.links.size(), 4, "union of both alternatives");
}

void test_css_to_xpath() {
  expect_eq(linkscan::css_to_xpath("[href]"), "//*[@href]", "bare attribute selector");
  expect_eq(linkscan::css_to_xpath("A[HREF]"), "//a[@href]", "names lowercased");
  expect_eq(linkscan::css_to_xpath("link[rel=\"icon\"][href]"),
            "//link[@rel=\"icon\"][@href]", "attribute value test");
  expect_eq(linkscan::css_to_xpath("a[href], img[src]"), "//a[@href] | //img[@src]",
            "alternatives become a union");
}

void test_invalid_selectors_rejected() {
  const char* bad[] = {"", "a[", "[]", "a > b", "a[href],", ".class", "svg:a[href]",
                       "a[xlink:href]"};
  for (const char* selector : bad) {
    bool threw = false;
    try {
      linkscan::css_to_xpath(selector);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    expect_true(threw, std::string("selector rejected: '") + selector + "'");
  }
}

void test_empty_document() {
  auto result = scan("");
  expect_true(result.links.empty() && result.images.empty() && result.fragments.empty(),
              "empty document yields empty sets");
}

}  // namespace

void register_scanner_tests(std::vector<TestCase>& tests) {
  tests.push_back({"scanner_collects_links_images_fragments",
                   test_collects_links_images_fragments});
  tests.push_back({"scanner_fragment_normalization", test_fragment_normalization});
  tests.push_back({"scanner_same_href_twice_is_one_link", test_same_href_twice_is_one_link});
  tests.push_back({"scanner_scan_is_deterministic", test_scan_is_deterministic});
  tests.push_back({"scanner_element_order_does_not_matter",
                   test_element_order_does_not_matter});
  tests.push_back({"scanner_duplicate_ids_tolerated", test_duplicate_ids_tolerated});
  tests.push_back({"scanner_bad_href_reports_element", test_bad_href_reports_element});
  tests.push_back({"scanner_bad_src_reports_element", test_bad_src_reports_element});
  tests.push_back({"scanner_custom_selectors", test_custom_selectors});
  tests.push_back({"scanner_selector_list_union", test_selector_list_union});
  tests.push_back({"scanner_css_to_xpath", test_css_to_xpath});
  tests.push_back({"scanner_invalid_selectors_rejected", test_invalid_selectors_rejected});
  tests.push_back({"scanner_empty_document", test_empty_document});
}
