#include <exception>

#include "test_harness.h"
#include "test_utils.h"

namespace {

using linkscan::HrefUrl;

void test_missing_closing_tags() {
  std::string html = "<html><body><div><p id=\"lead\">Hi <a href=\"next.html\">next";
  auto result = scan(html);
  expect_true(result.links.count(HrefUrl::parse("next.html")) == 1,
              "missing closing tags should still yield the link");
  expect_true(result.fragments.count("#lead") == 1, "missing closing tags should still yield the id");
}

void test_mismatched_nesting() {
  std::string html = "<div><span id=\"title\">Title</div><a href=\"/a.html\">a</span>";
  auto result = scan(html);
  expect_true(result.fragments.count("#title") == 1, "mismatched nesting should still parse span");
  expect_true(result.links.count(HrefUrl::parse("/a.html")) == 1,
              "mismatched nesting should still parse the anchor");
}

void test_unquoted_attributes() {
  auto result = scan("<a href=plain.html>x</a><img src=pic.png>");
  expect_true(result.links.count(HrefUrl::parse("plain.html")) == 1, "unquoted href parsed");
  expect_eq(result.images.size(), 1, "unquoted src parsed");
}

void test_junk_bytes_no_throw() {
  bool threw = false;
  try {
    std::string html = "<div>\xFF\xFE junk <a href=\"ok.html\">ok</a></div>";
    scan(html);
  } catch (const std::exception&) {
    threw = true;
  }
  expect_true(!threw, "junk bytes should not crash parser");
}

void test_text_only_document() {
  auto result = scan("just some text, no markup");
  expect_true(result.links.empty() && result.images.empty() && result.fragments.empty(),
              "text-only document yields empty sets");
}

}  // namespace

void register_malformed_html_tests(std::vector<TestCase>& tests) {
  tests.push_back({"malformed_missing_closing_tags", test_missing_closing_tags});
  tests.push_back({"malformed_mismatched_nesting", test_mismatched_nesting});
  tests.push_back({"malformed_unquoted_attributes", test_unquoted_attributes});
  tests.push_back({"malformed_junk_bytes_no_throw", test_junk_bytes_no_throw});
  tests.push_back({"malformed_text_only_document", test_text_only_document});
}
