#include "test_harness.h"

#include <sstream>

#include "cli_utils.h"
#include "color.h"

namespace {

void test_logger_info_only_when_verbose() {
  std::ostringstream quiet_out;
  linkscan::cli::Logger quiet(quiet_out, false, false);
  quiet.info("Indexed 3 pages");
  expect_eq(quiet_out.str(), "", "info suppressed without --verbose");

  std::ostringstream verbose_out;
  linkscan::cli::Logger verbose(verbose_out, true, false);
  verbose.info("Indexed 3 pages");
  expect_eq(verbose_out.str(), "Indexed 3 pages\n", "info printed with --verbose");
}

void test_logger_prefixes() {
  std::ostringstream out;
  linkscan::cli::Logger log(out, false, false);
  log.warning("no .html files found");
  log.error("Failed to open file: x");
  expect_eq(out.str(), "Warning: no .html files found\nError: Failed to open file: x\n",
            "warning and error always printed with prefixes");
}

void test_logger_color() {
  std::ostringstream out;
  linkscan::cli::Logger log(out, false, true);
  log.error("boom");
  const std::string expected = std::string(linkscan::cli::kColor.red) + "Error: boom" +
                               linkscan::cli::kColor.reset + "\n";
  expect_eq(out.str(), expected, "error wrapped in red");
}

void test_env_value_empty_is_unset() {
  expect_true(!linkscan::cli::env_value("LINKSCAN_TEST_SURELY_UNSET_VARIABLE").has_value(),
              "unset variable yields nullopt");
}

}  // namespace

void register_cli_utils_tests(std::vector<TestCase>& tests) {
  tests.push_back({"logger_info_only_when_verbose", test_logger_info_only_when_verbose});
  tests.push_back({"logger_prefixes", test_logger_prefixes});
  tests.push_back({"logger_color", test_logger_color});
  tests.push_back({"env_value_empty_is_unset", test_env_value_empty_is_unset});
}
