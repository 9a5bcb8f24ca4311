#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

#include "cli_args.h"
#include "cli_utils.h"
#include "linkscan/linkscan.h"
#include "linkscan/version.h"

using namespace linkscan::cli;

/// Entry point: loads configuration, indexes the site, validates it and prints the report.
/// MUST preserve exit codes for script usage and MUST not hide fatal errors.
int main(int argc, char** argv) {
  CliOptions options;
  if (argc == 1) {
    print_help(std::cout);
    return 0;
  }

  std::string arg_error;
  if (!parse_cli_args(argc, argv, options, arg_error)) {
    std::cerr << arg_error << "\n";
    return 2;
  }
  if (options.show_help) {
    print_help(std::cout);
    return 0;
  }
  if (options.show_version) {
    std::cout << "linkscan " << linkscan::version_string() << std::endl;
    return 0;
  }

  const Logger log(std::cerr, options.verbose, options.color && stderr_is_tty());

  linkscan::Config config;
  std::string config_path = options.config_path;
  if (config_path.empty()) {
    config_path = env_value("LINKSCAN_CONFIG").value_or("");
  }
  try {
    if (!config_path.empty()) {
      linkscan::load_config_file(config_path, config);
      log.info("Loaded config " + config_path);
    }
    apply_cli_options(options, config);
  } catch (const std::exception& ex) {
    log.error(ex.what());
    return 2;
  }

  if (options.site_dir.empty()) {
    std::cerr << "Missing <site-dir>\n";
    return 2;
  }

  try {
    const auto started_at = std::chrono::steady_clock::now();
    linkscan::CheckResult result = linkscan::check_site(options.site_dir, config);
    const long long elapsed_ms = static_cast<long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_at)
            .count());

    if (result.index.pages.empty()) {
      log.warning("no " + config.index.extension + " files found under " + result.index.root);
    }
    log.info("Indexed " + std::to_string(result.index.pages.size()) + " pages (" +
             std::to_string(result.index.files.size()) + " files) and validated in " +
             std::to_string(elapsed_ms) + " ms");

    if (config.format == linkscan::ReportFormat::Json) {
      std::cout << linkscan::render_report_json(result.report) << std::endl;
    } else {
      std::cout << linkscan::render_report_text(result.report) << std::endl;
    }
    return result.report.clean() ? 0 : 1;
  } catch (const linkscan::IndexError& ex) {
    log.error(ex.what());
    return 1;
  } catch (const std::exception& ex) {
    log.error(ex.what());
    return 2;
  }
}
