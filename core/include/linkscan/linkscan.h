#pragma once

#include <string>

#include "linkscan/config.h"
#include "linkscan/errors.h"
#include "linkscan/report.h"
#include "linkscan/scanner.h"
#include "linkscan/site_index.h"
#include "linkscan/url.h"
#include "linkscan/validate.h"

namespace linkscan {

/// Outcome of one verification run: the immutable index and its findings.
struct CheckResult {
  SiteIndex index;
  ValidationReport report;
};

/// Compiles selectors, indexes root and validates the index in one call.
/// MUST fail fast on indexing errors and MUST collect every validation finding.
/// Throws std::invalid_argument for bad selectors, IndexError for unscannable pages
/// and std::runtime_error for IO failures.
/// Inputs are a site root and a config; outputs are the index and its report after read-only IO.
CheckResult check_site(const std::string& root, const Config& config);

}  // namespace linkscan
