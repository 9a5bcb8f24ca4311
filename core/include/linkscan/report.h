#pragma once

#include <string>

#include "linkscan/validate.h"

namespace linkscan {

/// Renders findings one per line followed by a summary line.
/// MUST be deterministic for stable golden tests.
/// Inputs are a report; outputs are text with no side effects.
std::string render_report_text(const ValidationReport& report);
/// Renders findings as a JSON object with summary counts and one array per finding kind.
/// MUST keep key ordering stable across runs and MUST NOT throw on non-UTF-8 bytes.
/// Inputs are a report; outputs are indented JSON text with no side effects.
std::string render_report_json(const ValidationReport& report);

std::string link_source_name(LinkSource source);

}  // namespace linkscan
