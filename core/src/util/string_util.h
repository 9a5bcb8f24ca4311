#pragma once

#include <string>
#include <vector>

namespace linkscan::util {

/// Converts a string to lowercase for case-insensitive comparisons.
/// MUST avoid locale-sensitive behavior to keep classification deterministic.
/// Inputs are strings; outputs are lowercase strings with no side effects.
std::string to_lower(const std::string& s);
/// Trims leading and trailing ASCII whitespace.
/// MUST preserve internal whitespace and MUST not modify the input.
/// Inputs are strings; outputs are trimmed strings with no side effects.
std::string trim_ws(const std::string& s);
/// Splits on a delimiter and trims each piece; empty pieces are kept so callers can reject them.
std::vector<std::string> split_trimmed(const std::string& s, char delimiter);
/// Suffix test that ignores ASCII case, used for file extensions.
bool ends_with_icase(const std::string& s, const std::string& suffix);

}  // namespace linkscan::util
