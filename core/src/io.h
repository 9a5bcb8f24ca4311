#pragma once

#include <string>

namespace linkscan::internal {

/// Loads file contents for scanning and configuration.
/// MUST throw on IO errors and MUST not perform network access.
std::string read_file(const std::string& path);

}  // namespace linkscan::internal
