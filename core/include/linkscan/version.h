#pragma once

#include <string>

namespace linkscan {

/// Captures core build version and source provenance details.
struct VersionInfo {
  std::string version;
  std::string git_commit;
  bool git_dirty = false;
};

/// Returns compile-time version/provenance for the current build.
/// MUST not perform IO and MUST be safe to call frequently.
VersionInfo get_version_info();
/// Returns "<version> (<commit>[-dirty])" for --version output.
/// MUST include at least version and commit hash.
std::string version_string();

}  // namespace linkscan
