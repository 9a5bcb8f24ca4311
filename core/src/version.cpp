#include "linkscan/version.h"

#ifndef LINKSCAN_VERSION
#define LINKSCAN_VERSION "0.0.0"
#endif

#ifndef LINKSCAN_GIT_COMMIT
#define LINKSCAN_GIT_COMMIT "unknown"
#endif

#ifndef LINKSCAN_GIT_DIRTY
#define LINKSCAN_GIT_DIRTY 0
#endif

namespace linkscan {

VersionInfo get_version_info() {
  VersionInfo info;
  info.version = LINKSCAN_VERSION;
  info.git_commit = LINKSCAN_GIT_COMMIT;
  info.git_dirty = (LINKSCAN_GIT_DIRTY != 0);
  return info;
}

std::string version_string() {
  VersionInfo info = get_version_info();
  std::string out = info.version + " (" + info.git_commit;
  if (info.git_dirty) out += "-dirty";
  out += ")";
  return out;
}

}  // namespace linkscan
