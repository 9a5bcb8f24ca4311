#include "linkscan/linkscan.h"

namespace linkscan {

CheckResult check_site(const std::string& root, const Config& config) {
  const ScanSelectors selectors(config.selectors);
  CheckResult result;
  result.index = build_index(root, config.index, selectors);
  result.report = validate_index(result.index, config.validate);
  return result;
}

}  // namespace linkscan
