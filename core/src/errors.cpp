#include "linkscan/errors.h"

#include <utility>

namespace linkscan {

std::string describe(const MalformedUrl& failure) {
  return failure.reason + " in '" + failure.raw + "'";
}

std::string describe(const ScanFailure& failure) {
  return "Error in parsing " + failure.attribute + " in element: " + failure.element +
         "\n  " + describe(failure.cause);
}

std::string describe(const IndexFailure& failure) {
  return "Error parsing file `" + failure.file + "`:\n  " + describe(failure.cause);
}

MalformedUrlError::MalformedUrlError(MalformedUrl detail)
    : std::runtime_error(describe(detail)), detail_(std::move(detail)) {}

ScanError::ScanError(ScanFailure detail)
    : std::runtime_error(describe(detail)), detail_(std::move(detail)) {}

IndexError::IndexError(IndexFailure detail)
    : std::runtime_error(describe(detail)), detail_(std::move(detail)) {}

}  // namespace linkscan
