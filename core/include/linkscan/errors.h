#pragma once

#include <stdexcept>
#include <string>

namespace linkscan {

/// Describes an href/src value that could not be classified.
/// MUST keep the raw attribute text untouched so reports can quote it.
struct MalformedUrl {
  std::string raw;
  std::string reason;
};

/// Describes a document that could not be fully scanned.
/// element is the serialized start tag of the offending element.
struct ScanFailure {
  std::string element;
  std::string attribute;
  MalformedUrl cause;
};

/// Describes a site tree that could not be indexed because one file failed.
struct IndexFailure {
  std::string file;
  ScanFailure cause;
};

/// Raised by the URL classifier.
class MalformedUrlError : public std::runtime_error {
 public:
  explicit MalformedUrlError(MalformedUrl detail);
  const MalformedUrl& detail() const { return detail_; }

 private:
  MalformedUrl detail_;
};

/// Raised by the document scanner; wraps the classifier failure with the element.
class ScanError : public std::runtime_error {
 public:
  explicit ScanError(ScanFailure detail);
  const ScanFailure& detail() const { return detail_; }

 private:
  ScanFailure detail_;
};

/// Raised by the tree indexer; wraps the scan failure with the file path.
class IndexError : public std::runtime_error {
 public:
  explicit IndexError(IndexFailure detail);
  const IndexFailure& detail() const { return detail_; }

 private:
  IndexFailure detail_;
};

/// Renders the self-contained message used by what() at each layer.
std::string describe(const MalformedUrl& failure);
std::string describe(const ScanFailure& failure);
std::string describe(const IndexFailure& failure);

}  // namespace linkscan
