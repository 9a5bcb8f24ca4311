#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace linkscan {

/// Names the attribute a URL was read from; classification rules differ per attribute.
enum class UrlAttribute {
  Href,
  Src,
};

/// Normalized, structural form of a classified URL.
/// MUST compare on normalized fields only so duplicate spellings collapse in sets.
/// For external URLs value holds the normalized absolute URL and path is empty.
/// For internal URLs path holds the normalized path ("/a/b.html", "../x.html", ".")
/// or is empty for fragment-only and self references.
struct UrlParts {
  bool external = false;
  std::string value;
  std::optional<std::string> path;
  std::optional<std::string> fragment;

  bool operator==(const UrlParts& other) const {
    return external == other.external && value == other.value && path == other.path &&
           fragment == other.fragment;
  }
  bool operator!=(const UrlParts& other) const { return !(*this == other); }
};

/// Classifies a raw attribute value into internal/external parts.
/// MUST be a pure function of raw and attribute and MUST NOT perform network access.
/// Throws MalformedUrlError with the raw string and the reason on failure.
/// Inputs are raw attribute strings; outputs are normalized parts with no side effects.
UrlParts classify_url(const std::string& raw, UrlAttribute attribute);

/// Shared accessors for the two URL value types.
class UrlValue {
 public:
  bool is_external() const { return parts_.external; }
  bool is_internal() const { return !parts_.external; }
  /// True for "#id" and "" which point back into the containing document.
  bool is_self_reference() const { return !parts_.external && !parts_.path.has_value(); }
  const std::optional<std::string>& path() const { return parts_.path; }
  const std::optional<std::string>& fragment() const { return parts_.fragment; }
  const std::string& raw() const { return raw_; }
  const UrlParts& parts() const { return parts_; }
  /// Normalized spelling, used in reports and as the hash input.
  std::string to_string() const;
  size_t hash() const;

 protected:
  UrlValue(std::string raw, UrlParts parts) : raw_(std::move(raw)), parts_(std::move(parts)) {}

 private:
  std::string raw_;
  UrlParts parts_;
};

/// A URL read from an href attribute.
class HrefUrl : public UrlValue {
 public:
  static HrefUrl parse(const std::string& raw);

  bool operator==(const HrefUrl& other) const { return parts() == other.parts(); }
  bool operator!=(const HrefUrl& other) const { return !(*this == other); }

 private:
  HrefUrl(std::string raw, UrlParts parts) : UrlValue(std::move(raw), std::move(parts)) {}
};

/// A URL read from a src attribute. Kept apart from HrefUrl because image
/// targets never carry meaningful fragments.
class ImgUrl : public UrlValue {
 public:
  static ImgUrl parse(const std::string& raw);

  bool operator==(const ImgUrl& other) const { return parts() == other.parts(); }
  bool operator!=(const ImgUrl& other) const { return !(*this == other); }

 private:
  ImgUrl(std::string raw, UrlParts parts) : UrlValue(std::move(raw), std::move(parts)) {}
};

}  // namespace linkscan

namespace std {

template <>
struct hash<linkscan::HrefUrl> {
  size_t operator()(const linkscan::HrefUrl& url) const { return url.hash(); }
};

template <>
struct hash<linkscan::ImgUrl> {
  size_t operator()(const linkscan::ImgUrl& url) const { return url.hash(); }
};

}  // namespace std
