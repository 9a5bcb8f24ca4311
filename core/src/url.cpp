#include "linkscan/url.h"

#include <cctype>
#include <vector>

#include "linkscan/errors.h"
#include "util/string_util.h"

namespace linkscan {

namespace {

[[noreturn]] void reject(const std::string& raw, const std::string& reason) {
  throw MalformedUrlError(MalformedUrl{raw, reason});
}

bool is_valid_scheme(const std::string& scheme) {
  if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme[0]))) return false;
  for (char c : scheme) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
      return false;
    }
  }
  return true;
}

bool requires_authority(const std::string& scheme) {
  return scheme == "http" || scheme == "https" || scheme == "ftp" || scheme == "ws" ||
         scheme == "wss";
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string percent_decode(const std::string& raw, const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    if (text[i] != '%') {
      out.push_back(text[i]);
      continue;
    }
    if (i + 2 >= text.size()) {
      reject(raw, "invalid percent-encoding");
    }
    int hi = hex_value(text[i + 1]);
    int lo = hex_value(text[i + 2]);
    if (hi < 0 || lo < 0) {
      reject(raw, "invalid percent-encoding");
    }
    out.push_back(static_cast<char>(hi * 16 + lo));
    i += 2;
  }
  return out;
}

/// Splits "scheme://authority/rest" and lowercases the scheme and host.
std::string normalize_external(const std::string& raw,
                               const std::string& url,
                               const std::string& scheme) {
  std::string rest = url.substr(scheme.size() + 1);
  std::string lowered_scheme = util::to_lower(scheme);
  if (rest.rfind("//", 0) != 0) {
    if (requires_authority(lowered_scheme)) {
      reject(raw, "missing host for scheme '" + lowered_scheme + "'");
    }
    return lowered_scheme + ":" + rest;
  }
  size_t host_end = rest.find_first_of("/?#", 2);
  std::string authority = rest.substr(2, host_end == std::string::npos ? std::string::npos
                                                                        : host_end - 2);
  if (authority.empty() && requires_authority(lowered_scheme)) {
    reject(raw, "missing host for scheme '" + lowered_scheme + "'");
  }
  std::string tail = host_end == std::string::npos ? "" : rest.substr(host_end);
  return lowered_scheme + "://" + util::to_lower(authority) + tail;
}

std::string normalize_path(const std::string& raw, const std::string& path) {
  const bool absolute = !path.empty() && path[0] == '/';
  std::vector<std::string> segments;
  size_t start = 0;
  while (start <= path.size()) {
    size_t end = path.find('/', start);
    if (end == std::string::npos) end = path.size();
    std::string segment = percent_decode(raw, path.substr(start, end - start));
    start = end + 1;
    if (segment.empty() || segment == ".") continue;
    if (segment == "..") {
      if (!segments.empty() && segments.back() != "..") {
        segments.pop_back();
      } else if (absolute) {
        reject(raw, "path escapes the site root");
      } else {
        segments.push_back(segment);
      }
      continue;
    }
    segments.push_back(segment);
  }

  std::string out = absolute ? "/" : "";
  for (size_t i = 0; i < segments.size(); ++i) {
    if (i != 0) out.push_back('/');
    out += segments[i];
  }
  if (out.empty()) out = ".";
  return out;
}

}  // namespace

UrlParts classify_url(const std::string& raw, UrlAttribute attribute) {
  const std::string url = util::trim_ws(raw);
  for (char c : url) {
    if (std::iscntrl(static_cast<unsigned char>(c))) {
      reject(raw, "contains control characters");
    }
    if (c == ' ') {
      reject(raw, "contains whitespace");
    }
  }

  UrlParts parts;
  size_t delimiter = url.find_first_of(":/?#");
  if (delimiter != std::string::npos && url[delimiter] == ':') {
    std::string scheme = url.substr(0, delimiter);
    if (!is_valid_scheme(scheme)) {
      reject(raw, scheme.empty() ? "missing scheme" : "invalid scheme '" + scheme + "'");
    }
    parts.external = true;
    parts.value = normalize_external(raw, url, scheme);
  } else if (url.rfind("//", 0) == 0) {
    size_t host_end = url.find_first_of("/?#", 2);
    std::string host = url.substr(2, host_end == std::string::npos ? std::string::npos
                                                                   : host_end - 2);
    if (host.empty()) {
      reject(raw, "missing host in protocol-relative URL");
    }
    parts.external = true;
    parts.value = "//" + util::to_lower(host) +
                  (host_end == std::string::npos ? "" : url.substr(host_end));
  }

  if (parts.external) {
    size_t hash = parts.value.find('#');
    if (hash != std::string::npos && hash + 1 < parts.value.size()) {
      parts.fragment = parts.value.substr(hash + 1);
    }
    return parts;
  }

  std::string path = url;
  size_t hash = path.find('#');
  if (hash != std::string::npos) {
    std::string fragment = percent_decode(raw, path.substr(hash + 1));
    if (!fragment.empty()) parts.fragment = fragment;
    path = path.substr(0, hash);
  }
  size_t query = path.find('?');
  if (query != std::string::npos) {
    path = path.substr(0, query);
  }
  if (!path.empty()) {
    parts.path = normalize_path(raw, path);
  }

  if (attribute == UrlAttribute::Src && !parts.path.has_value()) {
    reject(raw, parts.fragment.has_value() ? "fragment-only reference is not an image source"
                                           : "empty image source");
  }
  return parts;
}

std::string UrlValue::to_string() const {
  if (parts_.external) return parts_.value;
  std::string out = parts_.path.value_or("");
  if (parts_.fragment.has_value()) {
    out += "#" + *parts_.fragment;
  }
  return out;
}

size_t UrlValue::hash() const {
  return std::hash<std::string>()((parts_.external ? "E:" : "I:") + to_string());
}

HrefUrl HrefUrl::parse(const std::string& raw) {
  return HrefUrl(raw, classify_url(raw, UrlAttribute::Href));
}

ImgUrl ImgUrl::parse(const std::string& raw) {
  return ImgUrl(raw, classify_url(raw, UrlAttribute::Src));
}

}  // namespace linkscan
