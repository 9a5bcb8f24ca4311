#include "string_util.h"

#include <cctype>

namespace linkscan::util {

std::string to_lower(const std::string& s) {
  std::string out = s;
  for (char& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

std::string trim_ws(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
    ++start;
  }
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  return s.substr(start, end - start);
}

std::vector<std::string> split_trimmed(const std::string& s, char delimiter) {
  std::vector<std::string> out;
  size_t start = 0;
  while (true) {
    size_t end = s.find(delimiter, start);
    if (end == std::string::npos) {
      out.push_back(trim_ws(s.substr(start)));
      break;
    }
    out.push_back(trim_ws(s.substr(start, end - start)));
    start = end + 1;
  }
  return out;
}

bool ends_with_icase(const std::string& s, const std::string& suffix) {
  if (s.size() < suffix.size()) return false;
  return to_lower(s.substr(s.size() - suffix.size())) == to_lower(suffix);
}

}  // namespace linkscan::util
