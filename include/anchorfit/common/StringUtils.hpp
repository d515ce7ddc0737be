#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace anchorfit::common {

inline std::string toLowerCopy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

inline std::string toUpperCopy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return value;
}

inline std::string trimCopy(const std::string& value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return {};
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

// Splits on any of the given delimiter characters, dropping empty fields.
inline std::vector<std::string> splitAny(const std::string& value, const std::string& delims) {
  std::vector<std::string> out;
  std::string field;
  for (char c : value) {
    if (delims.find(c) != std::string::npos) {
      if (!field.empty()) out.push_back(field);
      field.clear();
    } else {
      field.push_back(c);
    }
  }
  if (!field.empty()) out.push_back(field);
  return out;
}

}  // namespace anchorfit::common
