#pragma once

#include <string>

namespace multisplit {

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_LABEL = "alpha";

// Saved layouts carry their own version; readers accept any minor of the same major
constexpr int LAYOUT_FORMAT_MAJOR = 1;
constexpr const char* kLayoutFormatVersion = "1.0.0";

inline std::string get_version_string() {
  std::string version = std::to_string(VERSION_MAJOR) + "." + std::to_string(VERSION_MINOR) + "." +
                        std::to_string(VERSION_PATCH);
  if (VERSION_LABEL[0] != '\0') {
    version += "-";
    version += VERSION_LABEL;
  }
  return version;
}

// True when a "major.minor.patch" string shares our layout major version
inline bool is_compatible_layout_version(const std::string& version) {
  auto dot = version.find('.');
  std::string major = version.substr(0, dot);
  if (major.empty() || major.size() > 6 || major.find_first_not_of("0123456789") != std::string::npos) {
    return false;
  }
  return std::stoi(major) == LAYOUT_FORMAT_MAJOR;
}

} // namespace multisplit
