#include "version.hpp"

#include <cstdio>
#include <stdexcept>

namespace entitystore::util {

Version Version::FromString(const std::string& text) {
  Version v;
  int     consumed = 0;
  if (std::sscanf(text.c_str(), "%u.%u.%u%n", &v.major, &v.minor, &v.patch, &consumed) != 3 ||
      static_cast<std::size_t>(consumed) != text.size()) {
    throw std::invalid_argument("invalid version string: '" + text + "'");
  }
  return v;
}

std::string Version::ToString() const {
  return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

} // namespace entitystore::util
