#pragma once

#include <compare>
#include <cstdint>
#include <string>

namespace entitystore::util {

/*
  Semantic schema version ("major.minor.patch").

  Stored documents and store metadata carry the string form.
*/
struct Version {
  uint32_t major = 0;
  uint32_t minor = 0;
  uint32_t patch = 0;

  static Version FromString(const std::string& text);
  std::string    ToString() const;

  auto operator<=>(const Version&) const = default;
};

} // namespace entitystore::util
