#pragma once

#include <string>
#include <string_view>

namespace entitystore::util {

/*
  Content hashing.

  Checksum() is used for change detection on every stored document.
  DeriveId() turns a checksum into a short content-addressed identifier, so the
  same content always maps to the same id.
*/

std::string Checksum(std::string_view content);

std::string DeriveId(std::string_view checksum);

enum class IdPolicy {
  kContentAddressed,
  kRandom,
};

const char* ToString(IdPolicy policy);

// Issues an id under the given policy. `checksum` is ignored for kRandom.
std::string IssueId(IdPolicy policy, std::string_view checksum);

} // namespace entitystore::util
