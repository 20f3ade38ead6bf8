#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace entitystore::util {

/*
  UUID helpers

  Random identifiers are RFC4122 version 4 UUIDs in canonical string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Random entity/document identifier.
std::string GenerateId();

} // namespace entitystore::util
