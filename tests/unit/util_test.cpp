#include <cassert>
#include <chrono>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>

#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "internal/util/version.hpp"

namespace {

using namespace entitystore::util;

void TestUuidStringRoundTrip() {
  const auto id   = GenerateUUID();
  const auto text = ToString(id);

  assert(text.size() == 36);
  assert(text[8] == '-' && text[13] == '-' && text[18] == '-' && text[23] == '-');
  assert(text[14] == '4');
  assert(FromString(text) == id);
}

void TestGeneratedIdsAreDistinct() {
  std::set<std::string> ids;
  for (int i = 0; i < 256; ++i) {
    ids.insert(GenerateId());
  }
  assert(ids.size() == 256);
}

void TestVersionParsingAndOrdering() {
  const auto v = Version::FromString("0.12.3");
  assert(v.major == 0 && v.minor == 12 && v.patch == 3);
  assert(v.ToString() == "0.12.3");

  assert(Version::FromString("0.2.0") < Version::FromString("0.3.0"));
  assert(Version::FromString("0.10.0") > Version::FromString("0.9.9"));
  assert(Version::FromString("1.0.0") == (Version{1, 0, 0}));
}

void TestVersionRejectsMalformedInput() {
  for (const char* bad : {"", "1", "1.2", "1.2.3.4", "a.b.c", "1.2.3x"}) {
    bool threw = false;
    try {
      (void)Version::FromString(bad);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestIsoTimeRoundTrip() {
  const auto now       = std::chrono::time_point_cast<std::chrono::microseconds>(Now());
  const auto formatted = ToIsoString(now);
  assert(formatted.size() == std::string("2025-03-01T10:15:30.000120+00:00").size());
  assert(FromIsoString(formatted) == now);
}

void TestIsoTimeAcceptedForms() {
  const auto base = FromIsoString("2025-03-01T10:15:30+00:00");
  assert(FromIsoString("2025-03-01T10:15:30Z") == base);
  assert(FromIsoString("2025-03-01T10:15:30") == base);
  assert(FromIsoString("2025-03-01T12:15:30+02:00") == base);
  assert(FromIsoString("2025-03-01T10:15:30.5Z") == base + std::chrono::milliseconds(500));
  assert(ToIsoString(base) == "2025-03-01T10:15:30.000000+00:00");
  assert(ToUnixMillis(base) == 1740824130000ULL);

  bool threw = false;
  try {
    (void)FromIsoString("yesterday");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestUuidStringRoundTrip();
  TestGeneratedIdsAreDistinct();
  TestVersionParsingAndOrdering();
  TestVersionRejectsMalformedInput();
  TestIsoTimeRoundTrip();
  TestIsoTimeAcceptedForms();

  std::cout << "entitystore_unit_util: pass\n";
  return 0;
}
