#include "internal/util/checksum.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using namespace entitystore::util;

void TestChecksumIsStableHex() {
  assert(Checksum("") == "d41d8cd98f00b204e9800998ecf8427e");
  assert(Checksum("hello") == "5d41402abc4b2a76b9719d911017c592");
  assert(Checksum("hello") != Checksum("hello "));
}

void TestDerivedIdIsShortAndDeterministic() {
  const auto checksum = Checksum("hello");
  assert(DeriveId(checksum) == "4914e23374");
  assert(DeriveId(checksum) == DeriveId(Checksum("hello")));
  assert(DeriveId(checksum) != DeriveId(Checksum("world")));
}

void TestIssueIdFollowsPolicy() {
  const auto checksum = Checksum("same content");

  assert(IssueId(IdPolicy::kContentAddressed, checksum) == IssueId(IdPolicy::kContentAddressed, checksum));

  const auto a = IssueId(IdPolicy::kRandom, checksum);
  const auto b = IssueId(IdPolicy::kRandom, checksum);
  assert(a != b);
  assert(a.size() == 36);

  assert(std::string(ToString(IdPolicy::kContentAddressed)) == "content_addressed");
  assert(std::string(ToString(IdPolicy::kRandom)) == "random");
}

} // namespace

int main() {
  TestChecksumIsStableHex();
  TestDerivedIdIsShortAndDeterministic();
  TestIssueIdFollowsPolicy();

  std::cout << "entitystore_unit_checksum: pass\n";
  return 0;
}
