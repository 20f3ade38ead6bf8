#include "cmd/entitystorectl/commands.hpp"

#include <cassert>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace entitystore;

factory::Application MemoryApplication() {
  runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_memory();
  config.mutable_embedder()->mutable_hashing()->set_dimensions(128);
  return factory::Build(config);
}

std::size_t Lines(const std::string& text) {
  std::size_t n = 0;
  for (char ch : text) n += ch == '\n';
  return n;
}

void TestTagSelectionParsing() {
  assert(!ctl::ParseTagSelection({}).has_value());
  assert(ctl::ParseTagSelection({"--untagged"}) == std::vector<std::string>{});
  assert(ctl::ParseTagSelection({"a", "b"}) == (std::vector<std::string>{"a", "b"}));

  bool threw = false;
  try {
    (void)ctl::ParseTagSelection({"a", "--untagged"});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestListSelectsByTags() {
  auto app = MemoryApplication();

  const auto tagged   = app.utterances->Create("Your parcel is on its way", {}, {}, std::nullopt, {"shipping"});
  const auto untagged = app.utterances->Create("Hello there");

  std::ostringstream out, err;
  assert(ctl::RunList(app, {"utterances"}, out, err) == 0);
  assert(Lines(out.str()) == 2);

  out.str("");
  assert(ctl::RunList(app, {"utterances", "--untagged"}, out, err) == 0);
  assert(Lines(out.str()) == 1);
  assert(out.str().rfind(untagged.id + "\t", 0) == 0);

  out.str("");
  assert(ctl::RunList(app, {"utterances", "shipping"}, out, err) == 0);
  assert(Lines(out.str()) == 1);
  assert(out.str().rfind(tagged.id + "\t", 0) == 0);
  assert(out.str().find("tags=shipping") != std::string::npos);

  out.str("");
  assert(ctl::RunList(app, {"utterances", "shipping", "--untagged"}, out, err) == 1);
  assert(out.str().empty());
  assert(ctl::RunList(app, {"nonsense"}, out, err) == 1);
  assert(err.str().find("unknown store: nonsense") != std::string::npos);
}

void TestSearchAndStats() {
  auto app = MemoryApplication();
  (void)app.utterances->Create("Your refund has been issued");
  const auto parcel = app.utterances->Create("Your parcel is on its way");

  std::ostringstream out, err;
  assert(ctl::RunSearch(app, {"utterances", "1", "where", "is", "my", "parcel"}, out, err) == 0);
  assert(Lines(out.str()) == 1);
  assert(out.str().rfind(parcel.id + "\t", 0) == 0);

  assert(ctl::RunSearch(app, {"utterances", "-1", "parcel"}, out, err) == 1);
  assert(ctl::RunSearch(app, {"utterances", "x", "parcel"}, out, err) == 1);

  out.str("");
  assert(ctl::RunStats(app, out) == 0);
  assert(out.str().find("utterances: records=2 vectors=2 tags=0") != std::string::npos);
}

} // namespace

int main() {
  TestTagSelectionParsing();
  TestListSelectsByTags();
  TestSearchAndStats();

  std::cout << "entitystore_unit_entitystorectl_commands: pass\n";
  return 0;
}
