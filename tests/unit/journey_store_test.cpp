#include "internal/stores/journey_store.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/collection_loader.hpp"
#include "internal/db/memory/memory_document_database.hpp"
#include "internal/db/memory/memory_vector_database.hpp"
#include "internal/nlp/hashing_embedder.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace entitystore;
using entitystore::stores::Journey;
using entitystore::stores::JourneyStore;
using entitystore::stores::JourneyUpdateParams;

struct Backends {
  std::shared_ptr<db::memory::MemoryDocumentDatabase> documents = std::make_shared<db::memory::MemoryDocumentDatabase>();
  std::shared_ptr<db::memory::MemoryVectorDatabase>   vectors   = std::make_shared<db::memory::MemoryVectorDatabase>();
  std::shared_ptr<nlp::HashingEmbedder>               embedder  = std::make_shared<nlp::HashingEmbedder>(256);

  store::StoreDependencies Deps() const {
    return store::StoreDependencies{documents, vectors, embedder, true};
  }
};

std::vector<std::string> VectorContents(Backends& b, const std::string& journey_id) {
  auto                     vectors = b.vectors->GetOrCreateCollection("journeys", b.embedder, db::IdentityLoader());
  std::vector<std::string> out;
  for (const auto& doc : vectors->Find(db::Filter::Eq("journey_id", journey_id))) {
    out.push_back(db::RequireString(doc, "content"));
  }
  return out;
}

std::vector<std::string> Sorted(std::vector<std::string> v) {
  std::sort(v.begin(), v.end());
  return v;
}

void TestAssembleContent() {
  assert(JourneyStore::AssembleContent("Onboarding", "Welcome flow", {"new user", "first login"}) ==
         "Onboarding\nWelcome flow\nConditions: new user, first login");
  assert(JourneyStore::AssembleContent("T", "D", {}) == "T\nD\nConditions: ");
}

void TestCreateEmbedsCombinedText() {
  Backends     b;
  JourneyStore store(b.Deps());

  const auto j = store.Create("Refund flow", "Guide the customer through a refund", {"asks for refund"}, std::nullopt,
                              {"billing"});
  assert(j.conditions == (std::vector<std::string>{"asks for refund"}));
  assert(j.tags == (std::vector<std::string>{"billing"}));

  assert(VectorContents(b, j.id) ==
         (std::vector<std::string>{"Refund flow\nGuide the customer through a refund\nConditions: asks for refund"}));

  const auto read = store.Read(j.id);
  assert(read.title == "Refund flow");
  assert(read.description == "Guide the customer through a refund");
  assert(read.conditions == j.conditions);
}

void TestConditionsReembed() {
  Backends     b;
  JourneyStore store(b.Deps());

  const auto j = store.Create("Onboarding", "Welcome flow", {});

  assert(store.AddCondition(j.id, "new user"));
  assert(!store.AddCondition(j.id, "new user"));
  assert(VectorContents(b, j.id) == (std::vector<std::string>{"Onboarding\nWelcome flow\nConditions: new user"}));

  assert(store.RemoveCondition(j.id, "new user"));
  assert(!store.RemoveCondition(j.id, "new user"));
  assert(VectorContents(b, j.id) == (std::vector<std::string>{"Onboarding\nWelcome flow\nConditions: "}));

  bool threw = false;
  try {
    (void)store.AddCondition("missing", "x");
  } catch (const util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestListIntersectsTagsAndCondition() {
  Backends     b;
  JourneyStore store(b.Deps());

  const auto a = store.Create("A", "first", {"c1"}, std::nullopt, {"t1"});
  const auto c = store.Create("C", "second", {"c1", "c2"});
  const auto d = store.Create("D", "third", {"c2"}, std::nullopt, {"t1"});

  auto ids = [](const std::vector<Journey>& journeys) {
    std::vector<std::string> out;
    for (const auto& j : journeys) out.push_back(j.id);
    std::sort(out.begin(), out.end());
    return out;
  };

  assert(ids(store.List()) == Sorted({a.id, c.id, d.id}));
  assert(ids(store.List(std::nullopt, std::string("c1"))) == Sorted({a.id, c.id}));
  assert(ids(store.List(std::vector<std::string>{"t1"}, std::string("c2"))) == (std::vector<std::string>{d.id}));
  assert(ids(store.List(std::vector<std::string>{}, std::string("c1"))) == (std::vector<std::string>{c.id}));
  assert(store.List(std::nullopt, std::string("none")).empty());
}

void TestUpdateKeepsConditionsAndReembeds() {
  Backends     b;
  JourneyStore store(b.Deps());

  const auto j = store.Create("Old title", "Same description", {"cond"}, std::nullopt, {"t"});

  JourneyUpdateParams params;
  params.title       = "New title";
  const auto updated = store.Update(j.id, params);

  assert(updated.id == j.id);
  assert(updated.title == "New title");
  assert(updated.description == "Same description");
  assert(updated.conditions == (std::vector<std::string>{"cond"}));
  assert(updated.tags == (std::vector<std::string>{"t"}));
  assert(VectorContents(b, j.id) == (std::vector<std::string>{"New title\nSame description\nConditions: cond"}));
}

void TestDeleteCascadesConditions() {
  Backends     b;
  JourneyStore store(b.Deps());

  const auto j = store.Create("Gone", "soon", {"c1", "c2"}, std::nullopt, {"t"});
  store.Delete(j.id);

  const auto stats = store.entities().Stats();
  assert(stats.records == 0);
  assert(stats.vectors == 0);
  assert(stats.tags == 0);
  assert(stats.associations.at(JourneyStore::kConditions) == 0);
}

void TestFindRelevantDefaultsToFive() {
  Backends     b;
  JourneyStore store(b.Deps());

  std::vector<std::string> ids;
  for (int i = 0; i < 7; ++i) {
    ids.push_back(store.Create("Journey " + std::to_string(i), "order help step " + std::to_string(i), {}).id);
  }
  const auto target = store.Create("Password reset", "Help the customer reset a forgotten password", {"locked out"});

  const auto all = store.List();
  assert(all.size() == 8);

  const auto top = store.FindRelevant("reset forgotten password", all);
  assert(top.size() == JourneyStore::kDefaultMaxJourneys);
  assert(top.front().id == target.id);

  const auto by_condition = store.FindRelevant("locked out", all, 1);
  assert(by_condition.size() == 1 && by_condition[0].id == target.id);
}

} // namespace

int main() {
  TestAssembleContent();
  TestCreateEmbedsCombinedText();
  TestConditionsReembed();
  TestListIntersectsTagsAndCondition();
  TestUpdateKeepsConditionsAndReembeds();
  TestDeleteCascadesConditions();
  TestFindRelevantDefaultsToFive();

  std::cout << "entitystore_unit_journey_store: pass\n";
  return 0;
}
