#include "internal/tags/association_index.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/db/memory/memory_document_database.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace entitystore;
using entitystore::db::memory::MemoryDocumentDatabase;
using entitystore::tags::AssociationIndex;
using entitystore::tags::AssociationOptions;
using entitystore::tags::EntitySelection;

AssociationOptions TagOptions(util::IdPolicy policy = util::IdPolicy::kRandom) {
  AssociationOptions options;
  options.owner_field = "thing_id";
  options.value_field = "tag_id";
  options.version     = "0.4.0";
  options.id_policy   = policy;
  return options;
}

void TestUpsertIsIdempotentPerPair() {
  MemoryDocumentDatabase db;
  AssociationIndex       index(db.GetOrCreateCollection("thing_tags", db::IdentityLoader()), TagOptions());

  assert(index.Upsert("e1", "t1"));
  assert(!index.Upsert("e1", "t1"));
  assert(index.Upsert("e1", "t2"));
  assert(index.Upsert("e2", "t1"));

  assert(index.All().size() == 3);
  assert(index.ListForEntity("e1") == (std::vector<std::string>{"t1", "t2"}));
  assert(index.ListForEntity("nobody").empty());

  const auto doc = index.All().front();
  assert(db::GetString(doc, db::kVersionField) == std::optional<std::string>("0.4.0"));
  assert(db::Has(doc, "creation_utc"));
  assert(index.CollectionName() == "thing_tags");
}

void TestContentAddressedAssociationIds() {
  MemoryDocumentDatabase db;
  AssociationIndex index(db.GetOrCreateCollection("thing_tags", db::IdentityLoader()),
                         TagOptions(util::IdPolicy::kContentAddressed));

  assert(index.Upsert("e1", "t1"));
  const auto id = db::DocumentId(index.All().front());
  assert(id == util::DeriveId(util::Checksum("e1\nt1")));

  index.Remove("e1", "t1");
  assert(index.Upsert("e1", "t1"));
  assert(db::DocumentId(index.All().front()) == id);
}

void TestRemoveSemantics() {
  MemoryDocumentDatabase db;
  AssociationIndex       index(db.GetOrCreateCollection("thing_tags", db::IdentityLoader()), TagOptions());

  assert(index.Upsert("e1", "t1"));
  assert(index.Upsert("e1", "t2"));
  assert(index.Upsert("e2", "t2"));

  index.Remove("e1", "t1");
  assert(index.ListForEntity("e1") == (std::vector<std::string>{"t2"}));

  bool threw = false;
  try {
    index.Remove("e1", "t1");
  } catch (const util::NotFound&) {
    threw = true;
  }
  assert(threw);

  assert(!index.RemoveIfPresent("e1", "t1"));
  assert(index.RemoveAllFor("e1") == 1);
  assert(index.RemoveAllFor("e1") == 0);
  assert(index.ListAllEntities() == (std::set<std::string>{"e2"}));

  const auto remaining = db::DocumentId(index.All().front());
  assert(index.RemoveDocument(remaining));
  assert(!index.RemoveDocument(remaining));
  assert(index.All().empty());
}

void TestEntityQueries() {
  MemoryDocumentDatabase db;
  AssociationIndex       index(db.GetOrCreateCollection("thing_tags", db::IdentityLoader()), TagOptions());

  assert(index.Upsert("e1", "red"));
  assert(index.Upsert("e2", "blue"));
  assert(index.Upsert("e3", "red"));
  assert(index.Upsert("e3", "blue"));

  assert(index.ListEntitiesFor({"red"}) == (std::set<std::string>{"e1", "e3"}));
  assert(index.ListEntitiesFor({"red", "blue"}) == (std::set<std::string>{"e1", "e2", "e3"}));
  assert(index.ListEntitiesFor({"green"}).empty());
  assert(index.ListEntitiesFor({}).empty());
  assert(index.ListAllEntities() == (std::set<std::string>{"e1", "e2", "e3"}));
}

void TestResolveSelection() {
  MemoryDocumentDatabase db;
  AssociationIndex       index(db.GetOrCreateCollection("thing_tags", db::IdentityLoader()), TagOptions());

  assert(index.Upsert("e1", "red"));
  assert(index.Upsert("e2", "blue"));

  auto all = index.ResolveSelection(std::nullopt);
  assert(all.kind == EntitySelection::Kind::kAll);

  auto untagged = index.ResolveSelection(std::vector<std::string>{});
  assert(untagged.kind == EntitySelection::Kind::kExclude);
  assert(untagged.ids == (std::set<std::string>{"e1", "e2"}));

  auto red = index.ResolveSelection(std::vector<std::string>{"red"});
  assert(red.kind == EntitySelection::Kind::kInclude);
  assert(red.ids == (std::set<std::string>{"e1"}));

  auto none = index.ResolveSelection(std::vector<std::string>{"green"});
  assert(none.kind == EntitySelection::Kind::kInclude);
  assert(none.ids.empty());
}

} // namespace

int main() {
  TestUpsertIsIdempotentPerPair();
  TestContentAddressedAssociationIds();
  TestRemoveSemantics();
  TestEntityQueries();
  TestResolveSelection();

  std::cout << "entitystore_unit_association_index: pass\n";
  return 0;
}
