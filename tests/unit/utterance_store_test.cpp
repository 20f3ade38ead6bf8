#include "internal/stores/utterance_store.hpp"

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
using entitystore::stores::Utterance;
using entitystore::stores::UtteranceField;
using entitystore::stores::UtteranceStore;
using entitystore::stores::UtteranceUpdateParams;

struct Backends {
  std::shared_ptr<db::memory::MemoryDocumentDatabase> documents = std::make_shared<db::memory::MemoryDocumentDatabase>();
  std::shared_ptr<db::memory::MemoryVectorDatabase>   vectors   = std::make_shared<db::memory::MemoryVectorDatabase>();
  std::shared_ptr<nlp::HashingEmbedder>               embedder  = std::make_shared<nlp::HashingEmbedder>(256);

  store::StoreDependencies Deps() const {
    return store::StoreDependencies{documents, vectors, embedder, true};
  }
};

void TestCreateReadRoundTrip() {
  Backends       b;
  UtteranceStore store(b.Deps());

  const std::vector<UtteranceField> fields = {UtteranceField{"name", "Customer first name", {"Ana"}}};
  const auto created = store.Create("Hi {name}, how can I help?", fields, {"hello", "hi there"}, std::nullopt, {"greeting"});

  const auto read = store.Read(created.id);
  assert(read.value == "Hi {name}, how can I help?");
  assert(read.fields == fields);
  assert(read.queries == (std::vector<std::string>{"hello", "hi there"}));
  assert(read.tags == (std::vector<std::string>{"greeting"}));
  assert(store.entities().Stats().vectors == 3);
}

void TestRandomIdsNeverDeduplicate() {
  Backends       b;
  UtteranceStore store(b.Deps());

  const auto a = store.Create("same");
  const auto c = store.Create("same");
  assert(a.id != c.id);
  assert(store.List().size() == 2);
}

void TestUpdateQueriesRegeneratesVectors() {
  Backends       b;
  UtteranceStore store(b.Deps());

  const auto created = store.Create("Thanks for waiting", {}, {"still there?"});

  UtteranceUpdateParams params;
  params.queries = std::vector<std::string>{};
  const auto updated = store.Update(created.id, params);

  assert(updated.id == created.id);
  assert(updated.value == "Thanks for waiting");
  assert(updated.queries.empty());
  assert(store.entities().Stats().vectors == 1);

  params         = UtteranceUpdateParams{};
  params.value   = "Thank you for your patience";
  const auto two = store.Update(created.id, params);
  assert(two.value == "Thank you for your patience");

  const auto hits = store.FindRelevant("patience", store.List(), 1);
  assert(hits.size() == 1 && hits[0].id == created.id);
}

void TestTagFiltersAndDelete() {
  Backends       b;
  UtteranceStore store(b.Deps());

  const auto a = store.Create("a", {}, {}, std::nullopt, {"x"});
  const auto c = store.Create("c");

  assert(store.List(std::vector<std::string>{"x"}).front().id == a.id);
  assert(store.List(std::vector<std::string>{}).front().id == c.id);

  store.Delete(a.id);
  assert(store.List(std::vector<std::string>{"x"}).empty());
  assert(store.entities().Stats().tags == 0);
}

void TestOlderRecordsGainQueries() {
  Backends b;
  assert(b.documents->UpsertMetadata("UtteranceStore_version", "0.2.0"));
  assert(b.vectors->UpsertMetadata("UtteranceStore_version", "0.2.0"));
  {
    auto         records = b.documents->GetOrCreateCollection("utterances", db::IdentityLoader());
    db::Document old;
    db::SetString(old, "id", "u1");
    db::SetString(old, "version", "0.2.0");
    db::SetString(old, "creation_utc", "2024-05-01T08:00:00+00:00");
    db::SetString(old, "checksum", "x");
    db::SetString(old, "value", "Legacy greeting");
    db::SetString(old, "fields", "[]");
    assert(records->InsertOne(old));

    auto         vectors = b.vectors->GetOrCreateCollection("utterances", b.embedder, db::IdentityLoader());
    db::Document vector;
    db::SetString(vector, "id", "v1");
    db::SetString(vector, "version", "0.2.0");
    db::SetString(vector, "utterance_id", "u1");
    db::SetString(vector, "content", "Legacy greeting");
    assert(vectors->InsertOne(vector));
  }

  UtteranceStore store(b.Deps());

  const auto legacy = store.Read("u1");
  assert(legacy.value == "Legacy greeting");
  assert(legacy.queries.empty());

  auto records = b.documents->GetOrCreateCollection("utterances", db::IdentityLoader());
  assert(db::GetString(*records->FindOne(db::Filter::Eq("id", "u1")), "queries") == std::optional<std::string>("[]"));

  auto vectors = b.vectors->GetOrCreateCollection("utterances", b.embedder, db::IdentityLoader());
  assert(db::GetString(*vectors->FindOne(db::Filter::Eq("id", "v1")), "version") == std::optional<std::string>("0.3.0"));

  const auto hits = store.FindRelevant("legacy greeting", store.List(), 1);
  assert(hits.size() == 1 && hits[0].id == "u1");

  assert(b.documents->ReadMetadata().at("UtteranceStore_version") == UtteranceStore::kVersion);
  assert(b.vectors->ReadMetadata().at("UtteranceStore_version") == UtteranceStore::kVersion);
}

void TestNewerStoreIsRejected() {
  Backends b;
  assert(b.vectors->UpsertMetadata("UtteranceStore_version", "9.0.0"));

  bool threw = false;
  try {
    UtteranceStore store(b.Deps());
  } catch (const util::ServerOutdated&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestCreateReadRoundTrip();
  TestRandomIdsNeverDeduplicate();
  TestUpdateQueriesRegeneratesVectors();
  TestTagFiltersAndDelete();
  TestOlderRecordsGainQueries();
  TestNewerStoreIsRejected();

  std::cout << "entitystore_unit_utterance_store: pass\n";
  return 0;
}
