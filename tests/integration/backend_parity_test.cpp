#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/collection_loader.hpp"
#include "internal/db/memory/memory_document_database.hpp"
#include "internal/db/memory/memory_vector_database.hpp"
#include "internal/nlp/hashing_embedder.hpp"
#include "internal/stores/canned_response_store.hpp"
#include "internal/stores/journey_store.hpp"
#include "internal/util/errors.hpp"

#if ENTITYSTORE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_document_database.hpp"
#include "internal/db/sqlite/sqlite_vector_database.hpp"
#endif

namespace {

using namespace entitystore;
using entitystore::stores::CannedResponseStore;
using entitystore::stores::JourneyStore;

struct BackendFactory {
  std::string                                     name;
  std::function<store::StoreDependencies()>       make_deps;
  std::function<void(store::StoreDependencies&)>  restart;
  std::function<void()>                           cleanup;
};

std::shared_ptr<const nlp::Embedder> TestEmbedder() {
  return std::make_shared<nlp::HashingEmbedder>(128);
}

std::vector<std::string> Sorted(std::vector<std::string> v) {
  std::sort(v.begin(), v.end());
  return v;
}

db::Document Doc(const std::string& id, const std::string& content) {
  db::Document doc;
  db::SetString(doc, db::kIdField, id);
  db::SetString(doc, db::kVersionField, "1.0.0");
  db::SetString(doc, "owner", "o-" + id);
  db::SetString(doc, db::kContentField, content);
  return doc;
}

void VerifyCollectionSemantics(store::StoreDependencies& deps, const std::string& prefix) {
  auto c = deps.document_db->GetOrCreateCollection(prefix + "_plain", db::IdentityLoader());

  assert(c->InsertOne(Doc("a", "alpha")));
  assert(c->InsertOne(Doc("b", "beta")));
  assert(c->InsertOne(Doc("c", "gamma")));
  assert(c->InsertOne(Doc("a", "again")).code == db::ErrorCode::AlreadyExists);

  auto ordered = c->Find(db::Filter::All());
  assert(ordered.size() == 3);
  assert(db::DocumentId(ordered[0]) == "a" && db::DocumentId(ordered[2]) == "c");

  assert(c->Find(db::Filter::Ne(db::kIdField, "b")).size() == 2);
  assert(c->Find(db::Filter::In("owner", {"o-a", "o-c"})).size() == 2);
  assert(c->Find(db::Filter::Or({})).empty());

  db::Document patch;
  db::SetString(patch, db::kContentField, "ALPHA");
  auto updated = c->UpdateOne(db::Filter::Eq(db::kIdField, "a"), patch);
  assert(updated.matched_count == 1);
  assert(db::GetString(*updated.updated_document, "owner") == std::optional<std::string>("o-a"));

  // updates keep insertion order
  assert(db::DocumentId(c->Find(db::Filter::All()).front()) == "a");

  auto upserted = c->UpdateOne(db::Filter::Eq(db::kIdField, "d"), Doc("d", "delta"), true);
  assert(upserted.matched_count == 0 && upserted.updated_document);
  assert(c->Count() == 4);

  assert(c->DeleteOne(db::Filter::Eq(db::kIdField, "b")).deleted_count == 1);
  assert(c->DeleteOne(db::Filter::Eq(db::kIdField, "b")).deleted_count == 0);
  assert(c->Count() == 3);

  const auto names = deps.document_db->ListCollections();
  assert(std::find(names.begin(), names.end(), prefix + "_plain") != names.end());

  assert(deps.document_db->CountDocuments(prefix + "_plain") == 3);
  assert(deps.document_db->CountDocuments(prefix + "_never_opened") == 0);
  assert(deps.vector_db->CountDocuments(prefix + "_never_opened") == 0);
}

void VerifySimilarityOrdering(store::StoreDependencies& deps, const std::string& prefix) {
  auto v = deps.vector_db->GetOrCreateCollection(prefix + "_vectors", deps.embedder, db::IdentityLoader());

  assert(v->InsertOne(Doc("v1", "refund my order")));
  assert(v->InsertOne(Doc("v2", "track my parcel")));
  assert(v->InsertOne(Doc("v3", "refund my order")));

  auto hits = v->FindSimilarDocuments(db::Filter::All(), "refund my order", 3);
  assert(hits.size() == 3);
  // equal distances fall back to id order
  assert(db::DocumentId(hits[0].document) == "v1");
  assert(db::DocumentId(hits[1].document) == "v3");
  assert(db::DocumentId(hits[2].document) == "v2");
  assert(hits[0].distance < 1e-6);

  auto filtered = v->FindSimilarDocuments(db::Filter::Eq("owner", "o-v2"), "refund my order", 3);
  assert(filtered.size() == 1 && db::DocumentId(filtered[0].document) == "v2");
}

void VerifyStoreLifecycle(store::StoreDependencies& deps) {
  CannedResponseStore responses(deps);
  JourneyStore        journeys(deps);

  const auto r1 = responses.Create("Your order has shipped", {}, {"where is my order"}, std::nullopt, {"shipping"});
  const auto r2 = responses.Create("Your refund is on the way", {}, {"money back"});
  assert(responses.Create("Your order has shipped").id == r1.id);

  const auto shipping = responses.List(std::vector<std::string>{"shipping"});
  assert(shipping.size() == 1 && shipping[0].id == r1.id);
  assert(responses.List(std::vector<std::string>{}).front().id == r2.id);

  const auto top = responses.FindRelevant("where is my order", responses.List(), 1);
  assert(top.size() == 1 && top[0].id == r1.id);

  const auto j = journeys.Create("Returns", "Handle product returns", {"wants to return"}, std::nullopt, {"support"});
  assert(journeys.AddCondition(j.id, "damaged item"));
  assert(journeys.List(std::nullopt, std::string("damaged item")).size() == 1);

  stores::JourneyUpdateParams params;
  params.description = "Handle returns and exchanges";
  assert(journeys.Update(j.id, params).description == "Handle returns and exchanges");

  responses.Delete(r2.id);
  bool threw = false;
  try {
    (void)responses.Read(r2.id);
  } catch (const util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void VerifyRestartDurability(BackendFactory& backend, store::StoreDependencies& deps) {
  std::string response_id;
  std::string journey_id;
  {
    CannedResponseStore responses(deps);
    JourneyStore        journeys(deps);
    response_id = responses.List(std::vector<std::string>{"shipping"}).front().id;
    journey_id  = journeys.List(std::vector<std::string>{"support"}).front().id;
  }

  backend.restart(deps);

  CannedResponseStore responses(deps);
  JourneyStore        journeys(deps);

  const auto response = responses.Read(response_id);
  assert(response.value == "Your order has shipped");
  assert(response.signals == (std::vector<std::string>{"where is my order"}));
  assert(response.tags == (std::vector<std::string>{"shipping"}));
  assert(responses.List().size() == 1);

  const auto journey = journeys.Read(journey_id);
  assert(journey.description == "Handle returns and exchanges");
  assert(Sorted(journey.conditions) == (std::vector<std::string>{"damaged item", "wants to return"}));

  const auto hits = journeys.FindRelevant("my item arrived damaged", journeys.List(), 1);
  assert(hits.size() == 1 && hits[0].id == journey_id);

  const auto stats = responses.entities().Stats();
  assert(stats.records == 1 && stats.vectors == 2 && stats.tags == 1);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name = "memory",
      .make_deps =
          []() {
            return store::StoreDependencies{std::make_shared<db::memory::MemoryDocumentDatabase>(),
                                            std::make_shared<db::memory::MemoryVectorDatabase>(), TestEmbedder(), true};
          },
      // contents live as long as the database objects
      .restart = [](store::StoreDependencies&) {},
      .cleanup = []() {},
  };
}

#if ENTITYSTORE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  const auto stamp = std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
  const auto dir   = std::filesystem::temp_directory_path() / ("entitystore_parity_" + stamp);
  std::filesystem::create_directories(dir);

  const auto documents = (dir / "documents.sqlite").string();
  const auto vectors   = (dir / "vectors.sqlite").string();

  auto make_deps = [documents, vectors]() {
    return store::StoreDependencies{
        std::make_shared<db::sqlite::SqliteDocumentDatabase>(std::make_shared<db::sqlite::SqliteDB>(documents)),
        std::make_shared<db::sqlite::SqliteVectorDatabase>(std::make_shared<db::sqlite::SqliteDB>(vectors)),
        TestEmbedder(), true};
  };

  return BackendFactory{
      .name      = "sqlite",
      .make_deps = make_deps,
      .restart   = [make_deps](store::StoreDependencies& deps) { deps = make_deps(); },
      .cleanup   = [dir]() { std::filesystem::remove_all(dir); },
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto deps = backend.make_deps();

  VerifyCollectionSemantics(deps, backend.name);
  VerifySimilarityOrdering(deps, backend.name);
  VerifyStoreLifecycle(deps);
  VerifyRestartDurability(backend, deps);

  deps = store::StoreDependencies{};
  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if ENTITYSTORE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "entitystore_integration_backend_parity: pass\n";
  return 0;
}
