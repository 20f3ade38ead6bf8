#include "internal/search/relevance_search.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_vector_database.hpp"
#include "internal/nlp/hashing_embedder.hpp"

namespace {

using namespace entitystore;
using entitystore::db::memory::MemoryVectorDatabase;

db::Document VectorDoc(const std::string& id, const std::string& owner, const std::string& content) {
  db::Document doc;
  db::SetString(doc, db::kIdField, id);
  db::SetString(doc, db::kVersionField, "0.1.0");
  db::SetString(doc, "owner_id", owner);
  db::SetString(doc, db::kContentField, content);
  return doc;
}

db::SimilarDocument Hit(const std::string& owner, double distance) {
  db::Document doc;
  db::SetString(doc, "owner_id", owner);
  return db::SimilarDocument{doc, distance};
}

void TestMinVectorsForMaxItemCount() {
  assert(search::MinVectorsForMaxItemCount({3, 1, 2}, 2) == 3);
  assert(search::MinVectorsForMaxItemCount({3, 1, 2}, 5) == 6);
  assert(search::MinVectorsForMaxItemCount({3, 1, 2}, 0) == 0);
  assert(search::MinVectorsForMaxItemCount({}, 3) == 0);
}

void TestMergeByOwnerKeepsBestDistance() {
  const std::vector<db::SimilarDocument> hits = {Hit("a", 0.5), Hit("b", 0.3), Hit("a", 0.1), Hit("c", 0.3),
                                                 Hit("b", 0.9)};

  auto ranked = search::MergeByOwner(hits, "owner_id", 10);
  assert(ranked.size() == 3);
  assert(ranked[0].id == "a" && ranked[0].distance == 0.1);
  // tie broken by id
  assert(ranked[1].id == "b" && ranked[1].distance == 0.3);
  assert(ranked[2].id == "c");

  auto truncated = search::MergeByOwner(hits, "owner_id", 1);
  assert(truncated.size() == 1 && truncated[0].id == "a");
}

void TestEmptyInputsShortCircuit() {
  MemoryVectorDatabase db;
  auto                 embedder = std::make_shared<nlp::HashingEmbedder>(128);
  auto                 vectors  = db.GetOrCreateCollection("v", embedder, db::IdentityLoader());
  assert(vectors->InsertOne(VectorDoc("v1", "a", "refund")));

  search::RelevanceSearch search(*vectors, *embedder, "owner_id");
  assert(search.Search("refund", {}, 3).empty());
  assert(search.Search("refund", {{"a", 1}}, 0).empty());
  assert(search.Search("refund", {{"a", 0}}, 3).empty());
}

void TestResultsAreRestrictedToCandidatePool() {
  MemoryVectorDatabase db;
  auto                 embedder = std::make_shared<nlp::HashingEmbedder>(256);
  auto                 vectors  = db.GetOrCreateCollection("v", embedder, db::IdentityLoader());

  assert(vectors->InsertOne(VectorDoc("v1", "a", "refund my order")));
  assert(vectors->InsertOne(VectorDoc("v2", "b", "track my parcel")));
  assert(vectors->InsertOne(VectorDoc("v3", "outsider", "refund my order")));

  search::RelevanceSearch search(*vectors, *embedder, "owner_id");
  auto                    ranked = search.Search("refund my order", {{"a", 1}, {"b", 1}}, 5);

  assert(ranked.size() == 2);
  assert(ranked[0].id == "a");
  assert(ranked[1].id == "b");
}

void TestManyVectorsDoNotCrowdOutOtherOwners() {
  MemoryVectorDatabase db;
  auto                 embedder = std::make_shared<nlp::HashingEmbedder>(256);
  auto                 vectors  = db.GetOrCreateCollection("v", embedder, db::IdentityLoader());

  // owner "a" has five near-identical vectors, all closer than b's single one
  for (int i = 0; i < 5; ++i) {
    assert(vectors->InsertOne(VectorDoc("a" + std::to_string(i), "a", "refund order now")));
  }
  assert(vectors->InsertOne(VectorDoc("b0", "b", "refund status")));

  search::RelevanceSearch search(*vectors, *embedder, "owner_id");
  auto                    ranked = search.Search("refund order now", {{"a", 5}, {"b", 1}}, 2);

  assert(ranked.size() == 2);
  assert(ranked[0].id == "a");
  assert(ranked[1].id == "b");
}

void TestLongQueriesAreSearchedChunkByChunk() {
  MemoryVectorDatabase db;
  // 10 / 5 = 2 tokens per chunk
  auto embedder = std::make_shared<nlp::HashingEmbedder>(256, 10);
  auto vectors  = db.GetOrCreateCollection("v", embedder, db::IdentityLoader());

  assert(vectors->InsertOne(VectorDoc("v1", "billing", "invoice payment")));
  assert(vectors->InsertOne(VectorDoc("v2", "shipping", "parcel tracking")));

  search::RelevanceSearch search(*vectors, *embedder, "owner_id");
  auto ranked = search.Search("invoice payment parcel tracking", {{"billing", 1}, {"shipping", 1}}, 2);

  // each chunk matches one owner exactly
  assert(ranked.size() == 2);
  assert(ranked[0].distance < 1e-6);
  assert(ranked[1].distance < 1e-6);
  assert(ranked[0].id == "billing" && ranked[1].id == "shipping");
}

void TestTokenlessQueryStillRanksCandidates() {
  MemoryVectorDatabase db;
  auto                 embedder = std::make_shared<nlp::HashingEmbedder>(128);
  auto                 vectors  = db.GetOrCreateCollection("v", embedder, db::IdentityLoader());

  assert(vectors->InsertOne(VectorDoc("v1", "b", "track my parcel")));
  assert(vectors->InsertOne(VectorDoc("v2", "a", "refund my order")));
  assert(vectors->InsertOne(VectorDoc("v3", "c", "change my address")));

  search::RelevanceSearch search(*vectors, *embedder, "owner_id");
  auto ranked = search.Search("", {{"a", 1}, {"b", 1}, {"c", 1}}, 2);

  // every owner is equally far from an empty query, so ids decide
  assert(ranked.size() == 2);
  assert(ranked[0].id == "a" && ranked[1].id == "b");
  assert(ranked[0].distance == 1.0 && ranked[1].distance == 1.0);
}

} // namespace

int main() {
  TestMinVectorsForMaxItemCount();
  TestMergeByOwnerKeepsBestDistance();
  TestEmptyInputsShortCircuit();
  TestResultsAreRestrictedToCandidatePool();
  TestManyVectorsDoNotCrowdOutOtherOwners();
  TestLongQueriesAreSearchedChunkByChunk();
  TestTokenlessQueryStillRanksCandidates();

  std::cout << "entitystore_unit_relevance_search: pass\n";
  return 0;
}
