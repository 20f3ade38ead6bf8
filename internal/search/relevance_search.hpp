#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "internal/db/api/vector_database.hpp"
#include "internal/nlp/embedder.hpp"

namespace entitystore::search {

struct Candidate {
  std::string id;
  // Vector documents the entity owns.
  std::size_t vector_count = 0;
};

struct RankedOwner {
  std::string id;
  double      distance = 0.0;
};

/*
  Smallest neighbor count that leaves room for `max_items` distinct owners:
  the sum of the `max_items` smallest per-owner vector counts.
*/
std::size_t MinVectorsForMaxItemCount(std::vector<std::size_t> vector_counts, std::size_t max_items);

/*
  Collapses raw hits to one per owner (best distance across all hits), sorted
  ascending by distance with ties broken by owner id, truncated to max_count.
*/
std::vector<RankedOwner> MergeByOwner(const std::vector<db::SimilarDocument>& hits, const std::string& owner_field,
                                      std::size_t max_count);

/*
  Chunked nearest-neighbor search over one vector collection, restricted to a
  candidate pool of owners.
*/
class RelevanceSearch {
 public:
  RelevanceSearch(db::VectorCollection& vectors, const nlp::Embedder& embedder, std::string owner_field);

  // Empty pool or max_count 0 returns empty without touching the backend.
  std::vector<RankedOwner> Search(const std::string& query, const std::vector<Candidate>& candidates,
                                  std::size_t max_count) const;

 private:
  db::VectorCollection& vectors_;
  const nlp::Embedder&  embedder_;
  std::string           owner_field_;
};

} // namespace entitystore::search
