#include "internal/search/relevance_search.hpp"

#include <algorithm>
#include <map>

#include "internal/observability/logging.hpp"
#include "internal/search/query_chunker.hpp"

namespace entitystore::search {

std::size_t MinVectorsForMaxItemCount(std::vector<std::size_t> vector_counts, std::size_t max_items) {
  std::sort(vector_counts.begin(), vector_counts.end());

  std::size_t k = 0;
  for (std::size_t i = 0; i < vector_counts.size() && i < max_items; ++i) {
    k += vector_counts[i];
  }
  return k;
}

std::vector<RankedOwner> MergeByOwner(const std::vector<db::SimilarDocument>& hits, const std::string& owner_field,
                                      std::size_t max_count) {
  std::map<std::string, double> best;
  for (const auto& hit : hits) {
    auto owner = db::GetString(hit.document, owner_field);
    if (!owner) continue;

    auto [it, inserted] = best.emplace(*owner, hit.distance);
    if (!inserted && hit.distance < it->second) {
      it->second = hit.distance;
    }
  }

  std::vector<RankedOwner> ranked;
  ranked.reserve(best.size());
  for (const auto& [id, distance] : best) {
    ranked.push_back(RankedOwner{id, distance});
  }

  std::sort(ranked.begin(), ranked.end(), [](const RankedOwner& a, const RankedOwner& b) {
    if (a.distance != b.distance) return a.distance < b.distance;
    return a.id < b.id;
  });

  if (ranked.size() > max_count) ranked.resize(max_count);
  return ranked;
}

RelevanceSearch::RelevanceSearch(db::VectorCollection& vectors, const nlp::Embedder& embedder, std::string owner_field)
    : vectors_(vectors), embedder_(embedder), owner_field_(std::move(owner_field)) {
}

std::vector<RankedOwner> RelevanceSearch::Search(const std::string& query, const std::vector<Candidate>& candidates,
                                                 std::size_t max_count) const {
  if (candidates.empty() || max_count == 0) {
    return {};
  }

  std::vector<std::string> ids;
  std::vector<std::size_t> counts;
  ids.reserve(candidates.size());
  counts.reserve(candidates.size());
  for (const auto& c : candidates) {
    ids.push_back(c.id);
    counts.push_back(c.vector_count);
  }

  const std::size_t k = MinVectorsForMaxItemCount(counts, max_count);
  if (k == 0) {
    return {};
  }

  const auto filter = db::Filter::In(owner_field_, std::move(ids));
  const auto chunks = QueryChunks(query, embedder_);

  std::vector<db::SimilarDocument> hits;
  // token-less chunks are searched as "" like any other
  for (const auto& chunk : chunks) {
    auto chunk_hits = vectors_.FindSimilarDocuments(filter, chunk, k);
    hits.insert(hits.end(), std::make_move_iterator(chunk_hits.begin()), std::make_move_iterator(chunk_hits.end()));
  }

  ENTITYSTORE_LOG_DEBUG("relevance search", {observability::StringField("collection", vectors_.Name()),
                                             observability::IntField("candidates", candidates.size()),
                                             observability::IntField("chunks", chunks.size()),
                                             observability::IntField("k", k),
                                             observability::IntField("hits", hits.size())});

  return MergeByOwner(hits, owner_field_, max_count);
}

} // namespace entitystore::search
