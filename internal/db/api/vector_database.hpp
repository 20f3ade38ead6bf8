#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/document_database.hpp"
#include "internal/nlp/embedder.hpp"

namespace entitystore::db {

struct SimilarDocument {
  Document document;
  double   distance = 0.0;
};

/*
  Document collection whose members are embedded by their "content" field.

  Inserts and updates (re)compute the embedding. Documents without a string
  "content" are stored unembedded and never returned by similarity queries.
*/
class VectorCollection : public DocumentCollection {
 public:
  // Up to k matches of `filter`, ordered by ascending distance, ties by id.
  virtual std::vector<SimilarDocument> FindSimilarDocuments(const Filter& filter, const std::string& query,
                                                            std::size_t k) = 0;
};

class VectorDatabase : public MetadataStore {
 public:
  virtual std::shared_ptr<VectorCollection> GetOrCreateCollection(const std::string&                    name,
                                                                  std::shared_ptr<const nlp::Embedder> embedder,
                                                                  const DocumentLoader&                 loader) = 0;

  virtual std::vector<std::string> ListCollections() = 0;

  // Documents stored under `collection`, 0 when it was never created. Runs no loader.
  virtual std::size_t CountDocuments(const std::string& collection) = 0;
};

inline constexpr const char* kContentField = "content";

} // namespace entitystore::db
