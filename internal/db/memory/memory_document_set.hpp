#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/collection_loader.hpp"
#include "internal/db/api/document_database.hpp"
#include "internal/db/api/vector_database.hpp"

namespace entitystore::db::memory {

/*
  Insertion-ordered document storage shared by the memory collections.

  With an embedder attached, each document's "content" is embedded on write.
*/
class MemoryDocumentSet {
 public:
  explicit MemoryDocumentSet(std::shared_ptr<const nlp::Embedder> embedder = nullptr);

  Result                  InsertOne(const Document& doc);
  std::vector<Document>   Find(const Filter& filter) const;
  std::optional<Document> FindOne(const Filter& filter) const;
  UpdateResult            UpdateOne(const Filter& filter, const Document& patch, bool upsert);
  DeleteResult            DeleteOne(const Filter& filter);
  std::size_t             Count() const;

  std::vector<SimilarDocument> FindSimilar(const Filter& filter, const std::string& query, std::size_t k) const;

  // Runs `loader` over every document; returns the quarantined originals, already removed.
  std::vector<Document> Load(const DocumentLoader& loader, const std::string& collection, LoadStats& stats);

  // Replaces the embedder and re-embeds every document.
  void SetEmbedder(std::shared_ptr<const nlp::Embedder> embedder);

 private:
  struct Entry {
    Document           doc;
    std::vector<float> embedding;
  };

  std::vector<Entry>::const_iterator FindFirstLocked(const Filter& filter) const;
  std::vector<float>                 EmbedLocked(const Document& doc) const;

  mutable std::mutex                   mutex_;
  std::shared_ptr<const nlp::Embedder> embedder_;
  std::vector<Entry>                   entries_;
};

} // namespace entitystore::db::memory
