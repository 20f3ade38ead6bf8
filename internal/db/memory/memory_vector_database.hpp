#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/vector_database.hpp"
#include "internal/db/memory/memory_document_set.hpp"

namespace entitystore::db::memory {

class MemoryVectorCollection final : public VectorCollection {
 public:
  MemoryVectorCollection(std::string name, std::shared_ptr<const nlp::Embedder> embedder);

  const std::string& Name() const override {
    return name_;
  }

  Result                  InsertOne(const Document& doc) override;
  std::vector<Document>   Find(const Filter& filter) override;
  std::optional<Document> FindOne(const Filter& filter) override;
  UpdateResult            UpdateOne(const Filter& filter, const Document& patch, bool upsert = false) override;
  DeleteResult            DeleteOne(const Filter& filter) override;
  std::size_t             Count() override;

  std::vector<SimilarDocument> FindSimilarDocuments(const Filter& filter, const std::string& query,
                                                    std::size_t k) override;

  MemoryDocumentSet& Set() {
    return set_;
  }

 private:
  std::string       name_;
  MemoryDocumentSet set_;
};

class MemoryVectorDatabase final : public VectorDatabase {
 public:
  MemoryVectorDatabase() = default;

  std::shared_ptr<VectorCollection> GetOrCreateCollection(const std::string&                    name,
                                                          std::shared_ptr<const nlp::Embedder> embedder,
                                                          const DocumentLoader&                 loader) override;

  std::vector<std::string> ListCollections() override;
  std::size_t              CountDocuments(const std::string& collection) override;

  std::map<std::string, std::string> ReadMetadata() override;
  Result                             UpsertMetadata(const std::string& key, const std::string& value) override;

 private:
  std::shared_ptr<MemoryVectorCollection> GetOrCreateLocked(const std::string&                    name,
                                                            std::shared_ptr<const nlp::Embedder> embedder);

  std::mutex                                                     mutex_;
  std::map<std::string, std::shared_ptr<MemoryVectorCollection>> collections_;
  std::map<std::string, std::string>                             metadata_;
};

} // namespace entitystore::db::memory
