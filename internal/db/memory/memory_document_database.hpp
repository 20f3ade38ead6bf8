#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/document_database.hpp"
#include "internal/db/memory/memory_document_set.hpp"

namespace entitystore::db::memory {

class MemoryDocumentCollection final : public DocumentCollection {
 public:
  explicit MemoryDocumentCollection(std::string name);

  const std::string& Name() const override {
    return name_;
  }

  Result                  InsertOne(const Document& doc) override;
  std::vector<Document>   Find(const Filter& filter) override;
  std::optional<Document> FindOne(const Filter& filter) override;
  UpdateResult            UpdateOne(const Filter& filter, const Document& patch, bool upsert = false) override;
  DeleteResult            DeleteOne(const Filter& filter) override;
  std::size_t             Count() override;

  MemoryDocumentSet& Set() {
    return set_;
  }

 private:
  std::string       name_;
  MemoryDocumentSet set_;
};

/*
  Process-local document database. Contents live as long as the object.
*/
class MemoryDocumentDatabase final : public DocumentDatabase {
 public:
  MemoryDocumentDatabase() = default;

  std::shared_ptr<DocumentCollection> GetOrCreateCollection(const std::string&    name,
                                                            const DocumentLoader& loader) override;

  std::vector<std::string> ListCollections() override;
  std::size_t              CountDocuments(const std::string& collection) override;

  std::map<std::string, std::string> ReadMetadata() override;
  Result                             UpsertMetadata(const std::string& key, const std::string& value) override;

 private:
  std::shared_ptr<MemoryDocumentCollection> GetOrCreateLocked(const std::string& name);

  std::mutex                                                       mutex_;
  std::map<std::string, std::shared_ptr<MemoryDocumentCollection>> collections_;
  std::map<std::string, std::string>                               metadata_;
};

} // namespace entitystore::db::memory
