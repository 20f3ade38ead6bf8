#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/vector_database.hpp"
#include "sqlite_document_table.hpp"

namespace entitystore::db::sqlite {

class SqliteVectorCollection final : public VectorCollection {
 public:
  SqliteVectorCollection(std::shared_ptr<SqliteDB> db, std::string name, std::shared_ptr<const nlp::Embedder> embedder);

  const std::string& Name() const override {
    return table_.Collection();
  }

  Result                  InsertOne(const Document& doc) override;
  std::vector<Document>   Find(const Filter& filter) override;
  std::optional<Document> FindOne(const Filter& filter) override;
  UpdateResult            UpdateOne(const Filter& filter, const Document& patch, bool upsert = false) override;
  DeleteResult            DeleteOne(const Filter& filter) override;
  std::size_t             Count() override;

  std::vector<SimilarDocument> FindSimilarDocuments(const Filter& filter, const std::string& query,
                                                    std::size_t k) override;

  SqliteDocumentTable& Table() {
    return table_;
  }

 private:
  SqliteDocumentTable table_;
};

/*
  File-backed vector database. Embeddings are stored as float32 BLOBs and
  scored by exact cosine distance.

  Tables: vector_documents, vector_metadata. The metadata key
  "<collection>_embedder" records which model produced the stored embeddings;
  a mismatch on open re-embeds the collection.
*/
class SqliteVectorDatabase final : public VectorDatabase {
 public:
  explicit SqliteVectorDatabase(std::shared_ptr<SqliteDB> db);

  std::shared_ptr<VectorCollection> GetOrCreateCollection(const std::string&                    name,
                                                          std::shared_ptr<const nlp::Embedder> embedder,
                                                          const DocumentLoader&                 loader) override;

  std::vector<std::string> ListCollections() override;
  std::size_t              CountDocuments(const std::string& collection) override;

  std::map<std::string, std::string> ReadMetadata() override;
  Result                             UpsertMetadata(const std::string& key, const std::string& value) override;

 private:
  std::shared_ptr<SqliteDB> db_;
};

} // namespace entitystore::db::sqlite
