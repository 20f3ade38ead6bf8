#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/document_database.hpp"
#include "sqlite_document_table.hpp"

namespace entitystore::db::sqlite {

class SqliteDocumentCollection final : public DocumentCollection {
 public:
  SqliteDocumentCollection(std::shared_ptr<SqliteDB> db, std::string name);

  const std::string& Name() const override {
    return table_.Collection();
  }

  Result                  InsertOne(const Document& doc) override;
  std::vector<Document>   Find(const Filter& filter) override;
  std::optional<Document> FindOne(const Filter& filter) override;
  UpdateResult            UpdateOne(const Filter& filter, const Document& patch, bool upsert = false) override;
  DeleteResult            DeleteOne(const Filter& filter) override;
  std::size_t             Count() override;

  SqliteDocumentTable& Table() {
    return table_;
  }

 private:
  SqliteDocumentTable table_;
};

/*
  File-backed document database. Survives process restarts.

  Tables: documents, metadata.
*/
class SqliteDocumentDatabase final : public DocumentDatabase {
 public:
  explicit SqliteDocumentDatabase(std::shared_ptr<SqliteDB> db);

  std::shared_ptr<DocumentCollection> GetOrCreateCollection(const std::string&    name,
                                                            const DocumentLoader& loader) override;

  std::vector<std::string> ListCollections() override;
  std::size_t              CountDocuments(const std::string& collection) override;

  std::map<std::string, std::string> ReadMetadata() override;
  Result                             UpsertMetadata(const std::string& key, const std::string& value) override;

 private:
  std::shared_ptr<SqliteDB> db_;
};

} // namespace entitystore::db::sqlite
