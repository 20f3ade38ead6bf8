#include "sqlite_document_database.hpp"

namespace entitystore::db::sqlite {

static constexpr const char* kDocumentTable = "documents";
static constexpr const char* kMetadataTable = "metadata";

SqliteDocumentCollection::SqliteDocumentCollection(std::shared_ptr<SqliteDB> db, std::string name)
    : table_(std::move(db), kDocumentTable, std::move(name), nullptr) {
}

Result SqliteDocumentCollection::InsertOne(const Document& doc) {
  return table_.InsertOne(doc);
}

std::vector<Document> SqliteDocumentCollection::Find(const Filter& filter) {
  return table_.Find(filter);
}

std::optional<Document> SqliteDocumentCollection::FindOne(const Filter& filter) {
  return table_.FindOne(filter);
}

UpdateResult SqliteDocumentCollection::UpdateOne(const Filter& filter, const Document& patch, bool upsert) {
  return table_.UpdateOne(filter, patch, upsert);
}

DeleteResult SqliteDocumentCollection::DeleteOne(const Filter& filter) {
  return table_.DeleteOne(filter);
}

std::size_t SqliteDocumentCollection::Count() {
  return table_.Count();
}

// ------------------------------------------------------------------

SqliteDocumentDatabase::SqliteDocumentDatabase(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  auto lock = db_->Lock();
  EnsureDocumentTable(*db_, kDocumentTable);
  EnsureMetadataTable(*db_, kMetadataTable);
}

std::shared_ptr<DocumentCollection> SqliteDocumentDatabase::GetOrCreateCollection(const std::string&    name,
                                                                                  const DocumentLoader& loader) {
  auto collection = std::make_shared<SqliteDocumentCollection>(db_, name);
  auto sidecar    = SqliteDocumentCollection(db_, FailedMigrationsCollectionName(name));

  LogLoadStats(name, collection->Table().Load(loader, sidecar.Table()));
  return collection;
}

std::vector<std::string> SqliteDocumentDatabase::ListCollections() {
  return ListTableCollections(*db_, kDocumentTable);
}

std::size_t SqliteDocumentDatabase::CountDocuments(const std::string& collection) {
  return CountTableCollection(*db_, kDocumentTable, collection);
}

std::map<std::string, std::string> SqliteDocumentDatabase::ReadMetadata() {
  return ReadMetadataTable(*db_, kMetadataTable);
}

Result SqliteDocumentDatabase::UpsertMetadata(const std::string& key, const std::string& value) {
  return UpsertMetadataRow(*db_, kMetadataTable, key, value);
}

} // namespace entitystore::db::sqlite
