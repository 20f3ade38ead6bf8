#include "sqlite_vector_database.hpp"

#include "internal/observability/logging.hpp"

namespace entitystore::db::sqlite {

static constexpr const char* kVectorTable   = "vector_documents";
static constexpr const char* kMetadataTable = "vector_metadata";

SqliteVectorCollection::SqliteVectorCollection(std::shared_ptr<SqliteDB> db, std::string name,
                                               std::shared_ptr<const nlp::Embedder> embedder)
    : table_(std::move(db), kVectorTable, std::move(name), std::move(embedder)) {
}

Result SqliteVectorCollection::InsertOne(const Document& doc) {
  return table_.InsertOne(doc);
}

std::vector<Document> SqliteVectorCollection::Find(const Filter& filter) {
  return table_.Find(filter);
}

std::optional<Document> SqliteVectorCollection::FindOne(const Filter& filter) {
  return table_.FindOne(filter);
}

UpdateResult SqliteVectorCollection::UpdateOne(const Filter& filter, const Document& patch, bool upsert) {
  return table_.UpdateOne(filter, patch, upsert);
}

DeleteResult SqliteVectorCollection::DeleteOne(const Filter& filter) {
  return table_.DeleteOne(filter);
}

std::size_t SqliteVectorCollection::Count() {
  return table_.Count();
}

std::vector<SimilarDocument> SqliteVectorCollection::FindSimilarDocuments(const Filter& filter, const std::string& query,
                                                                          std::size_t k) {
  return table_.FindSimilar(filter, query, k);
}

// ------------------------------------------------------------------

SqliteVectorDatabase::SqliteVectorDatabase(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  auto lock = db_->Lock();
  EnsureDocumentTable(*db_, kVectorTable);
  EnsureMetadataTable(*db_, kMetadataTable);
}

std::shared_ptr<VectorCollection> SqliteVectorDatabase::GetOrCreateCollection(
    const std::string& name, std::shared_ptr<const nlp::Embedder> embedder, const DocumentLoader& loader) {
  auto collection = std::make_shared<SqliteVectorCollection>(db_, name, embedder);
  auto sidecar    = SqliteVectorCollection(db_, FailedMigrationsCollectionName(name), nullptr);

  LogLoadStats(name, collection->Table().Load(loader, sidecar.Table()));

  if (embedder) {
    const std::string key      = name + "_embedder";
    const std::string model_id = embedder->Name() + "/" + std::to_string(embedder->Dimensions());
    auto              metadata = ReadMetadata();
    auto              it       = metadata.find(key);

    if (it == metadata.end() || it->second != model_id) {
      if (it != metadata.end()) {
        ENTITYSTORE_LOG_INFO("embedder changed, re-embedding collection",
                             {observability::StringField("collection", name),
                              observability::StringField("from", it->second),
                              observability::StringField("to", model_id)});
      }
      collection->Table().Reembed();
      ThrowIfError(UpsertMetadata(key, model_id), "record embedder for " + name);
    }
  }

  return collection;
}

std::vector<std::string> SqliteVectorDatabase::ListCollections() {
  return ListTableCollections(*db_, kVectorTable);
}

std::size_t SqliteVectorDatabase::CountDocuments(const std::string& collection) {
  return CountTableCollection(*db_, kVectorTable, collection);
}

std::map<std::string, std::string> SqliteVectorDatabase::ReadMetadata() {
  return ReadMetadataTable(*db_, kMetadataTable);
}

Result SqliteVectorDatabase::UpsertMetadata(const std::string& key, const std::string& value) {
  return UpsertMetadataRow(*db_, kMetadataTable, key, value);
}

} // namespace entitystore::db::sqlite
