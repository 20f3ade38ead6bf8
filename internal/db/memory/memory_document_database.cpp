#include "internal/db/memory/memory_document_database.hpp"

namespace entitystore::db::memory {

MemoryDocumentCollection::MemoryDocumentCollection(std::string name) : name_(std::move(name)) {
}

Result MemoryDocumentCollection::InsertOne(const Document& doc) {
  return set_.InsertOne(doc);
}

std::vector<Document> MemoryDocumentCollection::Find(const Filter& filter) {
  return set_.Find(filter);
}

std::optional<Document> MemoryDocumentCollection::FindOne(const Filter& filter) {
  return set_.FindOne(filter);
}

UpdateResult MemoryDocumentCollection::UpdateOne(const Filter& filter, const Document& patch, bool upsert) {
  return set_.UpdateOne(filter, patch, upsert);
}

DeleteResult MemoryDocumentCollection::DeleteOne(const Filter& filter) {
  return set_.DeleteOne(filter);
}

std::size_t MemoryDocumentCollection::Count() {
  return set_.Count();
}

// ------------------------------------------------------------------

std::shared_ptr<MemoryDocumentCollection> MemoryDocumentDatabase::GetOrCreateLocked(const std::string& name) {
  auto& slot = collections_[name];
  if (!slot) slot = std::make_shared<MemoryDocumentCollection>(name);
  return slot;
}

std::shared_ptr<DocumentCollection> MemoryDocumentDatabase::GetOrCreateCollection(const std::string&    name,
                                                                                  const DocumentLoader& loader) {
  std::lock_guard lock(mutex_);

  auto collection = GetOrCreateLocked(name);

  LoadStats stats;
  auto      failed = collection->Set().Load(loader, name, stats);

  if (!failed.empty()) {
    auto sidecar = GetOrCreateLocked(FailedMigrationsCollectionName(name));
    for (const auto& doc : failed) {
      sidecar->UpdateOne(Filter::Eq(kIdField, DocumentId(doc)), doc, /*upsert=*/true);
    }
  }

  LogLoadStats(name, stats);
  return collection;
}

std::vector<std::string> MemoryDocumentDatabase::ListCollections() {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> names;
  for (const auto& [name, _] : collections_) names.push_back(name);
  return names;
}

std::size_t MemoryDocumentDatabase::CountDocuments(const std::string& collection) {
  std::lock_guard lock(mutex_);
  auto            it = collections_.find(collection);
  return it == collections_.end() ? 0 : it->second->Count();
}

std::map<std::string, std::string> MemoryDocumentDatabase::ReadMetadata() {
  std::lock_guard lock(mutex_);
  return metadata_;
}

Result MemoryDocumentDatabase::UpsertMetadata(const std::string& key, const std::string& value) {
  std::lock_guard lock(mutex_);
  metadata_[key] = value;
  return Result::Ok();
}

} // namespace entitystore::db::memory
