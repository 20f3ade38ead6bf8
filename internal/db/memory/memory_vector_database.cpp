#include "internal/db/memory/memory_vector_database.hpp"

namespace entitystore::db::memory {

MemoryVectorCollection::MemoryVectorCollection(std::string name, std::shared_ptr<const nlp::Embedder> embedder)
    : name_(std::move(name)), set_(std::move(embedder)) {
}

Result MemoryVectorCollection::InsertOne(const Document& doc) {
  return set_.InsertOne(doc);
}

std::vector<Document> MemoryVectorCollection::Find(const Filter& filter) {
  return set_.Find(filter);
}

std::optional<Document> MemoryVectorCollection::FindOne(const Filter& filter) {
  return set_.FindOne(filter);
}

UpdateResult MemoryVectorCollection::UpdateOne(const Filter& filter, const Document& patch, bool upsert) {
  return set_.UpdateOne(filter, patch, upsert);
}

DeleteResult MemoryVectorCollection::DeleteOne(const Filter& filter) {
  return set_.DeleteOne(filter);
}

std::size_t MemoryVectorCollection::Count() {
  return set_.Count();
}

std::vector<SimilarDocument> MemoryVectorCollection::FindSimilarDocuments(const Filter& filter, const std::string& query,
                                                                          std::size_t k) {
  return set_.FindSimilar(filter, query, k);
}

// ------------------------------------------------------------------

std::shared_ptr<MemoryVectorCollection> MemoryVectorDatabase::GetOrCreateLocked(
    const std::string& name, std::shared_ptr<const nlp::Embedder> embedder) {
  auto& slot = collections_[name];
  if (!slot) {
    slot = std::make_shared<MemoryVectorCollection>(name, std::move(embedder));
  } else if (embedder) {
    slot->Set().SetEmbedder(std::move(embedder));
  }
  return slot;
}

std::shared_ptr<VectorCollection> MemoryVectorDatabase::GetOrCreateCollection(
    const std::string& name, std::shared_ptr<const nlp::Embedder> embedder, const DocumentLoader& loader) {
  std::lock_guard lock(mutex_);

  auto collection = GetOrCreateLocked(name, embedder);

  LoadStats stats;
  auto      failed = collection->Set().Load(loader, name, stats);

  if (!failed.empty()) {
    auto sidecar = GetOrCreateLocked(FailedMigrationsCollectionName(name), nullptr);
    for (const auto& doc : failed) {
      sidecar->UpdateOne(Filter::Eq(kIdField, DocumentId(doc)), doc, /*upsert=*/true);
    }
  }

  LogLoadStats(name, stats);
  return collection;
}

std::vector<std::string> MemoryVectorDatabase::ListCollections() {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> names;
  for (const auto& [name, _] : collections_) names.push_back(name);
  return names;
}

std::size_t MemoryVectorDatabase::CountDocuments(const std::string& collection) {
  std::lock_guard lock(mutex_);
  auto            it = collections_.find(collection);
  return it == collections_.end() ? 0 : it->second->Count();
}

std::map<std::string, std::string> MemoryVectorDatabase::ReadMetadata() {
  std::lock_guard lock(mutex_);
  return metadata_;
}

Result MemoryVectorDatabase::UpsertMetadata(const std::string& key, const std::string& value) {
  std::lock_guard lock(mutex_);
  metadata_[key] = value;
  return Result::Ok();
}

} // namespace entitystore::db::memory
