#include "internal/db/memory/memory_document_set.hpp"

#include <algorithm>

namespace entitystore::db::memory {

MemoryDocumentSet::MemoryDocumentSet(std::shared_ptr<const nlp::Embedder> embedder) : embedder_(std::move(embedder)) {
}

std::vector<MemoryDocumentSet::Entry>::const_iterator MemoryDocumentSet::FindFirstLocked(const Filter& filter) const {
  return std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) { return filter.Matches(e.doc); });
}

std::vector<float> MemoryDocumentSet::EmbedLocked(const Document& doc) const {
  if (!embedder_) return {};
  auto content = GetString(doc, kContentField);
  if (!content) return {};
  return embedder_->Embed(*content);
}

Result MemoryDocumentSet::InsertOne(const Document& doc) {
  const std::string id = DocumentId(doc);
  if (id.empty()) {
    return Result::Err(ErrorCode::ConstraintViolation, "document has no id");
  }

  std::lock_guard lock(mutex_);
  if (FindFirstLocked(Filter::Eq(kIdField, id)) != entries_.end()) {
    return Result::Err(ErrorCode::AlreadyExists, "document " + id + " already exists");
  }

  entries_.push_back(Entry{doc, EmbedLocked(doc)});
  return Result::Ok();
}

std::vector<Document> MemoryDocumentSet::Find(const Filter& filter) const {
  std::lock_guard       lock(mutex_);
  std::vector<Document> out;
  for (const auto& e : entries_) {
    if (filter.Matches(e.doc)) out.push_back(e.doc);
  }
  return out;
}

std::optional<Document> MemoryDocumentSet::FindOne(const Filter& filter) const {
  std::lock_guard lock(mutex_);
  auto            it = FindFirstLocked(filter);
  if (it == entries_.end()) return std::nullopt;
  return it->doc;
}

UpdateResult MemoryDocumentSet::UpdateOne(const Filter& filter, const Document& patch, bool upsert) {
  std::lock_guard lock(mutex_);

  UpdateResult result;
  auto         it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) { return filter.Matches(e.doc); });

  if (it == entries_.end()) {
    if (upsert && !DocumentId(patch).empty()) {
      entries_.push_back(Entry{patch, EmbedLocked(patch)});
      result.updated_document = patch;
    }
    return result;
  }

  Document updated = it->doc;
  Merge(updated, patch);

  // id is the collection key and never changes through an update
  if (DocumentId(updated) != DocumentId(it->doc)) {
    SetString(updated, kIdField, DocumentId(it->doc));
  }

  it->embedding           = EmbedLocked(updated);
  it->doc                 = updated;
  result.matched_count    = 1;
  result.updated_document = std::move(updated);
  return result;
}

DeleteResult MemoryDocumentSet::DeleteOne(const Filter& filter) {
  std::lock_guard lock(mutex_);

  DeleteResult result;
  auto         it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) { return filter.Matches(e.doc); });
  if (it == entries_.end()) return result;

  result.deleted_count    = 1;
  result.deleted_document = it->doc;
  entries_.erase(it);
  return result;
}

std::size_t MemoryDocumentSet::Count() const {
  std::lock_guard lock(mutex_);
  return entries_.size();
}

std::vector<SimilarDocument> MemoryDocumentSet::FindSimilar(const Filter& filter, const std::string& query,
                                                            std::size_t k) const {
  if (k == 0 || !embedder_) return {};

  const auto query_embedding = embedder_->Embed(query);

  std::vector<SimilarDocument> hits;
  {
    std::lock_guard lock(mutex_);
    for (const auto& e : entries_) {
      if (e.embedding.empty() || !filter.Matches(e.doc)) continue;
      hits.push_back(SimilarDocument{e.doc, nlp::CosineDistance(query_embedding, e.embedding)});
    }
  }

  std::sort(hits.begin(), hits.end(), [](const SimilarDocument& a, const SimilarDocument& b) {
    if (a.distance != b.distance) return a.distance < b.distance;
    return DocumentId(a.document) < DocumentId(b.document);
  });
  if (hits.size() > k) hits.resize(k);
  return hits;
}

std::vector<Document> MemoryDocumentSet::Load(const DocumentLoader& loader, const std::string& collection,
                                              LoadStats& stats) {
  std::lock_guard lock(mutex_);

  std::vector<Document> quarantined;
  std::vector<Entry>    kept;
  kept.reserve(entries_.size());

  // entries_ stays intact until every document has been decided
  for (const auto& e : entries_) {
    auto decision = ApplyLoader(loader, e.doc, collection);
    stats.Record(decision.kind);

    switch (decision.kind) {
      case LoadDecision::Kind::kKeep:
        kept.push_back(e);
        break;
      case LoadDecision::Kind::kReplace:
        kept.push_back(Entry{decision.document, EmbedLocked(decision.document)});
        break;
      case LoadDecision::Kind::kQuarantine:
        quarantined.push_back(std::move(decision.document));
        break;
    }
  }

  entries_ = std::move(kept);
  return quarantined;
}

void MemoryDocumentSet::SetEmbedder(std::shared_ptr<const nlp::Embedder> embedder) {
  std::lock_guard lock(mutex_);
  embedder_ = std::move(embedder);
  for (auto& e : entries_) {
    e.embedding = EmbedLocked(e.doc);
  }
}

} // namespace entitystore::db::memory
