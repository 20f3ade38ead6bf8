#include "internal/store/entity_store.hpp"

#include <set>
#include <stdexcept>

#include "internal/db/api/collection_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/search/relevance_search.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "internal/util/version.hpp"

namespace entitystore::store {

using observability::IntField;
using observability::StringField;

static constexpr const char* kCreationField = "creation_utc";
static constexpr const char* kChecksumField = "checksum";

bool IsReservedField(const std::string& key) {
  return key == db::kIdField || key == db::kVersionField || key == kCreationField || key == kChecksumField;
}

static db::Document StripReserved(const db::Document& doc) {
  db::Document out;
  for (const auto& [key, value] : doc.fields()) {
    if (!IsReservedField(key)) (*out.mutable_fields())[key] = value;
  }
  return out;
}

static util::Version ParseTrackVersion(const EntityDescriptor& descriptor, const VersionTrack& track) {
  try {
    return util::Version::FromString(track.version);
  } catch (const std::invalid_argument& e) {
    throw std::invalid_argument(descriptor.store_name + ": " + e.what());
  }
}

static db::DocumentLoader TrackLoader(const VersionTrack& track) {
  return persistence::DocumentMigrationHelper(track.version, track.converters).AsLoader();
}

// ------------------------------------------------------------------
// Open
// ------------------------------------------------------------------

EntityStore::EntityStore(StoreDependencies deps, EntityDescriptor descriptor)
    : deps_(std::move(deps)), descriptor_(std::move(descriptor)) {
  if (!deps_.document_db || !deps_.vector_db || !deps_.embedder) {
    throw std::invalid_argument(descriptor_.store_name + ": document_db, vector_db and embedder are required");
  }
  if (!descriptor_.content_key || !descriptor_.list_contents) {
    throw std::invalid_argument(descriptor_.store_name + ": content_key and list_contents are required");
  }

  auto guard = lock_.WriterLock();

  persistence::StoreMigrationHelper document_gate(descriptor_.store_name,
                                                  ParseTrackVersion(descriptor_, descriptor_.document_track),
                                                  *deps_.document_db, deps_.allow_migration, "document");
  document_gate.Check();

  records_ = deps_.document_db->GetOrCreateCollection(descriptor_.collection, TrackLoader(descriptor_.document_track));

  tags_ = std::make_unique<tags::AssociationIndex>(
      deps_.document_db->GetOrCreateCollection(descriptor_.tag_collection, TrackLoader(descriptor_.tag_track)),
      tags::AssociationOptions{descriptor_.owner_field, "tag_id", descriptor_.tag_track.version, descriptor_.id_policy});

  for (const auto& extra : descriptor_.associations) {
    associations_[extra.name] = std::make_unique<tags::AssociationIndex>(
        deps_.document_db->GetOrCreateCollection(extra.collection, TrackLoader(extra.track)),
        tags::AssociationOptions{descriptor_.owner_field, extra.value_field, extra.track.version, util::IdPolicy::kRandom});
  }

  document_gate.Commit();

  persistence::StoreMigrationHelper vector_gate(descriptor_.store_name,
                                                ParseTrackVersion(descriptor_, descriptor_.vector_track),
                                                *deps_.vector_db, deps_.allow_migration, "vector");
  vector_gate.Check();

  vectors_ = deps_.vector_db->GetOrCreateCollection(descriptor_.collection, deps_.embedder,
                                                    TrackLoader(descriptor_.vector_track));

  vector_gate.Commit();

  ENTITYSTORE_LOG_INFO("store opened", {StringField("store", descriptor_.store_name),
                                        StringField("id_policy", util::ToString(descriptor_.id_policy)),
                                        StringField("embedder", deps_.embedder->Name())});
}

// ------------------------------------------------------------------
// Unlocked helpers
// ------------------------------------------------------------------

std::optional<db::Document> EntityStore::FindRecordUnlocked(const std::string& id) const {
  return records_->FindOne(db::Filter::Eq(db::kIdField, id));
}

db::Document EntityStore::RequireRecordUnlocked(const std::string& id) const {
  auto record = FindRecordUnlocked(id);
  if (!record) {
    throw util::NotFound(descriptor_.store_name + ": entity " + id + " not found");
  }
  return std::move(*record);
}

Entity EntityStore::HydrateUnlocked(const db::Document& record) const {
  Entity entity;
  entity.id       = db::RequireString(record, db::kIdField);
  entity.checksum = db::GetString(record, kChecksumField).value_or("");
  entity.fields   = StripReserved(record);

  try {
    entity.creation_utc = util::FromIsoString(db::RequireString(record, kCreationField));
  } catch (const std::invalid_argument& e) {
    throw util::InvalidContent(descriptor_.store_name + ": entity " + entity.id + " has a bad creation_utc: " + e.what());
  }

  entity.tags = tags_->ListForEntity(entity.id);
  for (const auto& [name, index] : associations_) {
    entity.associations[name] = index->ListForEntity(entity.id);
  }
  return entity;
}

db::Document EntityStore::BuildRecord(const std::string& id, util::TimePoint creation_utc,
                                      const db::Document& fields) const {
  db::Document record = StripReserved(fields);
  db::SetString(record, db::kIdField, id);
  db::SetString(record, db::kVersionField, descriptor_.document_track.version);
  db::SetString(record, kCreationField, util::ToIsoString(creation_utc));
  db::SetString(record, kChecksumField, util::Checksum(descriptor_.content_key(record)));
  return record;
}

void EntityStore::InsertVectorsUnlocked(const Entity& entity) {
  for (const auto& content : descriptor_.list_contents(entity)) {
    db::Document doc;
    db::SetString(doc, db::kIdField, util::GenerateId());
    db::SetString(doc, db::kVersionField, descriptor_.vector_track.version);
    db::SetString(doc, descriptor_.owner_field, entity.id);
    db::SetString(doc, db::kContentField, content);
    db::SetString(doc, kChecksumField, util::Checksum(content));

    db::ThrowIfError(vectors_->InsertOne(doc), descriptor_.store_name + ": insert vector of " + entity.id);
  }
}

std::size_t EntityStore::DeleteVectorsUnlocked(const std::string& id) {
  std::size_t deleted = 0;
  for (const auto& doc : vectors_->Find(db::Filter::Eq(descriptor_.owner_field, id))) {
    deleted += vectors_->DeleteOne(db::Filter::Eq(db::kIdField, db::DocumentId(doc))).deleted_count;
  }
  return deleted;
}

void EntityStore::RefreshVectorsUnlocked(const std::string& id) {
  auto record = FindRecordUnlocked(id);
  if (!record) return;

  DeleteVectorsUnlocked(id);
  InsertVectorsUnlocked(HydrateUnlocked(*record));
}

bool EntityStore::AffectsContent(const std::string& name) const {
  for (const auto& extra : descriptor_.associations) {
    if (extra.name == name) return extra.affects_content;
  }
  return false;
}

tags::AssociationIndex& EntityStore::AssociationUnlocked(const std::string& name) const {
  auto it = associations_.find(name);
  if (it == associations_.end()) {
    throw std::invalid_argument(descriptor_.store_name + " has no association named '" + name + "'");
  }
  return *it->second;
}

// ------------------------------------------------------------------
// Operations
// ------------------------------------------------------------------

Entity EntityStore::Create(const db::Document& fields, const std::vector<std::string>& tags,
                           std::optional<util::TimePoint> creation_utc, const AssociationValues& associations) {
  for (const auto& [name, _] : associations) {
    AssociationUnlocked(name);
  }

  auto guard = lock_.WriterLock();

  const auto        created  = creation_utc.value_or(util::Now());
  const std::string checksum = util::Checksum(descriptor_.content_key(StripReserved(fields)));
  const std::string id       = util::IssueId(descriptor_.id_policy, checksum);

  if (auto existing = FindRecordUnlocked(id)) {
    if (descriptor_.id_policy != util::IdPolicy::kContentAddressed) {
      throw util::AlreadyExists(descriptor_.store_name + ": entity " + id + " already exists");
    }

    ENTITYSTORE_LOG_DEBUG("content already stored", {StringField("store", descriptor_.store_name), StringField("id", id)});
    for (const auto& tag : tags) tags_->Upsert(id, tag, created);
    return HydrateUnlocked(*existing);
  }

  const auto record = BuildRecord(id, created, fields);
  db::ThrowIfError(records_->InsertOne(record), descriptor_.store_name + ": insert " + id);

  for (const auto& [name, values] : associations) {
    auto& index = *associations_.at(name);
    for (const auto& value : values) index.Upsert(id, value, created);
  }

  Entity entity = HydrateUnlocked(record);
  InsertVectorsUnlocked(entity);

  for (const auto& tag : tags) tags_->Upsert(id, tag, created);
  entity.tags = tags_->ListForEntity(id);

  ENTITYSTORE_LOG_DEBUG("entity created", {StringField("store", descriptor_.store_name), StringField("id", id)});
  return entity;
}

Entity EntityStore::Read(const std::string& id) const {
  auto guard = lock_.ReaderLock();
  return HydrateUnlocked(RequireRecordUnlocked(id));
}

Entity EntityStore::Update(const std::string& id, const db::Document& partial) {
  auto guard = lock_.WriterLock();

  const auto existing = HydrateUnlocked(RequireRecordUnlocked(id));

  db::Document merged = existing.fields;
  db::Merge(merged, StripReserved(partial));
  const auto record = BuildRecord(id, existing.creation_utc, merged);

  DeleteVectorsUnlocked(id);

  auto result = records_->UpdateOne(db::Filter::Eq(db::kIdField, id), record);
  if (result.matched_count == 0) {
    throw util::NotFound(descriptor_.store_name + ": entity " + id + " vanished during update");
  }

  Entity entity = HydrateUnlocked(record);
  InsertVectorsUnlocked(entity);
  return entity;
}

void EntityStore::Delete(const std::string& id) {
  auto guard = lock_.WriterLock();

  if (records_->DeleteOne(db::Filter::Eq(db::kIdField, id)).deleted_count == 0) {
    throw util::NotFound(descriptor_.store_name + ": entity " + id + " not found");
  }

  const auto vectors = DeleteVectorsUnlocked(id);
  auto       removed = tags_->RemoveAllFor(id);
  for (const auto& [_, index] : associations_) {
    removed += index->RemoveAllFor(id);
  }

  ENTITYSTORE_LOG_DEBUG("entity deleted", {StringField("store", descriptor_.store_name), StringField("id", id),
                                           IntField("vectors", vectors), IntField("associations", removed)});
}

std::vector<Entity> EntityStore::List(const std::optional<std::vector<std::string>>& tags,
                                      const std::optional<AssociationFilter>&        filter) const {
  auto guard = lock_.ReaderLock();

  std::vector<db::Filter> clauses;

  const auto selection = tags_->ResolveSelection(tags);
  switch (selection.kind) {
    case tags::EntitySelection::Kind::kAll:
      break;

    case tags::EntitySelection::Kind::kExclude:
      for (const auto& id : selection.ids) clauses.push_back(db::Filter::Ne(db::kIdField, id));
      break;

    case tags::EntitySelection::Kind::kInclude:
      if (selection.ids.empty()) return {};
      clauses.push_back(db::Filter::In(db::kIdField, std::vector<std::string>(selection.ids.begin(), selection.ids.end())));
      break;
  }

  if (filter) {
    const auto ids = AssociationUnlocked(filter->name).ListEntitiesFor({filter->value});
    if (ids.empty()) return {};
    clauses.push_back(db::Filter::In(db::kIdField, std::vector<std::string>(ids.begin(), ids.end())));
  }

  std::vector<Entity> out;
  for (const auto& record : records_->Find(db::Filter::And(std::move(clauses)))) {
    out.push_back(HydrateUnlocked(record));
  }
  return out;
}

bool EntityStore::UpsertTag(const std::string& id, const std::string& tag, std::optional<util::TimePoint> created_at) {
  auto guard = lock_.WriterLock();
  RequireRecordUnlocked(id);
  return tags_->Upsert(id, tag, created_at);
}

void EntityStore::RemoveTag(const std::string& id, const std::string& tag) {
  auto guard = lock_.WriterLock();
  tags_->Remove(id, tag);
}

bool EntityStore::UpsertAssociation(const std::string& name, const std::string& id, const std::string& value,
                                    std::optional<util::TimePoint> created_at) {
  auto guard = lock_.WriterLock();

  auto& index = AssociationUnlocked(name);
  RequireRecordUnlocked(id);

  const bool created = index.Upsert(id, value, created_at);
  if (created && AffectsContent(name)) RefreshVectorsUnlocked(id);
  return created;
}

bool EntityStore::RemoveAssociation(const std::string& name, const std::string& id, const std::string& value) {
  auto guard = lock_.WriterLock();

  auto&      index   = AssociationUnlocked(name);
  const bool removed = index.RemoveIfPresent(id, value);
  if (removed && AffectsContent(name)) RefreshVectorsUnlocked(id);
  return removed;
}

std::vector<Entity> EntityStore::FindRelevant(const std::string& query, const std::vector<Entity>& candidates,
                                              std::size_t max_count) const {
  if (candidates.empty() || max_count == 0) {
    return {};
  }

  auto guard = lock_.ReaderLock();

  std::vector<search::Candidate> pool;
  pool.reserve(candidates.size());
  for (const auto& c : candidates) {
    pool.push_back(search::Candidate{c.id, descriptor_.list_contents(c).size()});
  }

  search::RelevanceSearch engine(*vectors_, *deps_.embedder, descriptor_.owner_field);

  std::vector<Entity> out;
  for (const auto& ranked : engine.Search(query, pool, max_count)) {
    auto record = FindRecordUnlocked(ranked.id);
    if (!record) {
      ENTITYSTORE_LOG_WARN("vector owner has no record", {StringField("store", descriptor_.store_name),
                                                          StringField("id", ranked.id)});
      continue;
    }
    out.push_back(HydrateUnlocked(*record));
  }
  return out;
}

ReconcileReport EntityStore::Reconcile() {
  auto guard = lock_.WriterLock();

  std::set<std::string> live;
  for (const auto& record : records_->Find(db::Filter::All())) {
    live.insert(db::DocumentId(record));
  }

  ReconcileReport report;

  for (const auto& doc : vectors_->Find(db::Filter::All())) {
    auto owner = db::GetString(doc, descriptor_.owner_field);
    if (owner && live.count(*owner)) continue;
    report.orphaned_vectors += vectors_->DeleteOne(db::Filter::Eq(db::kIdField, db::DocumentId(doc))).deleted_count;
  }

  auto sweep = [&](tags::AssociationIndex& index) {
    for (const auto& doc : index.All()) {
      auto owner = db::GetString(doc, descriptor_.owner_field);
      if (owner && live.count(*owner)) continue;
      if (index.RemoveDocument(db::DocumentId(doc))) ++report.orphaned_associations;
    }
  };

  sweep(*tags_);
  for (const auto& [_, index] : associations_) sweep(*index);

  ENTITYSTORE_LOG_INFO("reconciled store", {StringField("store", descriptor_.store_name),
                                            IntField("orphaned_vectors", report.orphaned_vectors),
                                            IntField("orphaned_associations", report.orphaned_associations)});
  return report;
}

StoreStats EntityStore::Stats() const {
  auto guard = lock_.ReaderLock();

  StoreStats stats;
  stats.records = records_->Count();
  stats.vectors = vectors_->Count();
  stats.tags    = tags_->All().size();
  for (const auto& [name, index] : associations_) {
    stats.associations[name] = index->All().size();
  }

  const auto failed = db::FailedMigrationsCollectionName(descriptor_.collection);
  stats.failed_records = deps_.document_db->CountDocuments(failed);
  stats.failed_vectors = deps_.vector_db->CountDocuments(failed);
  return stats;
}

} // namespace entitystore::store
