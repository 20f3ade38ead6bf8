#include "internal/tags/association_index.hpp"

#include "internal/util/errors.hpp"

namespace entitystore::tags {

AssociationIndex::AssociationIndex(std::shared_ptr<db::DocumentCollection> collection, AssociationOptions options)
    : collection_(std::move(collection)), options_(std::move(options)) {
}

std::string AssociationIndex::IssueAssociationId(const std::string& entity_id, const std::string& value) const {
  return util::IssueId(options_.id_policy, util::Checksum(entity_id + "\n" + value));
}

db::Filter AssociationIndex::PairFilter(const std::string& entity_id, const std::string& value) const {
  return db::Filter::And({db::Filter::Eq(options_.owner_field, entity_id), db::Filter::Eq(options_.value_field, value)});
}

bool AssociationIndex::Upsert(const std::string& entity_id, const std::string& value,
                              std::optional<util::TimePoint> created_at) {
  if (collection_->FindOne(PairFilter(entity_id, value))) {
    return false;
  }

  db::Document doc;
  db::SetString(doc, db::kIdField, IssueAssociationId(entity_id, value));
  db::SetString(doc, db::kVersionField, options_.version);
  db::SetString(doc, "creation_utc", util::ToIsoString(created_at.value_or(util::Now())));
  db::SetString(doc, options_.owner_field, entity_id);
  db::SetString(doc, options_.value_field, value);

  db::ThrowIfError(collection_->InsertOne(doc), "associate " + entity_id + " with " + value);
  return true;
}

void AssociationIndex::Remove(const std::string& entity_id, const std::string& value) {
  if (!RemoveIfPresent(entity_id, value)) {
    throw util::NotFound(options_.value_field + " '" + value + "' is not associated with " + entity_id);
  }
}

bool AssociationIndex::RemoveIfPresent(const std::string& entity_id, const std::string& value) {
  return collection_->DeleteOne(PairFilter(entity_id, value)).deleted_count > 0;
}

std::size_t AssociationIndex::RemoveAllFor(const std::string& entity_id) {
  std::size_t removed = 0;
  for (const auto& doc : collection_->Find(db::Filter::Eq(options_.owner_field, entity_id))) {
    removed += collection_->DeleteOne(db::Filter::Eq(db::kIdField, db::DocumentId(doc))).deleted_count;
  }
  return removed;
}

std::vector<std::string> AssociationIndex::ListForEntity(const std::string& entity_id) const {
  std::vector<std::string> values;
  for (const auto& doc : collection_->Find(db::Filter::Eq(options_.owner_field, entity_id))) {
    values.push_back(db::RequireString(doc, options_.value_field));
  }
  return values;
}

std::set<std::string> AssociationIndex::ListEntitiesFor(const std::vector<std::string>& values) const {
  std::set<std::string> ids;
  if (values.empty()) return ids;

  for (const auto& doc : collection_->Find(db::Filter::In(options_.value_field, values))) {
    ids.insert(db::RequireString(doc, options_.owner_field));
  }
  return ids;
}

std::set<std::string> AssociationIndex::ListAllEntities() const {
  std::set<std::string> ids;
  for (const auto& doc : collection_->Find(db::Filter::All())) {
    ids.insert(db::RequireString(doc, options_.owner_field));
  }
  return ids;
}

EntitySelection AssociationIndex::ResolveSelection(const std::optional<std::vector<std::string>>& values) const {
  EntitySelection selection;
  if (!values) {
    return selection;
  }

  if (values->empty()) {
    selection.kind = EntitySelection::Kind::kExclude;
    selection.ids  = ListAllEntities();
    return selection;
  }

  selection.kind = EntitySelection::Kind::kInclude;
  selection.ids  = ListEntitiesFor(*values);
  return selection;
}

std::vector<db::Document> AssociationIndex::All() const {
  return collection_->Find(db::Filter::All());
}

bool AssociationIndex::RemoveDocument(const std::string& association_id) {
  return collection_->DeleteOne(db::Filter::Eq(db::kIdField, association_id)).deleted_count > 0;
}

} // namespace entitystore::tags
