#pragma once

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/db/api/document_database.hpp"
#include "internal/util/checksum.hpp"
#include "internal/util/time.hpp"

namespace entitystore::tags {

struct AssociationOptions {
  // Field naming the owning entity, e.g. "can_rep_id".
  std::string owner_field;
  // Field holding the associated value, e.g. "tag_id" or "condition".
  std::string value_field;
  // Schema version written on new association documents.
  std::string    version;
  util::IdPolicy id_policy = util::IdPolicy::kRandom;
};

// Which entities a list query covers.
struct EntitySelection {
  enum class Kind {
    kAll,     // no restriction
    kExclude, // every entity except `ids`
    kInclude, // exactly `ids`; empty means nothing
  };

  Kind                  kind = Kind::kAll;
  std::set<std::string> ids;
};

/*
  Many-to-many links between entities and string values (tags, conditions).

  At most one association exists per (entity, value) pair. The index does no
  locking of its own; the owning store serializes access.
*/
class AssociationIndex {
 public:
  AssociationIndex(std::shared_ptr<db::DocumentCollection> collection, AssociationOptions options);

  // Returns true when a new association was created.
  bool Upsert(const std::string& entity_id, const std::string& value,
              std::optional<util::TimePoint> created_at = std::nullopt);

  // Throws util::NotFound when the pair is not associated.
  void Remove(const std::string& entity_id, const std::string& value);

  bool        RemoveIfPresent(const std::string& entity_id, const std::string& value);
  std::size_t RemoveAllFor(const std::string& entity_id);

  // Values of one entity, in association order.
  std::vector<std::string> ListForEntity(const std::string& entity_id) const;

  std::set<std::string> ListEntitiesFor(const std::vector<std::string>& values) const;
  std::set<std::string> ListAllEntities() const;

  /*
    nullopt         -> kAll
    empty list      -> kExclude of every entity holding any value
    non-empty list  -> kInclude of entities holding at least one of the values
  */
  EntitySelection ResolveSelection(const std::optional<std::vector<std::string>>& values) const;

  std::vector<db::Document> All() const;
  bool                      RemoveDocument(const std::string& association_id);

  const AssociationOptions& options() const {
    return options_;
  }

  const std::string& CollectionName() const {
    return collection_->Name();
  }

 private:
  std::string IssueAssociationId(const std::string& entity_id, const std::string& value) const;
  db::Filter  PairFilter(const std::string& entity_id, const std::string& value) const;

  std::shared_ptr<db::DocumentCollection> collection_;
  AssociationOptions                      options_;
};

} // namespace entitystore::tags
