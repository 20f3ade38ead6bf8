#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/document_database.hpp"
#include "internal/db/api/vector_database.hpp"
#include "internal/nlp/embedder.hpp"
#include "internal/persistence/migration_helper.hpp"
#include "internal/tags/association_index.hpp"
#include "internal/util/checksum.hpp"
#include "internal/util/rw_lock.hpp"
#include "internal/util/time.hpp"

namespace entitystore::store {

/*
  Generic stored entity.

  `fields` holds the type-specific content; the typed stores interpret it.
  `associations` is keyed by AssociationSpec::name.
*/
struct Entity {
  std::string                                     id;
  util::TimePoint                                 creation_utc;
  std::string                                     checksum;
  db::Document                                    fields;
  std::vector<std::string>                        tags;
  std::map<std::string, std::vector<std::string>> associations;
};

using AssociationValues = std::map<std::string, std::vector<std::string>>;

struct VersionTrack {
  std::string                 version;
  persistence::ConverterTable converters;
};

// Extra many-to-many link owned by an entity type, e.g. journey conditions.
struct AssociationSpec {
  std::string  name;
  std::string  collection;
  std::string  value_field;
  VersionTrack track;
  // Whether the values are part of the embedded text.
  bool affects_content = false;
};

struct AssociationFilter {
  std::string name;
  std::string value;
};

struct EntityDescriptor {
  // Metadata key prefix, e.g. "CannedResponseStore".
  std::string store_name;
  // Structured and vector collection name.
  std::string collection;
  // Back-reference field on vector and association documents.
  std::string owner_field;
  std::string tag_collection;

  VersionTrack document_track;
  VersionTrack vector_track;
  VersionTrack tag_track;

  std::vector<AssociationSpec> associations;

  util::IdPolicy id_policy = util::IdPolicy::kRandom;

  // Text whose checksum identifies the content.
  std::function<std::string(const db::Document& fields)> content_key;
  // Independently embeddable texts of an entity, one vector document each.
  std::function<std::vector<std::string>(const Entity& entity)> list_contents;
};

struct StoreDependencies {
  std::shared_ptr<db::DocumentDatabase>  document_db;
  std::shared_ptr<db::VectorDatabase>    vector_db;
  std::shared_ptr<const nlp::Embedder>   embedder;
  bool                                   allow_migration = true;
};

struct ReconcileReport {
  std::size_t orphaned_vectors      = 0;
  std::size_t orphaned_associations = 0;
};

struct StoreStats {
  std::size_t                        records = 0;
  std::size_t                        vectors = 0;
  std::size_t                        tags    = 0;
  std::map<std::string, std::size_t> associations;
  std::size_t                        failed_records = 0;
  std::size_t                        failed_vectors = 0;
};

/*
  One entity type over a document backend and a vector backend.

  Every operation runs under the store's reader/writer lock: reads share it,
  mutations hold it exclusively. Writes go structured record first, then
  associations, then vector documents, then tags; a crash in between can leave
  orphaned vector documents or associations, which Reconcile() removes.

  The constructor opens both backends and runs migrations. It throws
  util::MigrationRequired or util::ServerOutdated when the persisted data
  cannot be opened by this version.
*/
class EntityStore {
 public:
  EntityStore(StoreDependencies deps, EntityDescriptor descriptor);

  EntityStore(const EntityStore&)            = delete;
  EntityStore& operator=(const EntityStore&) = delete;

  // Content-addressed stores return the existing entity when the content is already stored.
  Entity Create(const db::Document& fields, const std::vector<std::string>& tags = {},
                std::optional<util::TimePoint> creation_utc = std::nullopt,
                const AssociationValues&       associations = {});

  Entity Read(const std::string& id) const;

  // Merges `partial` over the stored fields. Tags and associations are untouched.
  Entity Update(const std::string& id, const db::Document& partial);

  void Delete(const std::string& id);

  std::vector<Entity> List(const std::optional<std::vector<std::string>>& tags   = std::nullopt,
                           const std::optional<AssociationFilter>&        filter = std::nullopt) const;

  bool UpsertTag(const std::string& id, const std::string& tag,
                 std::optional<util::TimePoint> created_at = std::nullopt);
  void RemoveTag(const std::string& id, const std::string& tag);

  bool UpsertAssociation(const std::string& name, const std::string& id, const std::string& value,
                         std::optional<util::TimePoint> created_at = std::nullopt);
  bool RemoveAssociation(const std::string& name, const std::string& id, const std::string& value);

  // Candidates ranked by semantic distance to `query`, at most max_count.
  std::vector<Entity> FindRelevant(const std::string& query, const std::vector<Entity>& candidates,
                                   std::size_t max_count) const;

  ReconcileReport Reconcile();

  StoreStats Stats() const;

  const EntityDescriptor& descriptor() const {
    return descriptor_;
  }

 private:
  std::optional<db::Document> FindRecordUnlocked(const std::string& id) const;
  db::Document                RequireRecordUnlocked(const std::string& id) const;
  Entity                      HydrateUnlocked(const db::Document& record) const;

  db::Document BuildRecord(const std::string& id, util::TimePoint creation_utc, const db::Document& fields) const;

  void        InsertVectorsUnlocked(const Entity& entity);
  std::size_t DeleteVectorsUnlocked(const std::string& id);
  void        RefreshVectorsUnlocked(const std::string& id);

  tags::AssociationIndex& AssociationUnlocked(const std::string& name) const;
  bool                    AffectsContent(const std::string& name) const;

  StoreDependencies deps_;
  EntityDescriptor  descriptor_;

  std::shared_ptr<db::DocumentCollection>                  records_;
  std::shared_ptr<db::VectorCollection>                    vectors_;
  std::unique_ptr<tags::AssociationIndex>                  tags_;
  std::map<std::string, std::unique_ptr<tags::AssociationIndex>> associations_;

  util::ReaderWriterLock lock_;
};

// Record keys managed by the store; never part of Entity::fields.
bool IsReservedField(const std::string& key);

} // namespace entitystore::store
