#include "internal/persistence/migration_helper.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace entitystore::persistence {

using observability::StringField;

const char* ToString(MigrationState state) {
  switch (state) {
    case MigrationState::kNotOpened:
      return "not_opened";
    case MigrationState::kVersionChecked:
      return "version_checked";
    case MigrationState::kUpToDate:
      return "up_to_date";
    case MigrationState::kMigrationNeeded:
      return "migration_needed";
    case MigrationState::kMigrationDisallowed:
      return "migration_disallowed";
    case MigrationState::kOpen:
      return "open";
  }
  return "unknown";
}

// ------------------------------------------------------------------
// StoreMigrationHelper
// ------------------------------------------------------------------

StoreMigrationHelper::StoreMigrationHelper(std::string store_name, util::Version runtime_version,
                                           db::MetadataStore& metadata, bool allow_migration, std::string backend)
    : store_name_(std::move(store_name)),
      runtime_version_(runtime_version),
      metadata_(metadata),
      allow_migration_(allow_migration),
      backend_(std::move(backend)) {
}

std::string StoreMigrationHelper::VersionKey(const std::string& store_name) {
  return store_name + "_version";
}

MigrationState StoreMigrationHelper::Check() {
  const auto metadata = metadata_.ReadMetadata();
  auto       it       = metadata.find(VersionKey(store_name_));
  state_              = MigrationState::kVersionChecked;

  if (it == metadata.end()) {
    ENTITYSTORE_LOG_DEBUG("new store", {StringField("store", store_name_), StringField("backend", backend_),
                                        StringField("version", runtime_version_.ToString())});
    state_ = MigrationState::kUpToDate;
    return state_;
  }

  util::Version stored;
  try {
    stored = util::Version::FromString(it->second);
  } catch (const std::invalid_argument& e) {
    throw util::BackendError("store " + store_name_ + " has a corrupt version marker: " + e.what());
  }

  if (stored == runtime_version_) {
    state_ = MigrationState::kUpToDate;
    return state_;
  }

  if (stored > runtime_version_) {
    throw util::ServerOutdated(store_name_ + " (" + backend_ + ") was written by version " + stored.ToString() +
                               ", newer than this runtime's " + runtime_version_.ToString());
  }

  if (!allow_migration_) {
    state_ = MigrationState::kMigrationDisallowed;
    throw util::MigrationRequired(store_name_ + " (" + backend_ + ") is at version " + stored.ToString() +
                                  " and needs migration to " + runtime_version_.ToString());
  }

  ENTITYSTORE_LOG_INFO("migrating store", {StringField("store", store_name_), StringField("backend", backend_),
                                           StringField("from", stored.ToString()),
                                           StringField("to", runtime_version_.ToString())});
  state_ = MigrationState::kMigrationNeeded;
  return state_;
}

void StoreMigrationHelper::Commit() {
  if (state_ != MigrationState::kUpToDate && state_ != MigrationState::kMigrationNeeded) {
    throw std::logic_error(std::string("store migration commit from state ") + ToString(state_));
  }

  db::ThrowIfError(metadata_.UpsertMetadata(VersionKey(store_name_), runtime_version_.ToString()),
                   "record version of " + store_name_);
  state_ = MigrationState::kOpen;
}

// ------------------------------------------------------------------
// DocumentMigrationHelper
// ------------------------------------------------------------------

DocumentMigrationHelper::DocumentMigrationHelper(std::string target_version, ConverterTable converters)
    : target_version_(std::move(target_version)), converters_(std::move(converters)) {
}

std::optional<db::Document> DocumentMigrationHelper::Migrate(const db::Document& doc) const {
  auto version = db::GetString(doc, db::kVersionField);
  if (!version) {
    throw util::UnmigratableDocument("document " + db::DocumentId(doc) + " has no version", "");
  }

  db::Document current = doc;

  // each step must move forward, so a chain longer than the table is a cycle
  for (std::size_t steps = 0; *version != target_version_; ++steps) {
    auto it = converters_.find(*version);
    if (it == converters_.end() || steps > converters_.size()) {
      throw util::UnmigratableDocument(
          "no migration path for document " + db::DocumentId(doc) + " from version " + *version, *version);
    }

    auto next = it->second(current);
    if (!next) {
      return std::nullopt;
    }

    current = std::move(*next);
    version = db::GetString(current, db::kVersionField);
    if (!version) {
      throw util::UnmigratableDocument("converter dropped the version of document " + db::DocumentId(doc),
                                       it->first);
    }
  }

  return current;
}

db::DocumentLoader DocumentMigrationHelper::AsLoader() const {
  return [helper = *this](const db::Document& doc) { return helper.Migrate(doc); };
}

Converter BumpVersion(std::string to) {
  return [to = std::move(to)](const db::Document& doc) -> std::optional<db::Document> {
    db::Document next = doc;
    db::SetString(next, db::kVersionField, to);
    return next;
  };
}

} // namespace entitystore::persistence
