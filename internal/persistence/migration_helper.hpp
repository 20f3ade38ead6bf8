#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>

#include "internal/db/api/document_database.hpp"
#include "internal/util/version.hpp"

namespace entitystore::persistence {

enum class MigrationState {
  kNotOpened,
  kVersionChecked,
  kUpToDate,
  kMigrationNeeded,
  kMigrationDisallowed,
  kOpen,
};

const char* ToString(MigrationState state);

/*
  Store-level schema gate.

  Check() compares the persisted "<store>_version" metadata value with the
  runtime version:
    - absent          -> new store, UpToDate
    - equal           -> UpToDate
    - older, allowed  -> MigrationNeeded
    - older, refused  -> throws util::MigrationRequired
    - newer           -> throws util::ServerOutdated

  Commit() records the runtime version once the store's collections have been
  opened, and moves to Open.
*/
class StoreMigrationHelper {
 public:
  StoreMigrationHelper(std::string store_name, util::Version runtime_version, db::MetadataStore& metadata,
                       bool allow_migration, std::string backend);

  MigrationState Check();
  void           Commit();

  MigrationState state() const {
    return state_;
  }

  static std::string VersionKey(const std::string& store_name);

 private:
  std::string        store_name_;
  util::Version      runtime_version_;
  db::MetadataStore& metadata_;
  bool               allow_migration_;
  std::string        backend_;
  MigrationState     state_ = MigrationState::kNotOpened;
};

// Upgrades a document by exactly one schema step. nullopt drops it.
using Converter      = std::function<std::optional<db::Document>(const db::Document&)>;
using ConverterTable = std::map<std::string, Converter>;

/*
  Per-document upgrade chain.

  Documents at the target version pass through untouched. Otherwise the
  converter registered for the document's version is applied repeatedly until
  the target is reached. A missing converter, a missing "version" field or a
  chain that stops making progress throws util::UnmigratableDocument.
*/
class DocumentMigrationHelper {
 public:
  DocumentMigrationHelper(std::string target_version, ConverterTable converters);

  std::optional<db::Document> Migrate(const db::Document& doc) const;

  db::DocumentLoader AsLoader() const;

  const std::string& target_version() const {
    return target_version_;
  }

 private:
  std::string    target_version_;
  ConverterTable converters_;
};

// Converter that only rewrites "version" to `to`.
Converter BumpVersion(std::string to);

} // namespace entitystore::persistence
