#pragma once

#include <cstddef>
#include <string>

#include "internal/db/api/document_database.hpp"

namespace entitystore::db {

/*
  Shared open-time loading logic for all backends.

  A backend walks every persisted document through ApplyLoader() and acts on
  the decision: keep as-is, persist the replacement, or move the original to
  FailedMigrationsCollectionName(collection).
*/

struct LoadDecision {
  enum class Kind { kKeep, kReplace, kQuarantine };

  Kind        kind = Kind::kKeep;
  Document    document;
  std::string reason;
};

LoadDecision ApplyLoader(const DocumentLoader& loader, const Document& doc, const std::string& collection);

std::string FailedMigrationsCollectionName(const std::string& collection);

struct LoadStats {
  std::size_t kept        = 0;
  std::size_t upgraded    = 0;
  std::size_t quarantined = 0;

  void Record(LoadDecision::Kind kind);
};

void LogLoadStats(const std::string& collection, const LoadStats& stats);

} // namespace entitystore::db
