#include "internal/db/api/collection_loader.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace entitystore::db {

DocumentLoader IdentityLoader() {
  return [](const Document& doc) -> std::optional<Document> { return doc; };
}

LoadDecision ApplyLoader(const DocumentLoader& loader, const Document& doc, const std::string& collection) {
  LoadDecision decision;

  std::optional<Document> loaded;
  try {
    loaded = loader(doc);
  } catch (const util::UnmigratableDocument& e) {
    decision.kind     = LoadDecision::Kind::kQuarantine;
    decision.document = doc;
    decision.reason   = e.what();
  }

  if (decision.kind == LoadDecision::Kind::kQuarantine || !loaded) {
    decision.kind     = LoadDecision::Kind::kQuarantine;
    decision.document = doc;
    if (decision.reason.empty()) decision.reason = "loader dropped document";

    ENTITYSTORE_LOG_WARN("document failed migration",
                         {observability::StringField("collection", collection),
                          observability::StringField("id", DocumentId(doc)),
                          observability::StringField("version", GetString(doc, kVersionField).value_or("<none>")),
                          observability::StringField("reason", decision.reason)});
    return decision;
  }

  decision.document = std::move(*loaded);
  decision.kind     = Equals(decision.document, doc) ? LoadDecision::Kind::kKeep : LoadDecision::Kind::kReplace;
  return decision;
}

std::string FailedMigrationsCollectionName(const std::string& collection) {
  return collection + "_failed_migrations";
}

void LoadStats::Record(LoadDecision::Kind kind) {
  switch (kind) {
    case LoadDecision::Kind::kKeep:
      ++kept;
      break;
    case LoadDecision::Kind::kReplace:
      ++upgraded;
      break;
    case LoadDecision::Kind::kQuarantine:
      ++quarantined;
      break;
  }
}

void LogLoadStats(const std::string& collection, const LoadStats& stats) {
  if (stats.upgraded == 0 && stats.quarantined == 0) {
    ENTITYSTORE_LOG_DEBUG("collection loaded", {observability::StringField("collection", collection),
                                                observability::IntField("documents", stats.kept)});
    return;
  }

  ENTITYSTORE_LOG_INFO("collection loaded", {observability::StringField("collection", collection),
                                             observability::IntField("kept", stats.kept),
                                             observability::IntField("upgraded", stats.upgraded),
                                             observability::IntField("quarantined", stats.quarantined)});
}

} // namespace entitystore::db
