#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_document_database.hpp"
#include "internal/db/memory/memory_vector_database.hpp"
#include "internal/nlp/hashing_embedder.hpp"
#include "internal/observability/logging.hpp"
#if ENTITYSTORE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_document_database.hpp"
#include "internal/db/sqlite/sqlite_vector_database.hpp"
#endif

namespace entitystore::factory {

using entitystore::runtime::config::RuntimeConfig;

namespace {

void BuildDatabases(const RuntimeConfig& config, store::StoreDependencies& deps) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if ENTITYSTORE_DB_SQLITE
    const auto& sqlite = database.sqlite();
    if (sqlite.document_path().empty()) {
      throw std::invalid_argument("database.sqlite.document_path is required");
    }

    auto document_file = std::make_shared<db::sqlite::SqliteDB>(sqlite.document_path());
    auto vector_file   = document_file;
    if (!sqlite.vector_path().empty() && sqlite.vector_path() != sqlite.document_path()) {
      vector_file = std::make_shared<db::sqlite::SqliteDB>(sqlite.vector_path());
    }

    deps.document_db = std::make_shared<db::sqlite::SqliteDocumentDatabase>(std::move(document_file));
    deps.vector_db   = std::make_shared<db::sqlite::SqliteVectorDatabase>(std::move(vector_file));

    ENTITYSTORE_LOG_INFO("sqlite backend", {observability::StringField("document_path", sqlite.document_path()),
                                            observability::StringField("vector_path", sqlite.vector_path())});
    return;
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  deps.document_db = std::make_shared<db::memory::MemoryDocumentDatabase>();
  deps.vector_db   = std::make_shared<db::memory::MemoryVectorDatabase>();
  ENTITYSTORE_LOG_INFO("memory backend");
}

std::shared_ptr<const nlp::Embedder> BuildEmbedder(const RuntimeConfig& config) {
  const auto& hashing = config.embedder().hashing();

  const std::size_t dimensions = hashing.dimensions() ? hashing.dimensions() : nlp::HashingEmbedder::kDefaultDimensions;
  const std::size_t max_tokens = hashing.max_tokens() ? hashing.max_tokens() : nlp::HashingEmbedder::kDefaultMaxTokens;

  return std::make_shared<nlp::HashingEmbedder>(dimensions, max_tokens);
}

} // namespace

util::IdPolicy ResolveIdPolicy(const entitystore::runtime::config::StoreOptions& options, util::IdPolicy fallback) {
  switch (options.id_policy()) {
    case entitystore::runtime::config::ID_POLICY_CONTENT_ADDRESSED:
      return util::IdPolicy::kContentAddressed;
    case entitystore::runtime::config::ID_POLICY_RANDOM:
      return util::IdPolicy::kRandom;
    default:
      return fallback;
  }
}

store::StoreDependencies BuildDependencies(const RuntimeConfig& config) {
  store::StoreDependencies deps;
  BuildDatabases(config, deps);
  deps.embedder        = BuildEmbedder(config);
  deps.allow_migration = config.migration().allow_migration();
  return deps;
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  auto deps = BuildDependencies(config);

  Application app;
  app.document_db = deps.document_db;
  app.vector_db   = deps.vector_db;
  app.embedder    = deps.embedder;

  const auto& stores = config.stores();

  app.canned_responses = std::make_unique<stores::CannedResponseStore>(
      deps, ResolveIdPolicy(stores.canned_responses(), util::IdPolicy::kContentAddressed));
  app.utterances =
      std::make_unique<stores::UtteranceStore>(deps, ResolveIdPolicy(stores.utterances(), util::IdPolicy::kRandom));
  app.journeys =
      std::make_unique<stores::JourneyStore>(deps, ResolveIdPolicy(stores.journeys(), util::IdPolicy::kRandom));

  return app;
}

} // namespace entitystore::factory
