#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/document_database.hpp"
#include "internal/db/api/vector_database.hpp"
#include "internal/nlp/embedder.hpp"
#include "internal/store/entity_store.hpp"
#include "internal/stores/canned_response_store.hpp"
#include "internal/stores/journey_store.hpp"
#include "internal/stores/utterance_store.hpp"

namespace entitystore::factory {

/*
  Application

  Owns the backends, the embedder and one store per entity type.
  Stores are destroyed before the backends they reference.
*/
struct Application {
  std::shared_ptr<db::DocumentDatabase> document_db;
  std::shared_ptr<db::VectorDatabase>   vector_db;
  std::shared_ptr<const nlp::Embedder>  embedder;

  std::unique_ptr<stores::CannedResponseStore> canned_responses;
  std::unique_ptr<stores::UtteranceStore>      utterances;
  std::unique_ptr<stores::JourneyStore>        journeys;
};

/*
  Build

  Composition root: the only place that knows concrete backend and embedder
  types. Opening the stores runs migrations, so this throws
  util::MigrationRequired / util::ServerOutdated on incompatible data.
*/
Application Build(const entitystore::runtime::config::RuntimeConfig& config);

// Backends and embedder only; stores are left unopened.
store::StoreDependencies BuildDependencies(const entitystore::runtime::config::RuntimeConfig& config);

util::IdPolicy ResolveIdPolicy(const entitystore::runtime::config::StoreOptions& options, util::IdPolicy fallback);

} // namespace entitystore::factory
