#include <iostream>
#include <string>
#include <vector>

#include "commands.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

int main(int argc, char** argv) {
  if (argc < 3) {
    entitystore::ctl::PrintUsage(std::cout);
    return 1;
  }

  const std::string              config_path = argv[1];
  const std::string              cmd         = argv[2];
  const std::vector<std::string> args(argv + 3, argv + argc);

  if (cmd != "migrate" && cmd != "stats" && cmd != "list" && cmd != "search" && cmd != "reconcile") {
    entitystore::ctl::PrintUsage(std::cout);
    return 1;
  }

  try {
    auto config = entitystore::config::ConfigLoader::LoadFromYaml(config_path);
    if (cmd == "migrate") {
      config.mutable_migration()->set_allow_migration(true);
    }

    entitystore::observability::InitializeLogging(config);

    auto app = entitystore::factory::Build(config);

    int rc = 0;
    if (cmd == "migrate") {
      ENTITYSTORE_LOG_INFO("all stores migrated");
      rc = entitystore::ctl::RunStats(app, std::cout);
    } else if (cmd == "stats") {
      rc = entitystore::ctl::RunStats(app, std::cout);
    } else if (cmd == "list") {
      rc = entitystore::ctl::RunList(app, args, std::cout, std::cerr);
    } else if (cmd == "search") {
      rc = entitystore::ctl::RunSearch(app, args, std::cout, std::cerr);
    } else {
      rc = entitystore::ctl::RunReconcile(app, std::cout);
    }

    entitystore::observability::ShutdownLogging();
    return rc;
  } catch (const entitystore::util::MigrationRequired& e) {
    ENTITYSTORE_LOG_ERROR("migration required, rerun with 'migrate'", {entitystore::observability::StringField("error", e.what())});
  } catch (const std::exception& e) {
    ENTITYSTORE_LOG_ERROR("Fatal error", {entitystore::observability::StringField("error", e.what())});
  }

  entitystore::observability::ShutdownLogging();
  return 2;
}
