#include "commands.hpp"

#include <cstdlib>
#include <map>
#include <stdexcept>

#include "internal/db/api/document.hpp"
#include "internal/util/time.hpp"

namespace entitystore::ctl {

using store::EntityStore;

static constexpr const char* kUntaggedFlag = "--untagged";

void PrintUsage(std::ostream& out) {
  out << "Usage:\n"
      << "  entitystorectl <config.yaml> migrate\n"
      << "  entitystorectl <config.yaml> stats\n"
      << "  entitystorectl <config.yaml> list <store> [--untagged | tag...]\n"
      << "  entitystorectl <config.yaml> search <store> <max_count> <query...>\n"
      << "  entitystorectl <config.yaml> reconcile\n"
      << "\n"
      << "Stores: canned_responses, utterances, journeys\n";
}

static std::map<std::string, EntityStore*> Stores(factory::Application& app) {
  return {
      {"canned_responses", &app.canned_responses->entities()},
      {"utterances", &app.utterances->entities()},
      {"journeys", &app.journeys->entities()},
  };
}

static EntityStore* FindStore(factory::Application& app, const std::string& name, std::ostream& err) {
  auto stores = Stores(app);
  auto it     = stores.find(name);
  if (it == stores.end()) {
    err << "unknown store: " << name << "\n";
    return nullptr;
  }
  return it->second;
}

static void PrintEntity(const store::Entity& entity, std::ostream& out) {
  out << entity.id << "\t" << util::ToIsoString(entity.creation_utc) << "\t" << db::ToJson(entity.fields);
  if (!entity.tags.empty()) {
    out << "\ttags=";
    for (std::size_t i = 0; i < entity.tags.size(); ++i) out << (i ? "," : "") << entity.tags[i];
  }
  out << "\n";
}

std::optional<std::vector<std::string>> ParseTagSelection(const std::vector<std::string>& words) {
  if (words.empty()) return std::nullopt;

  for (const auto& word : words) {
    if (word == kUntaggedFlag) {
      if (words.size() != 1) {
        throw std::invalid_argument(std::string(kUntaggedFlag) + " cannot be combined with tags");
      }
      return std::vector<std::string>{};
    }
  }
  return words;
}

int RunStats(factory::Application& app, std::ostream& out) {
  for (const auto& [name, store] : Stores(app)) {
    const auto stats = store->Stats();
    out << name << ": records=" << stats.records << " vectors=" << stats.vectors << " tags=" << stats.tags;
    for (const auto& [assoc, count] : stats.associations) out << " " << assoc << "=" << count;
    out << " failed_records=" << stats.failed_records << " failed_vectors=" << stats.failed_vectors << "\n";
  }
  return 0;
}

int RunList(factory::Application& app, const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
  if (args.empty()) {
    PrintUsage(err);
    return 1;
  }

  auto* store = FindStore(app, args[0], err);
  if (!store) return 1;

  std::optional<std::vector<std::string>> tags;
  try {
    tags = ParseTagSelection(std::vector<std::string>(args.begin() + 1, args.end()));
  } catch (const std::invalid_argument& e) {
    err << e.what() << "\n";
    return 1;
  }

  for (const auto& entity : store->List(tags)) PrintEntity(entity, out);
  return 0;
}

int RunSearch(factory::Application& app, const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
  if (args.size() < 3) {
    PrintUsage(err);
    return 1;
  }

  auto* store = FindStore(app, args[0], err);
  if (!store) return 1;

  char*      end       = nullptr;
  const long max_count = std::strtol(args[1].c_str(), &end, 10);
  if (args[1].empty() || !end || *end != '\0' || max_count < 0) {
    err << "invalid max_count: " << args[1] << "\n";
    return 1;
  }

  std::string query;
  for (std::size_t i = 2; i < args.size(); ++i) query += (i > 2 ? " " : "") + args[i];

  for (const auto& entity : store->FindRelevant(query, store->List(), static_cast<std::size_t>(max_count))) {
    PrintEntity(entity, out);
  }
  return 0;
}

int RunReconcile(factory::Application& app, std::ostream& out) {
  for (const auto& [name, store] : Stores(app)) {
    const auto report = store->Reconcile();
    out << name << ": orphaned_vectors=" << report.orphaned_vectors
        << " orphaned_associations=" << report.orphaned_associations << "\n";
  }
  return 0;
}

} // namespace entitystore::ctl
