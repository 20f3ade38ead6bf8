#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "internal/store/entity_store.hpp"
#include "internal/stores/template_fields.hpp"

namespace entitystore::stores {

using UtteranceField = TemplateField;

struct Utterance {
  std::string                 id;
  util::TimePoint             creation_utc;
  std::string                 value;
  std::vector<UtteranceField> fields;
  // Sample customer queries this utterance answers.
  std::vector<std::string> queries;
  std::vector<std::string> tags;
};

struct UtteranceUpdateParams {
  std::optional<std::string>                 value;
  std::optional<std::vector<UtteranceField>> fields;
  std::optional<std::vector<std::string>>    queries;
};

class UtteranceStore {
 public:
  static constexpr const char* kVersion = "0.3.0";

  explicit UtteranceStore(store::StoreDependencies deps, util::IdPolicy id_policy = util::IdPolicy::kRandom);

  Utterance Create(const std::string& value, const std::vector<UtteranceField>& fields = {},
                   const std::vector<std::string>& queries = {}, std::optional<util::TimePoint> creation_utc = std::nullopt,
                   const std::vector<std::string>& tags = {});

  Utterance Read(const std::string& id) const;
  Utterance Update(const std::string& id, const UtteranceUpdateParams& params);
  void      Delete(const std::string& id);

  std::vector<Utterance> List(const std::optional<std::vector<std::string>>& tags = std::nullopt) const;

  bool UpsertTag(const std::string& id, const std::string& tag, std::optional<util::TimePoint> created_at = std::nullopt);
  void RemoveTag(const std::string& id, const std::string& tag);

  std::vector<Utterance> FindRelevant(const std::string& query, const std::vector<Utterance>& available,
                                      std::size_t max_count) const;

  store::EntityStore& entities() {
    return store_;
  }

  static store::EntityDescriptor Descriptor(util::IdPolicy id_policy);

 private:
  store::EntityStore store_;
};

} // namespace entitystore::stores
