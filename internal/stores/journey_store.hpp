#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "internal/store/entity_store.hpp"

namespace entitystore::stores {

struct Journey {
  std::string              id;
  util::TimePoint          creation_utc;
  std::vector<std::string> conditions;
  std::string              title;
  std::string              description;
  std::vector<std::string> tags;
};

struct JourneyUpdateParams {
  std::optional<std::string> title;
  std::optional<std::string> description;
};

/*
  Multi-step conversational flows.

  A journey is embedded as one text combining title, description and its
  conditions, so adding or removing a condition re-embeds it.
*/
class JourneyStore {
 public:
  static constexpr const char* kVersion            = "0.2.0";
  static constexpr const char* kConditions         = "conditions";
  static constexpr std::size_t kDefaultMaxJourneys = 5;

  explicit JourneyStore(store::StoreDependencies deps, util::IdPolicy id_policy = util::IdPolicy::kRandom);

  Journey Create(const std::string& title, const std::string& description, const std::vector<std::string>& conditions,
                 std::optional<util::TimePoint> creation_utc = std::nullopt, const std::vector<std::string>& tags = {});

  Journey Read(const std::string& id) const;
  Journey Update(const std::string& id, const JourneyUpdateParams& params);
  void    Delete(const std::string& id);

  // Both filters narrow the result; tags follow the usual None/empty/any-of rules.
  std::vector<Journey> List(const std::optional<std::vector<std::string>>& tags      = std::nullopt,
                            const std::optional<std::string>&              condition = std::nullopt) const;

  bool AddCondition(const std::string& id, const std::string& condition);
  bool RemoveCondition(const std::string& id, const std::string& condition);

  bool UpsertTag(const std::string& id, const std::string& tag, std::optional<util::TimePoint> created_at = std::nullopt);
  void RemoveTag(const std::string& id, const std::string& tag);

  std::vector<Journey> FindRelevant(const std::string& query, const std::vector<Journey>& available,
                                    std::size_t max_journeys = kDefaultMaxJourneys) const;

  store::EntityStore& entities() {
    return store_;
  }

  static std::string AssembleContent(const std::string& title, const std::string& description,
                                     const std::vector<std::string>& conditions);

  static store::EntityDescriptor Descriptor(util::IdPolicy id_policy);

 private:
  store::EntityStore store_;
};

} // namespace entitystore::stores
