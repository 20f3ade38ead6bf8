#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/store/entity_store.hpp"
#include "internal/stores/template_fields.hpp"

namespace entitystore::stores {

using CannedResponseField = TemplateField;

struct CannedResponse {
  std::string                      id;
  util::TimePoint                  creation_utc;
  std::string                      value;
  std::vector<CannedResponseField> fields;
  // Alternative phrasings that should also retrieve this response.
  std::vector<std::string> signals;
  std::vector<std::string> tags;
};

struct CannedResponseUpdateParams {
  std::optional<std::string>                      value;
  std::optional<std::vector<CannedResponseField>> fields;
  std::optional<std::vector<std::string>>         signals;
};

/*
  Pre-authored agent replies.

  Content-addressed by default: the id derives from value and fields, so
  creating identical content twice yields one record. Value and each signal are
  embedded separately.
*/
class CannedResponseStore {
 public:
  static constexpr const char* kVersion = "0.4.0";

  explicit CannedResponseStore(store::StoreDependencies deps,
                               util::IdPolicy           id_policy = util::IdPolicy::kContentAddressed);

  CannedResponse Create(const std::string& value, const std::vector<CannedResponseField>& fields = {},
                        const std::vector<std::string>& signals = {},
                        std::optional<util::TimePoint>  creation_utc = std::nullopt,
                        const std::vector<std::string>& tags         = {});

  CannedResponse Read(const std::string& id) const;
  CannedResponse Update(const std::string& id, const CannedResponseUpdateParams& params);
  void           Delete(const std::string& id);

  std::vector<CannedResponse> List(const std::optional<std::vector<std::string>>& tags = std::nullopt) const;

  bool UpsertTag(const std::string& id, const std::string& tag, std::optional<util::TimePoint> created_at = std::nullopt);
  void RemoveTag(const std::string& id, const std::string& tag);

  std::vector<CannedResponse> FindRelevant(const std::string& query, const std::vector<CannedResponse>& available,
                                           std::size_t max_count) const;

  store::EntityStore& entities() {
    return store_;
  }

  static store::EntityDescriptor Descriptor(util::IdPolicy id_policy);

 private:
  store::EntityStore store_;
};

} // namespace entitystore::stores
