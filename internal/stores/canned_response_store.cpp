#include "internal/stores/canned_response_store.hpp"

namespace entitystore::stores {

static CannedResponse FromEntity(const store::Entity& entity) {
  CannedResponse response;
  response.id           = entity.id;
  response.creation_utc = entity.creation_utc;
  response.value        = db::RequireString(entity.fields, "value");
  response.fields       = ParseFields(db::GetString(entity.fields, "fields").value_or("[]"));
  response.signals      = db::GetStringList(entity.fields, "signals");
  response.tags         = entity.tags;
  return response;
}

static store::Entity ToEntity(const CannedResponse& response) {
  store::Entity entity;
  entity.id           = response.id;
  entity.creation_utc = response.creation_utc;
  db::SetString(entity.fields, "value", response.value);
  db::SetString(entity.fields, "fields", SerializeFields(response.fields));
  db::SetStringList(entity.fields, "signals", response.signals);
  entity.tags = response.tags;
  return entity;
}

store::EntityDescriptor CannedResponseStore::Descriptor(util::IdPolicy id_policy) {
  store::EntityDescriptor d;
  d.store_name     = "CannedResponseStore";
  d.collection     = "canned_responses";
  d.owner_field    = "can_rep_id";
  d.tag_collection = "canned_response_tag_associations";

  d.document_track = {kVersion, {}};
  d.vector_track   = {kVersion, {}};
  d.tag_track      = {kVersion,
                      {
                          {"0.2.0", persistence::BumpVersion("0.3.0")},
                          {"0.3.0", persistence::BumpVersion("0.4.0")},
                      }};

  d.id_policy = id_policy;

  d.content_key = [](const db::Document& fields) {
    return db::GetString(fields, "value").value_or("") + db::GetString(fields, "fields").value_or("[]");
  };

  d.list_contents = [](const store::Entity& entity) {
    std::vector<std::string> contents{db::RequireString(entity.fields, "value")};
    for (auto& signal : db::GetStringList(entity.fields, "signals")) contents.push_back(std::move(signal));
    return contents;
  };
  return d;
}

CannedResponseStore::CannedResponseStore(store::StoreDependencies deps, util::IdPolicy id_policy)
    : store_(std::move(deps), Descriptor(id_policy)) {
}

CannedResponse CannedResponseStore::Create(const std::string& value, const std::vector<CannedResponseField>& fields,
                                           const std::vector<std::string>& signals,
                                           std::optional<util::TimePoint> creation_utc,
                                           const std::vector<std::string>& tags) {
  db::Document doc;
  db::SetString(doc, "value", value);
  db::SetString(doc, "fields", SerializeFields(fields));
  db::SetStringList(doc, "signals", signals);

  return FromEntity(store_.Create(doc, tags, creation_utc));
}

CannedResponse CannedResponseStore::Read(const std::string& id) const {
  return FromEntity(store_.Read(id));
}

CannedResponse CannedResponseStore::Update(const std::string& id, const CannedResponseUpdateParams& params) {
  db::Document partial;
  if (params.value) db::SetString(partial, "value", *params.value);
  if (params.fields) db::SetString(partial, "fields", SerializeFields(*params.fields));
  if (params.signals) db::SetStringList(partial, "signals", *params.signals);

  return FromEntity(store_.Update(id, partial));
}

void CannedResponseStore::Delete(const std::string& id) {
  store_.Delete(id);
}

std::vector<CannedResponse> CannedResponseStore::List(const std::optional<std::vector<std::string>>& tags) const {
  std::vector<CannedResponse> out;
  for (const auto& entity : store_.List(tags)) out.push_back(FromEntity(entity));
  return out;
}

bool CannedResponseStore::UpsertTag(const std::string& id, const std::string& tag,
                                    std::optional<util::TimePoint> created_at) {
  return store_.UpsertTag(id, tag, created_at);
}

void CannedResponseStore::RemoveTag(const std::string& id, const std::string& tag) {
  store_.RemoveTag(id, tag);
}

std::vector<CannedResponse> CannedResponseStore::FindRelevant(const std::string&                 query,
                                                              const std::vector<CannedResponse>& available,
                                                              std::size_t                        max_count) const {
  std::vector<store::Entity> candidates;
  candidates.reserve(available.size());
  for (const auto& response : available) candidates.push_back(ToEntity(response));

  std::vector<CannedResponse> out;
  for (const auto& entity : store_.FindRelevant(query, candidates, max_count)) out.push_back(FromEntity(entity));
  return out;
}

} // namespace entitystore::stores
