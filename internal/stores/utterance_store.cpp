#include "internal/stores/utterance_store.hpp"

namespace entitystore::stores {

static Utterance FromEntity(const store::Entity& entity) {
  Utterance utterance;
  utterance.id           = entity.id;
  utterance.creation_utc = entity.creation_utc;
  utterance.value        = db::RequireString(entity.fields, "value");
  utterance.fields       = ParseFields(db::GetString(entity.fields, "fields").value_or("[]"));
  utterance.queries      = ParseStrings(db::GetString(entity.fields, "queries").value_or("[]"));
  utterance.tags         = entity.tags;
  return utterance;
}

static store::Entity ToEntity(const Utterance& utterance) {
  store::Entity entity;
  entity.id           = utterance.id;
  entity.creation_utc = utterance.creation_utc;
  db::SetString(entity.fields, "value", utterance.value);
  db::SetString(entity.fields, "fields", SerializeFields(utterance.fields));
  db::SetString(entity.fields, "queries", SerializeStrings(utterance.queries));
  entity.tags = utterance.tags;
  return entity;
}

// 0.2.0 records predate sample queries.
static std::optional<db::Document> AddQueries(const db::Document& doc) {
  db::Document next = doc;
  if (!db::Has(next, "queries")) db::SetString(next, "queries", "[]");
  db::SetString(next, db::kVersionField, "0.3.0");
  return next;
}

store::EntityDescriptor UtteranceStore::Descriptor(util::IdPolicy id_policy) {
  store::EntityDescriptor d;
  d.store_name     = "UtteranceStore";
  d.collection     = "utterances";
  d.owner_field    = "utterance_id";
  d.tag_collection = "utterance_tag_associations";

  d.document_track = {kVersion, {{"0.2.0", AddQueries}}};
  d.vector_track   = {kVersion, {{"0.2.0", persistence::BumpVersion("0.3.0")}}};
  d.tag_track      = {kVersion, {{"0.2.0", persistence::BumpVersion("0.3.0")}}};

  d.id_policy = id_policy;

  d.content_key = [](const db::Document& fields) {
    return db::GetString(fields, "value").value_or("") + db::GetString(fields, "fields").value_or("[]");
  };

  d.list_contents = [](const store::Entity& entity) {
    std::vector<std::string> contents{db::RequireString(entity.fields, "value")};
    for (auto& query : ParseStrings(db::GetString(entity.fields, "queries").value_or("[]"))) {
      contents.push_back(std::move(query));
    }
    return contents;
  };
  return d;
}

UtteranceStore::UtteranceStore(store::StoreDependencies deps, util::IdPolicy id_policy)
    : store_(std::move(deps), Descriptor(id_policy)) {
}

Utterance UtteranceStore::Create(const std::string& value, const std::vector<UtteranceField>& fields,
                                 const std::vector<std::string>& queries, std::optional<util::TimePoint> creation_utc,
                                 const std::vector<std::string>& tags) {
  db::Document doc;
  db::SetString(doc, "value", value);
  db::SetString(doc, "fields", SerializeFields(fields));
  db::SetString(doc, "queries", SerializeStrings(queries));

  return FromEntity(store_.Create(doc, tags, creation_utc));
}

Utterance UtteranceStore::Read(const std::string& id) const {
  return FromEntity(store_.Read(id));
}

Utterance UtteranceStore::Update(const std::string& id, const UtteranceUpdateParams& params) {
  db::Document partial;
  if (params.value) db::SetString(partial, "value", *params.value);
  if (params.fields) db::SetString(partial, "fields", SerializeFields(*params.fields));
  if (params.queries) db::SetString(partial, "queries", SerializeStrings(*params.queries));

  return FromEntity(store_.Update(id, partial));
}

void UtteranceStore::Delete(const std::string& id) {
  store_.Delete(id);
}

std::vector<Utterance> UtteranceStore::List(const std::optional<std::vector<std::string>>& tags) const {
  std::vector<Utterance> out;
  for (const auto& entity : store_.List(tags)) out.push_back(FromEntity(entity));
  return out;
}

bool UtteranceStore::UpsertTag(const std::string& id, const std::string& tag, std::optional<util::TimePoint> created_at) {
  return store_.UpsertTag(id, tag, created_at);
}

void UtteranceStore::RemoveTag(const std::string& id, const std::string& tag) {
  store_.RemoveTag(id, tag);
}

std::vector<Utterance> UtteranceStore::FindRelevant(const std::string& query, const std::vector<Utterance>& available,
                                                    std::size_t max_count) const {
  std::vector<store::Entity> candidates;
  candidates.reserve(available.size());
  for (const auto& utterance : available) candidates.push_back(ToEntity(utterance));

  std::vector<Utterance> out;
  for (const auto& entity : store_.FindRelevant(query, candidates, max_count)) out.push_back(FromEntity(entity));
  return out;
}

} // namespace entitystore::stores
