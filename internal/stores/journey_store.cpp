#include "internal/stores/journey_store.hpp"

namespace entitystore::stores {

static Journey FromEntity(const store::Entity& entity) {
  Journey journey;
  journey.id           = entity.id;
  journey.creation_utc = entity.creation_utc;
  journey.title        = db::RequireString(entity.fields, "title");
  journey.description  = db::RequireString(entity.fields, "description");
  journey.tags         = entity.tags;

  auto it = entity.associations.find(JourneyStore::kConditions);
  if (it != entity.associations.end()) journey.conditions = it->second;
  return journey;
}

static store::Entity ToEntity(const Journey& journey) {
  store::Entity entity;
  entity.id           = journey.id;
  entity.creation_utc = journey.creation_utc;
  db::SetString(entity.fields, "title", journey.title);
  db::SetString(entity.fields, "description", journey.description);
  entity.tags                                   = journey.tags;
  entity.associations[JourneyStore::kConditions] = journey.conditions;
  return entity;
}

std::string JourneyStore::AssembleContent(const std::string& title, const std::string& description,
                                          const std::vector<std::string>& conditions) {
  std::string joined;
  for (std::size_t i = 0; i < conditions.size(); ++i) {
    if (i) joined += ", ";
    joined += conditions[i];
  }
  return title + "\n" + description + "\nConditions: " + joined;
}

store::EntityDescriptor JourneyStore::Descriptor(util::IdPolicy id_policy) {
  store::EntityDescriptor d;
  d.store_name     = "JourneyStore";
  d.collection     = "journeys";
  d.owner_field    = "journey_id";
  d.tag_collection = "journey_tags";

  d.document_track = {kVersion, {}};
  d.vector_track   = {kVersion, {}};
  d.tag_track      = {kVersion, {}};

  store::AssociationSpec conditions;
  conditions.name            = kConditions;
  conditions.collection      = "journey_conditions";
  conditions.value_field     = "condition";
  conditions.track           = {kVersion, {}};
  conditions.affects_content = true;
  d.associations.push_back(std::move(conditions));

  d.id_policy = id_policy;

  d.content_key = [](const db::Document& fields) {
    return db::GetString(fields, "title").value_or("") + "\n" + db::GetString(fields, "description").value_or("");
  };

  d.list_contents = [](const store::Entity& entity) {
    std::vector<std::string> conditions;
    auto                     it = entity.associations.find(kConditions);
    if (it != entity.associations.end()) conditions = it->second;

    return std::vector<std::string>{AssembleContent(db::RequireString(entity.fields, "title"),
                                                    db::RequireString(entity.fields, "description"), conditions)};
  };
  return d;
}

JourneyStore::JourneyStore(store::StoreDependencies deps, util::IdPolicy id_policy)
    : store_(std::move(deps), Descriptor(id_policy)) {
}

Journey JourneyStore::Create(const std::string& title, const std::string& description,
                             const std::vector<std::string>& conditions, std::optional<util::TimePoint> creation_utc,
                             const std::vector<std::string>& tags) {
  db::Document doc;
  db::SetString(doc, "title", title);
  db::SetString(doc, "description", description);

  return FromEntity(store_.Create(doc, tags, creation_utc, {{kConditions, conditions}}));
}

Journey JourneyStore::Read(const std::string& id) const {
  return FromEntity(store_.Read(id));
}

Journey JourneyStore::Update(const std::string& id, const JourneyUpdateParams& params) {
  db::Document partial;
  if (params.title) db::SetString(partial, "title", *params.title);
  if (params.description) db::SetString(partial, "description", *params.description);

  return FromEntity(store_.Update(id, partial));
}

void JourneyStore::Delete(const std::string& id) {
  store_.Delete(id);
}

std::vector<Journey> JourneyStore::List(const std::optional<std::vector<std::string>>& tags,
                                        const std::optional<std::string>&              condition) const {
  std::optional<store::AssociationFilter> filter;
  if (condition) filter = store::AssociationFilter{kConditions, *condition};

  std::vector<Journey> out;
  for (const auto& entity : store_.List(tags, filter)) out.push_back(FromEntity(entity));
  return out;
}

bool JourneyStore::AddCondition(const std::string& id, const std::string& condition) {
  return store_.UpsertAssociation(kConditions, id, condition);
}

bool JourneyStore::RemoveCondition(const std::string& id, const std::string& condition) {
  return store_.RemoveAssociation(kConditions, id, condition);
}

bool JourneyStore::UpsertTag(const std::string& id, const std::string& tag, std::optional<util::TimePoint> created_at) {
  return store_.UpsertTag(id, tag, created_at);
}

void JourneyStore::RemoveTag(const std::string& id, const std::string& tag) {
  store_.RemoveTag(id, tag);
}

std::vector<Journey> JourneyStore::FindRelevant(const std::string& query, const std::vector<Journey>& available,
                                                std::size_t max_journeys) const {
  std::vector<store::Entity> candidates;
  candidates.reserve(available.size());
  for (const auto& journey : available) candidates.push_back(ToEntity(journey));

  std::vector<Journey> out;
  for (const auto& entity : store_.FindRelevant(query, candidates, max_journeys)) out.push_back(FromEntity(entity));
  return out;
}

} // namespace entitystore::stores
