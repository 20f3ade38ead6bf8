#include "internal/db/api/document.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include "internal/util/errors.hpp"

namespace entitystore::db {

using google::protobuf::Value;

static const Value* Lookup(const Document& doc, std::string_view key) {
  const auto& fields = doc.fields();
  auto        it     = fields.find(std::string(key));
  return it == fields.end() ? nullptr : &it->second;
}

bool Has(const Document& doc, std::string_view key) {
  return Lookup(doc, key) != nullptr;
}

std::optional<std::string> GetString(const Document& doc, std::string_view key) {
  const Value* v = Lookup(doc, key);
  if (!v || v->kind_case() != Value::kStringValue) return std::nullopt;
  return v->string_value();
}

std::string RequireString(const Document& doc, std::string_view key) {
  auto v = GetString(doc, key);
  if (!v) {
    throw util::InvalidContent("document field '" + std::string(key) + "' is missing or not a string");
  }
  return *v;
}

void SetString(Document& doc, std::string_view key, std::string_view value) {
  (*doc.mutable_fields())[std::string(key)].set_string_value(std::string(value));
}

void SetNumber(Document& doc, std::string_view key, double value) {
  (*doc.mutable_fields())[std::string(key)].set_number_value(value);
}

std::vector<std::string> GetStringList(const Document& doc, std::string_view key) {
  std::vector<std::string> out;

  const Value* v = Lookup(doc, key);
  if (!v || v->kind_case() == Value::kNullValue) return out;

  if (v->kind_case() != Value::kListValue) {
    throw util::InvalidContent("document field '" + std::string(key) + "' is not a list");
  }

  for (const auto& item : v->list_value().values()) {
    if (item.kind_case() != Value::kStringValue) {
      throw util::InvalidContent("document field '" + std::string(key) + "' holds a non-string item");
    }
    out.push_back(item.string_value());
  }
  return out;
}

void SetStringList(Document& doc, std::string_view key, const std::vector<std::string>& values) {
  auto* list = (*doc.mutable_fields())[std::string(key)].mutable_list_value();
  list->clear_values();
  for (const auto& s : values) {
    list->add_values()->set_string_value(s);
  }
}

void Erase(Document& doc, std::string_view key) {
  doc.mutable_fields()->erase(std::string(key));
}

void Merge(Document& target, const Document& patch) {
  for (const auto& [key, value] : patch.fields()) {
    (*target.mutable_fields())[key] = value;
  }
}

bool Equals(const Document& a, const Document& b) {
  return google::protobuf::util::MessageDifferencer::Equals(a, b);
}

std::string ToJson(const Document& doc) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(doc, &json);
  if (!status.ok()) {
    throw util::InvalidContent("document serialization failed: " + std::string(status.message()));
  }
  return json;
}

Document FromJson(const std::string& json) {
  Document doc;
  auto     status = google::protobuf::util::JsonStringToMessage(json, &doc);
  if (!status.ok()) {
    throw util::InvalidContent("malformed document JSON: " + std::string(status.message()));
  }
  return doc;
}

std::string DocumentId(const Document& doc) {
  return GetString(doc, kIdField).value_or("");
}

} // namespace entitystore::db
