#include "internal/stores/template_fields.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace entitystore::stores {

using google::protobuf::Value;

static std::string ToJson(const Value& value) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(value, &json);
  if (!status.ok()) {
    throw util::InvalidContent("serialization failed: " + std::string(status.message()));
  }
  return json;
}

static Value ParseList(const std::string& json, const char* what) {
  Value value;
  auto  status = google::protobuf::util::JsonStringToMessage(json, &value);
  if (!status.ok()) {
    throw util::InvalidContent(std::string("malformed ") + what + ": " + std::string(status.message()));
  }
  if (value.kind_case() != Value::kListValue) {
    throw util::InvalidContent(std::string(what) + " is not a JSON array");
  }
  return value;
}

static std::string RequireStringMember(const google::protobuf::Struct& object, const char* key) {
  auto it = object.fields().find(key);
  if (it == object.fields().end() || it->second.kind_case() != Value::kStringValue) {
    throw util::InvalidContent(std::string("template field is missing '") + key + "'");
  }
  return it->second.string_value();
}

std::string SerializeFields(const std::vector<TemplateField>& fields) {
  Value value;
  auto* list = value.mutable_list_value();

  for (const auto& field : fields) {
    auto& object = *list->add_values()->mutable_struct_value()->mutable_fields();
    object["name"].set_string_value(field.name);
    object["description"].set_string_value(field.description);

    auto* examples = object["examples"].mutable_list_value();
    for (const auto& example : field.examples) examples->add_values()->set_string_value(example);
  }
  return ToJson(value);
}

std::vector<TemplateField> ParseFields(const std::string& json) {
  std::vector<TemplateField> fields;

  const Value list = ParseList(json, "template fields");
  for (const auto& item : list.list_value().values()) {
    if (item.kind_case() != Value::kStructValue) {
      throw util::InvalidContent("template field is not an object");
    }

    const auto&   object = item.struct_value();
    TemplateField field;
    field.name        = RequireStringMember(object, "name");
    field.description = RequireStringMember(object, "description");

    auto examples = object.fields().find("examples");
    if (examples != object.fields().end()) {
      if (examples->second.kind_case() != Value::kListValue) {
        throw util::InvalidContent("template field examples is not an array");
      }
      for (const auto& example : examples->second.list_value().values()) {
        if (example.kind_case() != Value::kStringValue) {
          throw util::InvalidContent("template field example is not a string");
        }
        field.examples.push_back(example.string_value());
      }
    }
    fields.push_back(std::move(field));
  }
  return fields;
}

std::string SerializeStrings(const std::vector<std::string>& values) {
  Value value;
  auto* list = value.mutable_list_value();
  for (const auto& s : values) list->add_values()->set_string_value(s);
  return ToJson(value);
}

std::vector<std::string> ParseStrings(const std::string& json) {
  std::vector<std::string> out;
  const Value list = ParseList(json, "string list");
  for (const auto& item : list.list_value().values()) {
    if (item.kind_case() != Value::kStringValue) {
      throw util::InvalidContent("string list holds a non-string item");
    }
    out.push_back(item.string_value());
  }
  return out;
}

} // namespace entitystore::stores
