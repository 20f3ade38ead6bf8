#pragma once

#include <string>
#include <vector>

namespace entitystore::stores {

// Named slot in a response template, with example fillers.
struct TemplateField {
  std::string              name;
  std::string              description;
  std::vector<std::string> examples;

  bool operator==(const TemplateField&) const = default;
};

// JSON array of {"name","description","examples"} objects.
std::string SerializeFields(const std::vector<TemplateField>& fields);

// Throws util::InvalidContent on malformed input.
std::vector<TemplateField> ParseFields(const std::string& json);

// JSON array of strings. Throws util::InvalidContent on malformed input.
std::string              SerializeStrings(const std::vector<std::string>& values);
std::vector<std::string> ParseStrings(const std::string& json);

} // namespace entitystore::stores
