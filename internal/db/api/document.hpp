#pragma once

#include <google/protobuf/struct.pb.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace entitystore::db {

/*
  Schemaless document, as held by every backend.

  Every stored document carries at least "id" and "version" string fields.
*/
using Document = google::protobuf::Struct;

inline constexpr const char* kIdField      = "id";
inline constexpr const char* kVersionField = "version";

bool Has(const Document& doc, std::string_view key);

std::optional<std::string> GetString(const Document& doc, std::string_view key);

// Throws util::InvalidContent when the field is missing or not a string.
std::string RequireString(const Document& doc, std::string_view key);

void SetString(Document& doc, std::string_view key, std::string_view value);
void SetNumber(Document& doc, std::string_view key, double value);

// Throws util::InvalidContent when present but not a list of strings.
std::vector<std::string> GetStringList(const Document& doc, std::string_view key);
void                     SetStringList(Document& doc, std::string_view key, const std::vector<std::string>& values);

void Erase(Document& doc, std::string_view key);

// Top-level overwrite of `target` fields by `patch` fields.
void Merge(Document& target, const Document& patch);

bool Equals(const Document& a, const Document& b);

std::string ToJson(const Document& doc);

// Throws util::InvalidContent on malformed JSON or a non-object root.
Document FromJson(const std::string& json);

std::string DocumentId(const Document& doc);

} // namespace entitystore::db
