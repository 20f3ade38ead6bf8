#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/document.hpp"

namespace entitystore::db {

/*
  Predicate over documents.

  Eq/Ne/In compare string fields. A missing field never equals anything, so
  Ne matches documents that lack the field. And() of nothing matches every
  document; Or() of nothing matches none.
*/
class Filter {
 public:
  enum class Op { kAll, kEq, kNe, kIn, kAnd, kOr };

  static Filter All();
  static Filter Eq(std::string field, std::string value);
  static Filter Ne(std::string field, std::string value);
  static Filter In(std::string field, std::vector<std::string> values);
  static Filter And(std::vector<Filter> children);
  static Filter Or(std::vector<Filter> children);

  bool Matches(const Document& doc) const;

  // Id a document must carry to match, when the filter pins one.
  std::optional<std::string> PinnedId() const;

  Op op() const {
    return op_;
  }

  std::string DebugString() const;

 private:
  Filter() = default;

  Op                       op_ = Op::kAll;
  std::string              field_;
  std::vector<std::string> values_;
  std::vector<Filter>      children_;
};

} // namespace entitystore::db
