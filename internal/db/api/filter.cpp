#include "internal/db/api/filter.hpp"

#include <algorithm>

namespace entitystore::db {

Filter Filter::All() {
  return Filter();
}

Filter Filter::Eq(std::string field, std::string value) {
  Filter f;
  f.op_    = Op::kEq;
  f.field_ = std::move(field);
  f.values_.push_back(std::move(value));
  return f;
}

Filter Filter::Ne(std::string field, std::string value) {
  Filter f;
  f.op_    = Op::kNe;
  f.field_ = std::move(field);
  f.values_.push_back(std::move(value));
  return f;
}

Filter Filter::In(std::string field, std::vector<std::string> values) {
  Filter f;
  f.op_     = Op::kIn;
  f.field_  = std::move(field);
  f.values_ = std::move(values);
  return f;
}

Filter Filter::And(std::vector<Filter> children) {
  Filter f;
  f.op_       = Op::kAnd;
  f.children_ = std::move(children);
  return f;
}

Filter Filter::Or(std::vector<Filter> children) {
  Filter f;
  f.op_       = Op::kOr;
  f.children_ = std::move(children);
  return f;
}

bool Filter::Matches(const Document& doc) const {
  switch (op_) {
    case Op::kAll:
      return true;

    case Op::kEq: {
      auto v = GetString(doc, field_);
      return v && *v == values_.front();
    }

    case Op::kNe: {
      auto v = GetString(doc, field_);
      return !v || *v != values_.front();
    }

    case Op::kIn: {
      auto v = GetString(doc, field_);
      return v && std::find(values_.begin(), values_.end(), *v) != values_.end();
    }

    case Op::kAnd:
      return std::all_of(children_.begin(), children_.end(), [&](const Filter& c) { return c.Matches(doc); });

    case Op::kOr:
      return std::any_of(children_.begin(), children_.end(), [&](const Filter& c) { return c.Matches(doc); });
  }
  return false;
}

std::optional<std::string> Filter::PinnedId() const {
  if (op_ == Op::kEq && field_ == kIdField) {
    return values_.front();
  }
  if (op_ == Op::kAnd) {
    for (const auto& c : children_) {
      if (auto id = c.PinnedId()) return id;
    }
  }
  return std::nullopt;
}

std::string Filter::DebugString() const {
  auto join_values = [&]() {
    std::string out;
    for (size_t i = 0; i < values_.size(); ++i) {
      if (i) out += ",";
      out += values_[i];
    }
    return out;
  };

  auto join_children = [&](const char* name) {
    std::string out = std::string(name) + "(";
    for (size_t i = 0; i < children_.size(); ++i) {
      if (i) out += ", ";
      out += children_[i].DebugString();
    }
    return out + ")";
  };

  switch (op_) {
    case Op::kAll:
      return "all";
    case Op::kEq:
      return field_ + "==" + values_.front();
    case Op::kNe:
      return field_ + "!=" + values_.front();
    case Op::kIn:
      return field_ + " in [" + join_values() + "]";
    case Op::kAnd:
      return join_children("and");
    case Op::kOr:
      return join_children("or");
  }
  return "?";
}

} // namespace entitystore::db
