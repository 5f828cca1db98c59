#pragma once

#include <string>
#include <variant>
#include <vector>

namespace opentimeline::expr {

// name = "value"
struct TagEquals {
  std::string name;
  std::string value;
};

// name != "value": the name is present, never with this value
struct TagNotEquals {
  std::string name;
  std::string value;
};

struct TagExists {
  std::string name;
};

struct TagNotExists {
  std::string name;
};

// bare "value": an anonymous tag carrying exactly this value
struct AnonymousValue {
  std::string value;
};

/*
  Compiled boolean tag expression.

  Value-semantic and self-contained; safe to share read-only between
  threads. And/Or hold two or more children, Not holds exactly one.
*/
struct Predicate {
  struct And {
    std::vector<Predicate> children;
  };
  struct Or {
    std::vector<Predicate> children;
  };
  struct Not {
    std::vector<Predicate> children;
  };

  std::variant<TagEquals, TagNotEquals, TagExists, TagNotExists, AnonymousValue, And, Or, Not> node;
};

// Canonical text; parsing it yields an equivalent predicate.
std::string ToString(const Predicate& predicate);

} // namespace opentimeline::expr
