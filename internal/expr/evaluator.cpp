#include "internal/expr/evaluator.hpp"

namespace opentimeline::expr {

namespace {

bool HasName(const model::TagSet& tags, const std::string& name) {
  for (const auto& tag : tags) {
    if (tag.name && *tag.name == name) return true;
  }
  return false;
}

bool HasNamedValue(const model::TagSet& tags, const std::string& name, const std::string& value) {
  for (const auto& tag : tags) {
    if (tag.name && *tag.name == name && tag.value == value) return true;
  }
  return false;
}

bool HasAnonymousValue(const model::TagSet& tags, const std::string& value) {
  for (const auto& tag : tags) {
    if (!tag.name && tag.value == value) return true;
  }
  return false;
}

} // namespace

bool Evaluate(const Predicate& p, const model::TagSet& tags) {
  if (const auto* eq = std::get_if<TagEquals>(&p.node)) {
    return HasNamedValue(tags, eq->name, eq->value);
  }
  if (const auto* ne = std::get_if<TagNotEquals>(&p.node)) {
    return HasName(tags, ne->name) && !HasNamedValue(tags, ne->name, ne->value);
  }
  if (const auto* ex = std::get_if<TagExists>(&p.node)) {
    return HasName(tags, ex->name);
  }
  if (const auto* nex = std::get_if<TagNotExists>(&p.node)) {
    return !HasName(tags, nex->name);
  }
  if (const auto* anon = std::get_if<AnonymousValue>(&p.node)) {
    return HasAnonymousValue(tags, anon->value);
  }
  if (const auto* a = std::get_if<Predicate::And>(&p.node)) {
    for (const auto& c : a->children) {
      if (!Evaluate(c, tags)) return false;
    }
    return true;
  }
  if (const auto* o = std::get_if<Predicate::Or>(&p.node)) {
    for (const auto& c : o->children) {
      if (Evaluate(c, tags)) return true;
    }
    return false;
  }
  if (const auto* n = std::get_if<Predicate::Not>(&p.node)) {
    return !Evaluate(n->children.front(), tags);
  }
  return false;
}

} // namespace opentimeline::expr
