#include "internal/tags/automatic_tags.hpp"

#include <algorithm>

#include "config/config.pb.h"

namespace opentimeline::tags {

namespace {

bool Contains(const model::TagSet& tags, const model::Tag& tag) {
  return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

model::Tag FromRef(const runtime::config::TagRef& ref) {
  model::Tag tag;
  if (ref.has_name()) tag.name = ref.name();
  tag.value = ref.value();
  return tag;
}

} // namespace

AutomaticTags::AutomaticTags(std::vector<AutomaticTagRule> rules) : rules_(std::move(rules)) {
}

AutomaticTags AutomaticTags::Defaults() {
  return AutomaticTags({
      {model::ValueTag("scientist"), model::ValueTag("person")},
      {model::ValueTag("king"), model::ValueTag("person")},
      {model::ValueTag("emperor"), model::ValueTag("person")},
  });
}

AutomaticTags AutomaticTags::FromConfig(const runtime::config::EngineConfig& config) {
  std::vector<AutomaticTagRule> rules;
  if (!config.override_automatic_tags()) {
    rules = Defaults().Rules();
  }
  for (const auto& rule : config.automatic_tags()) {
    rules.push_back({FromRef(rule.when()), FromRef(rule.add())});
  }
  return AutomaticTags(std::move(rules));
}

void AutomaticTags::Apply(model::TagSet& tags) const {
  bool changed = true;
  while (changed) {
    changed = false;
    for (const auto& rule : rules_) {
      if (Contains(tags, rule.when) && !Contains(tags, rule.add)) {
        tags.push_back(rule.add);
        changed = true;
      }
    }
  }
}

} // namespace opentimeline::tags
