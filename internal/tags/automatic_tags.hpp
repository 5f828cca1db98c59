#pragma once

#include <vector>

#include "internal/model/tag.hpp"

namespace opentimeline::runtime::config {
class EngineConfig;
}

namespace opentimeline::tags {

// "an entity tagged `when` is also tagged `add`"
struct AutomaticTagRule {
  model::Tag when;
  model::Tag add;
};

/*
  Implied-tag rules applied to entity tag sets before expressions see them.

  Application runs to a fixed point: a tag added by one rule may trigger
  another. A rule never adds a tag the set already carries, so the loop
  terminates after at most one pass per rule.
*/
class AutomaticTags {
 public:
  AutomaticTags() = default;
  explicit AutomaticTags(std::vector<AutomaticTagRule> rules);

  // scientist/king/emperor -> person
  static AutomaticTags Defaults();

  // Defaults plus configured rules, or only the configured rules when
  // override_automatic_tags is set.
  static AutomaticTags FromConfig(const runtime::config::EngineConfig& config);

  void Apply(model::TagSet& tags) const;

  const std::vector<AutomaticTagRule>& Rules() const {
    return rules_;
  }

 private:
  std::vector<AutomaticTagRule> rules_;
};

} // namespace opentimeline::tags
