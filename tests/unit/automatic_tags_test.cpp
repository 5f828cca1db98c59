#include <cassert>
#include <iostream>

#include "config/config.pb.h"
#include "internal/tags/automatic_tags.hpp"

namespace {

using opentimeline::model::NamedTag;
using opentimeline::model::TagSet;
using opentimeline::model::ValueTag;
using opentimeline::tags::AutomaticTags;

std::size_t Count(const TagSet& tags, const opentimeline::model::Tag& tag) {
  std::size_t n = 0;
  for (const auto& t : tags) n += (t == tag);
  return n;
}

void TestDefaultsAddPerson() {
  const auto rules = AutomaticTags::Defaults();
  for (const auto* trigger : {"scientist", "king", "emperor"}) {
    TagSet tags{ValueTag(trigger)};
    rules.Apply(tags);
    assert(Count(tags, ValueTag("person")) == 1);
  }

  TagSet untouched{NamedTag("role", "scientist")};
  rules.Apply(untouched);
  assert(untouched.size() == 1);
}

void TestNeverDuplicates() {
  TagSet tags{ValueTag("king"), ValueTag("emperor"), ValueTag("person")};
  AutomaticTags::Defaults().Apply(tags);
  assert(tags.size() == 3);
  assert(Count(tags, ValueTag("person")) == 1);
}

void TestChainsToFixedPoint() {
  AutomaticTags rules({
      {ValueTag("person"), ValueTag("living-thing")},
      {ValueTag("king"), ValueTag("person")},
      {ValueTag("living-thing"), NamedTag("kingdom", "animalia")},
  });

  TagSet tags{ValueTag("king")};
  rules.Apply(tags);
  assert(Count(tags, ValueTag("person")) == 1);
  assert(Count(tags, ValueTag("living-thing")) == 1);
  assert(Count(tags, NamedTag("kingdom", "animalia")) == 1);
  assert(tags.size() == 4);
}

void TestMutualRulesTerminate() {
  AutomaticTags rules({
      {ValueTag("a"), ValueTag("b")},
      {ValueTag("b"), ValueTag("a")},
  });
  TagSet tags{ValueTag("a")};
  rules.Apply(tags);
  assert(tags.size() == 2);
}

void TestFromConfig() {
  opentimeline::runtime::config::EngineConfig engine;
  auto* rule = engine.add_automatic_tags();
  rule->mutable_when()->set_name("role");
  rule->mutable_when()->set_value("general");
  rule->mutable_add()->set_value("military");

  auto merged = AutomaticTags::FromConfig(engine);
  assert(merged.Rules().size() == 4);

  TagSet tags{NamedTag("role", "general"), ValueTag("king")};
  merged.Apply(tags);
  assert(Count(tags, ValueTag("military")) == 1);
  assert(Count(tags, ValueTag("person")) == 1);

  engine.set_override_automatic_tags(true);
  auto only_configured = AutomaticTags::FromConfig(engine);
  assert(only_configured.Rules().size() == 1);

  TagSet kings{ValueTag("king")};
  only_configured.Apply(kings);
  assert(kings.size() == 1);
}

} // namespace

int main() {
  TestDefaultsAddPerson();
  TestNeverDuplicates();
  TestChainsToFixedPoint();
  TestMutualRulesTerminate();
  TestFromConfig();

  std::cout << "opentimeline_unit_automatic_tags: pass\n";
  return 0;
}
