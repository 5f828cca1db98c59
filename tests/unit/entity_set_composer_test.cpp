#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "fake_timeline_store.hpp"
#include "internal/compose/entity_set_composer.hpp"
#include "internal/util/errors.hpp"

namespace {

using opentimeline::compose::EntitySetComposer;
using opentimeline::expr::ExpressionCache;
using opentimeline::model::NamedTag;
using opentimeline::model::ValueTag;
using opentimeline::testing::FakeTimelineStore;
using opentimeline::testing::Year;
using Ids = std::vector<std::string>;

FakeTimelineStore WarStore() {
  FakeTimelineStore store;
  store.AddEntity("somme", Year(1916), {NamedTag("era", "ww1"), NamedTag("country", "fr")});
  store.AddEntity("verdun", Year(1916), {NamedTag("era", "ww1")});
  store.AddEntity("dday", Year(1944), {NamedTag("era", "ww2"), NamedTag("country", "fr")});
  store.AddEntity("curie", Year(1867), {ValueTag("scientist")});
  return store;
}

void TestLinksBeforeMatches() {
  auto store = WarStore();
  store.AddTimeline("ww1", R"(era = "ww1")");
  store.Link("ww1", "curie");

  ExpressionCache cache;
  const auto      ids = EntitySetComposer(store, cache).Compose({"ww1"});
  assert(ids == (Ids{"curie", "somme", "verdun"}));
}

void TestUnionIsDeduplicated() {
  auto store = WarStore();
  store.AddTimeline("ww1", R"(era = "ww1")");
  store.AddTimeline("france", R"(country = "fr")");
  store.Link("france", "somme");

  ExpressionCache cache;
  const auto      ids = EntitySetComposer(store, cache).Compose({"ww1", "france"});
  assert(ids == (Ids{"somme", "verdun", "dday"}));
}

void TestNoExpressionMeansLinksOnly() {
  auto store = WarStore();
  store.AddTimeline("curated");
  store.AddTimeline("blank", std::string("   "));
  store.Link("curated", "dday");

  ExpressionCache cache;
  assert(EntitySetComposer(store, cache).Compose({"curated", "blank"}) == Ids{"dday"});
}

void TestDanglingLinkSkipped() {
  auto store = WarStore();
  store.AddTimeline("curated");
  store.Link("curated", "missing");
  store.Link("curated", "verdun");

  ExpressionCache cache;
  assert(EntitySetComposer(store, cache).Compose({"curated"}) == Ids{"verdun"});
}

void TestParseErrorNamesTimeline() {
  auto store = WarStore();
  store.AddTimeline("good", R"(era = "ww1")");
  store.AddTimeline("broken", R"(era = )");

  ExpressionCache cache;
  bool            threw = false;
  try {
    (void)EntitySetComposer(store, cache).Compose({"good", "broken"});
  } catch (const opentimeline::util::ParseError& e) {
    threw = true;
    assert(e.TimelineId() == "broken");
    assert(e.Position() == 6);
  }
  assert(threw);
}

void TestParallelMatchesSerial() {
  FakeTimelineStore store;
  for (int i = 0; i < 200; ++i) {
    store.AddEntity("e" + std::to_string(i), Year(1900 + i), {NamedTag("bucket", std::to_string(i % 7))});
  }
  Ids timelines;
  for (int b = 0; b < 7; ++b) {
    const auto id = "bucket" + std::to_string(b);
    store.AddTimeline(id, "bucket = \"" + std::to_string(b) + "\"");
    timelines.push_back(id);
  }

  ExpressionCache cache;
  const auto      serial   = EntitySetComposer(store, cache, 1).Compose(timelines);
  const auto      parallel = EntitySetComposer(store, cache, 4).Compose(timelines);
  assert(serial.size() == 200);
  assert(serial == parallel);
}

void TestParallelReportsFirstFailingTimeline() {
  auto store = WarStore();
  store.AddTimeline("ok", R"(era = "ww1")");
  store.AddTimeline("bad1", R"(era = )");
  store.AddTimeline("bad2", R"(( era exists)");

  ExpressionCache cache;
  bool            threw = false;
  try {
    (void)EntitySetComposer(store, cache, 3).Compose({"ok", "bad1", "bad2"});
  } catch (const opentimeline::util::ParseError& e) {
    threw = true;
    assert(e.TimelineId() == "bad1");
  }
  assert(threw);
}

// Not derived from std::exception.
struct StoreUnavailable {
  std::string timeline_id;
};

class FailingLinksStore final : public opentimeline::store::TimelineStore {
 public:
  FailingLinksStore(const FakeTimelineStore& inner, std::string failing) : inner_(inner), failing_(std::move(failing)) {
  }

  std::optional<opentimeline::model::Entity> GetEntity(const std::string& id) const override {
    return inner_.GetEntity(id);
  }
  std::vector<opentimeline::model::Entity> ListEntities() const override {
    return inner_.ListEntities();
  }
  opentimeline::model::TagSet GetTags(const std::string& entity_id) const override {
    return inner_.GetTags(entity_id);
  }
  std::optional<opentimeline::model::Timeline> GetTimeline(const std::string& id) const override {
    return inner_.GetTimeline(id);
  }
  std::vector<std::string> ListSubtimelineChildren(const std::string& parent_id) const override {
    return inner_.ListSubtimelineChildren(parent_id);
  }
  std::vector<std::string> ListLinkedEntities(const std::string& timeline_id) const override {
    if (timeline_id == failing_) throw StoreUnavailable{timeline_id};
    return inner_.ListLinkedEntities(timeline_id);
  }

 private:
  const FakeTimelineStore& inner_;
  std::string              failing_;
};

void TestParallelPropagatesNonStandardExceptions() {
  auto store = WarStore();
  store.AddTimeline("a", R"(era = "ww1")");
  store.AddTimeline("b", R"(era = "ww2")");
  store.AddTimeline("c", "scientist");
  FailingLinksStore failing(store, "b");

  ExpressionCache cache;
  bool            threw = false;
  try {
    (void)EntitySetComposer(failing, cache, 3).Compose({"a", "b", "c"});
  } catch (const StoreUnavailable& e) {
    threw = true;
    assert(e.timeline_id == "b");
  }
  assert(threw);
}

} // namespace

int main() {
  TestLinksBeforeMatches();
  TestUnionIsDeduplicated();
  TestNoExpressionMeansLinksOnly();
  TestDanglingLinkSkipped();
  TestParseErrorNamesTimeline();
  TestParallelMatchesSerial();
  TestParallelReportsFirstFailingTimeline();
  TestParallelPropagatesNonStandardExceptions();

  std::cout << "opentimeline_unit_entity_set_composer: pass\n";
  return 0;
}
