#include "internal/core/timeline_engine.hpp"

#include <chrono>
#include <cstdint>

#include "internal/chrono/chronological_sorter.hpp"
#include "internal/compose/entity_set_composer.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/graph/timeline_graph.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/snapshot.hpp"
#include "internal/util/errors.hpp"

namespace opentimeline::core {

TimelineEngine::TimelineEngine(std::shared_ptr<db::Repository> repository, tags::AutomaticTags automatic_tags, EngineOptions options)
    : repository_(std::move(repository)),
      automatic_tags_(std::move(automatic_tags)),
      options_(options),
      cache_(options.expression_cache_capacity) {
}

RenderedTimeline TimelineEngine::RenderTimeline(const std::string& root_id) {
  const auto snapshot = store::Snapshot::Capture(*repository_, automatic_tags_);
  return Render(*snapshot, root_id);
}

RenderedTimeline TimelineEngine::RenderTimelineByName(const std::string& name) {
  const auto snapshot = store::Snapshot::Capture(*repository_, automatic_tags_);
  const auto timeline = snapshot->FindTimelineByName(name);
  if (!timeline) {
    throw util::NotFound("timeline not found: " + name);
  }
  return Render(*snapshot, timeline->id);
}

// ------------------------------------------------------------
// Pipeline
// ------------------------------------------------------------

RenderedTimeline TimelineEngine::Render(const store::TimelineStore& store, const std::string& root_id) {
  const auto started = std::chrono::steady_clock::now();

  RenderedTimeline out;
  out.timeline_id = root_id;

  out.contributing_timeline_ids = graph::TimelineGraphResolver(store).ResolveContributing(root_id);
  out.timeline_name             = store.GetTimeline(root_id)->name;

  const auto entity_ids = compose::EntitySetComposer(store, cache_, options_.compose_threads).Compose(out.contributing_timeline_ids);

  std::vector<model::Entity> entities;
  entities.reserve(entity_ids.size());
  for (const auto& id : entity_ids) {
    // composer only emits ids present in the store
    if (auto entity = store.GetEntity(id)) {
      out.tags.emplace(id, store.GetTags(id));
      entities.push_back(std::move(*entity));
    }
  }
  out.entities = chrono::SortChronologically(std::move(entities));

  const auto elapsed_us = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started).count();
  OPENTIMELINE_LOG_INFO("rendered timeline",
                        {observability::StringField("timeline_id", root_id),
                         observability::CountField("contributing", out.contributing_timeline_ids.size()),
                         observability::CountField("entities", out.entities.size()),
                         observability::IntField("elapsed_us", elapsed_us)});
  return out;
}

} // namespace opentimeline::core
