#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/expr/expression_cache.hpp"
#include "internal/model/entity.hpp"
#include "internal/tags/automatic_tags.hpp"

namespace opentimeline::db {
class Repository;
}

namespace opentimeline::store {
class TimelineStore;
}

namespace opentimeline::core {

struct RenderedTimeline {
  std::string                timeline_id;
  std::string                timeline_name;
  std::vector<std::string>   contributing_timeline_ids;
  std::vector<model::Entity> entities;
  // by entity id, automatic tags included
  std::unordered_map<std::string, model::TagSet> tags;
};

struct EngineOptions {
  unsigned    compose_threads           = 0;
  std::size_t expression_cache_capacity = expr::ExpressionCache::kDefaultCapacity;
};

/*
  Timeline resolution: graph walk, composition, chronological sort.

  Every render captures a fresh snapshot of the repository first and never
  touches storage again, so concurrent renders and concurrent imports do
  not interfere. A render either returns the complete ordered result or
  throws a util::ResolutionError (ParseError, CycleError) or
  util::NotFound for an unknown root.
*/
class TimelineEngine {
 public:
  TimelineEngine(std::shared_ptr<db::Repository> repository, tags::AutomaticTags automatic_tags, EngineOptions options = {});

  RenderedTimeline RenderTimeline(const std::string& root_id);
  RenderedTimeline RenderTimelineByName(const std::string& name);

  // Pipeline only, over an already captured store.
  RenderedTimeline Render(const store::TimelineStore& store, const std::string& root_id);

  expr::ExpressionCache& Expressions() {
    return cache_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  tags::AutomaticTags             automatic_tags_;
  EngineOptions                   options_;
  expr::ExpressionCache           cache_;
};

} // namespace opentimeline::core
