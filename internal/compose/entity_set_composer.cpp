#include "internal/compose/entity_set_composer.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <system_error>
#include <thread>
#include <unordered_set>

#include "internal/expr/evaluator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace opentimeline::compose {

EntitySetComposer::EntitySetComposer(const store::TimelineStore& store, expr::ExpressionCache& cache, unsigned threads)
    : store_(store), cache_(cache), threads_(threads) {
}

// ------------------------------------------------------------
// Per-timeline selection
// ------------------------------------------------------------

std::vector<std::string> EntitySetComposer::Select(const std::string& timeline_id, const std::vector<Candidate>& candidates) const {
  std::vector<std::string> selected;

  for (const auto& entity_id : store_.ListLinkedEntities(timeline_id)) {
    if (!store_.GetEntity(entity_id)) {
      OPENTIMELINE_LOG_WARN("skipping dangling entity link",
                            {observability::StringField("timeline_id", timeline_id), observability::StringField("entity_id", entity_id)});
      continue;
    }
    selected.push_back(entity_id);
  }

  const auto timeline = store_.GetTimeline(timeline_id);
  if (!timeline || !timeline->bool_expression) {
    return selected;
  }

  expr::CompiledExpression predicate;
  try {
    predicate = cache_.Get(*timeline->bool_expression);
  } catch (const util::ParseError& e) {
    OPENTIMELINE_LOG_WARN("timeline expression rejected",
                          {observability::StringField("timeline_id", timeline_id), observability::CountField("position", e.Position()),
                           observability::StringField("reason", e.Reason())});
    throw e.WithTimeline(timeline_id);
  }

  if (!predicate) {
    return selected;
  }

  for (const auto& candidate : candidates) {
    if (expr::Evaluate(*predicate, candidate.tags)) {
      selected.push_back(candidate.id);
    }
  }
  return selected;
}

// ------------------------------------------------------------
// Union
// ------------------------------------------------------------

std::vector<std::string> EntitySetComposer::Compose(const std::vector<std::string>& timeline_ids) const {
  std::vector<Candidate> candidates;
  for (const auto& entity : store_.ListEntities()) {
    candidates.push_back({entity.id, store_.GetTags(entity.id)});
  }

  std::vector<std::vector<std::string>> per_timeline(timeline_ids.size());

  const std::size_t workers = std::min<std::size_t>(threads_, timeline_ids.size());
  if (workers <= 1) {
    for (std::size_t i = 0; i < timeline_ids.size(); ++i) {
      per_timeline[i] = Select(timeline_ids[i], candidates);
    }
  } else {
    std::vector<std::exception_ptr> errors(timeline_ids.size());
    std::vector<std::thread>        pool;
    pool.reserve(workers);

    auto join_all = [&pool] {
      for (auto& t : pool) t.join();
    };

    try {
      for (std::size_t w = 0; w < workers; ++w) {
        pool.emplace_back([&, w] {
          for (std::size_t i = w; i < timeline_ids.size(); i += workers) {
            try {
              per_timeline[i] = Select(timeline_ids[i], candidates);
            } catch (...) {
              errors[i] = std::current_exception();
            }
          }
        });
      }
    } catch (const std::system_error&) {
      // workers already started still reference this frame
      join_all();
      throw;
    }
    join_all();

    // first failing timeline in contribution order, as a serial run would
    for (const auto& error : errors) {
      if (error) std::rethrow_exception(error);
    }
  }

  std::vector<std::string>        result;
  std::unordered_set<std::string> seen;
  for (const auto& ids : per_timeline) {
    for (const auto& id : ids) {
      if (seen.insert(id).second) result.push_back(id);
    }
  }
  return result;
}

} // namespace opentimeline::compose
