#pragma once

#include <string>
#include <vector>

#include "internal/expr/expression_cache.hpp"
#include "internal/store/timeline_store.hpp"

namespace opentimeline::compose {

/*
  Union of the entities each contributing timeline selects.

  A timeline selects its explicitly linked entities plus every entity whose
  tags satisfy its expression. Composition only adds: no timeline can
  remove an entity another one selected.

  Output is deduplicated and deterministic: timelines in the given order,
  within a timeline links before expression matches, matches in store
  order. This holds regardless of the thread count.

  Errors:
    util::ParseError  bad expression, tagged with the timeline id
  Links to missing entities are logged and skipped.
*/
class EntitySetComposer {
 public:
  // threads <= 1 evaluates serially.
  EntitySetComposer(const store::TimelineStore& store, expr::ExpressionCache& cache, unsigned threads = 0);

  std::vector<std::string> Compose(const std::vector<std::string>& timeline_ids) const;

 private:
  struct Candidate {
    std::string   id;
    model::TagSet tags;
  };

  std::vector<std::string> Select(const std::string& timeline_id, const std::vector<Candidate>& candidates) const;

  const store::TimelineStore& store_;
  expr::ExpressionCache&      cache_;
  unsigned                    threads_;
};

} // namespace opentimeline::compose
