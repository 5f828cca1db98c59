#pragma once

#include <string>
#include <vector>

#include "internal/store/timeline_store.hpp"

namespace opentimeline::graph {

/*
  Walks parent -> child subtimeline edges from a root.

  - Result is every contributing timeline once, root first, in depth-first
    discovery order.
  - Reaching an already finished timeline again (a diamond) is benign and
    skipped.
  - Re-entering a timeline that is still on the current path throws
    util::CycleError; the path names the whole cycle and begins and ends
    with the re-entered id. Nothing is returned in that case.
  - A missing root throws util::NotFound. An edge to a missing child is
    logged and skipped.

  Iterative, so arbitrarily deep nesting does not grow the call stack.
*/
class TimelineGraphResolver {
 public:
  explicit TimelineGraphResolver(const store::TimelineStore& store);

  std::vector<std::string> ResolveContributing(const std::string& root_id) const;

 private:
  const store::TimelineStore& store_;
};

} // namespace opentimeline::graph
