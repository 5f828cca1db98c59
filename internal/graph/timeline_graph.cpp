#include "internal/graph/timeline_graph.hpp"

#include <algorithm>
#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace opentimeline::graph {

namespace {

struct Frame {
  std::string              id;
  std::vector<std::string> children;
  std::size_t              next = 0;
};

} // namespace

TimelineGraphResolver::TimelineGraphResolver(const store::TimelineStore& store) : store_(store) {
}

// ------------------------------------------------------------
// Traversal
// ------------------------------------------------------------

std::vector<std::string> TimelineGraphResolver::ResolveContributing(const std::string& root_id) const {
  if (!store_.GetTimeline(root_id)) {
    throw util::NotFound("timeline not found: " + root_id);
  }

  std::vector<std::string>        order;
  std::unordered_set<std::string> visited;
  std::unordered_set<std::string> dangling;

  // ids on the current root -> node path, in path order
  std::vector<std::string>        path;
  std::unordered_set<std::string> on_path;
  std::vector<Frame>              stack;

  auto enter = [&](const std::string& id) {
    visited.insert(id);
    order.push_back(id);
    path.push_back(id);
    on_path.insert(id);
    stack.push_back(Frame{id, store_.ListSubtimelineChildren(id)});
  };

  enter(root_id);

  while (!stack.empty()) {
    Frame& top = stack.back();

    if (top.next == top.children.size()) {
      on_path.erase(top.id);
      path.pop_back();
      stack.pop_back();
      continue;
    }

    const std::string child = top.children[top.next++];

    if (on_path.contains(child)) {
      auto first = std::find(path.begin(), path.end(), child);
      std::vector<std::string> cycle(first, path.end());
      cycle.push_back(child);
      OPENTIMELINE_LOG_WARN("subtimeline cycle", {observability::StringField("root", root_id), observability::PathField("path", cycle)});
      throw util::CycleError(std::move(cycle));
    }

    if (visited.contains(child) || dangling.contains(child)) {
      continue;
    }

    if (!store_.GetTimeline(child)) {
      dangling.insert(child);
      OPENTIMELINE_LOG_WARN("skipping dangling subtimeline edge",
                            {observability::StringField("parent", top.id), observability::StringField("child", child)});
      continue;
    }

    enter(child);
  }

  return order;
}

} // namespace opentimeline::graph
