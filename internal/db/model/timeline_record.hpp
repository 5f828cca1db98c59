#pragma once

#include <optional>
#include <string>

namespace opentimeline::db::model {

struct TimelineRecord {
  std::string                id;
  std::string                name;
  std::optional<std::string> bool_expression;
};

// parent ---> child. Nothing stops this graph from containing cycles.
struct SubtimelineRecord {
  std::string parent_id;
  std::string child_id;
};

// Explicit curator link, independent of any expression.
struct TimelineEntityRecord {
  std::string timeline_id;
  std::string entity_id;
};

} // namespace opentimeline::db::model
