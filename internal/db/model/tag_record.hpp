#pragma once

#include <optional>
#include <string>

namespace opentimeline::db::model {

/*
  Row of `entity_tags` or `timeline_tags`.
  owner_id is the entity or timeline id; name is NULL for value-only tags.
*/
struct TagRecord {
  std::string                owner_id;
  std::optional<std::string> name;
  std::string                value;
};

} // namespace opentimeline::db::model
