#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/model/entity.hpp"
#include "internal/model/tag.hpp"

namespace opentimeline::store {

/*
  Read-only view the resolution pipeline works against.

  NotFound is an empty optional; callers decide whether a missing row is
  fatal (root timeline) or a skip-with-warning (edge or link target).
  Implementations must be safe for concurrent readers.
*/
class TimelineStore {
 public:
  virtual ~TimelineStore() = default;

  virtual std::optional<model::Entity> GetEntity(const std::string& id) const = 0;

  virtual std::vector<model::Entity> ListEntities() const = 0;

  virtual model::TagSet GetTags(const std::string& entity_id) const = 0;

  virtual std::optional<model::Timeline> GetTimeline(const std::string& id) const = 0;

  virtual std::vector<std::string> ListSubtimelineChildren(const std::string& parent_id) const = 0;

  virtual std::vector<std::string> ListLinkedEntities(const std::string& timeline_id) const = 0;
};

} // namespace opentimeline::store
