#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/store/timeline_store.hpp"

namespace opentimeline::db {
class Repository;
}

namespace opentimeline::tags {
class AutomaticTags;
}

namespace opentimeline::store {

/*
  Immutable copy of everything a resolution reads.

  Captured inside one repository transaction, so a render never observes
  a half-applied import and never re-queries storage once it has started.
  Entity tag sets already include automatic tags.

  Rows whose dates violate the partial-date rules are dropped at capture
  with a warning; links to them then behave like any other dangling link.
*/
class Snapshot final : public TimelineStore {
 public:
  static std::shared_ptr<const Snapshot> Capture(db::Repository& repository, const tags::AutomaticTags& automatic_tags);

  std::optional<model::Entity> GetEntity(const std::string& id) const override;
  std::vector<model::Entity>   ListEntities() const override;
  model::TagSet                GetTags(const std::string& entity_id) const override;
  std::optional<model::Timeline> GetTimeline(const std::string& id) const override;
  std::vector<std::string>       ListSubtimelineChildren(const std::string& parent_id) const override;
  std::vector<std::string>       ListLinkedEntities(const std::string& timeline_id) const override;

  std::optional<model::Timeline> FindTimelineByName(const std::string& name) const;

 private:
  Snapshot() = default;

  std::vector<model::Entity>                   entities_;
  std::unordered_map<std::string, std::size_t> entity_index_;
  std::unordered_map<std::string, model::TagSet> entity_tags_;

  std::vector<model::Timeline>                 timelines_;
  std::unordered_map<std::string, std::size_t> timeline_index_;
  std::unordered_map<std::string, std::size_t> timeline_name_index_;

  std::unordered_map<std::string, std::vector<std::string>> children_;
  std::unordered_map<std::string, std::vector<std::string>> links_;
};

} // namespace opentimeline::store
