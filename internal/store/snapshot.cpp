#include "internal/store/snapshot.hpp"

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/tags/automatic_tags.hpp"

namespace opentimeline::store {

namespace {

std::optional<model::Entity> ToEntity(const db::model::EntityRecord& r) {
  try {
    std::optional<model::PartialDate> end;
    if (r.end_year) {
      end = model::PartialDate::Make(*r.end_year, r.end_month, r.end_day);
    } else if (r.end_month || r.end_day) {
      throw model::DateError("end month/day without end year");
    }

    model::Entity entity{
        .id    = r.id,
        .name  = r.name,
        .start = model::PartialDate::Make(r.start_year, r.start_month, r.start_day),
        .end   = end,
    };
    entity.Validate();
    return entity;
  } catch (const model::DateError& e) {
    OPENTIMELINE_LOG_WARN("dropping entity with invalid dates",
                          {observability::StringField("entity_id", r.id), observability::StringField("error", e.what())});
    return std::nullopt;
  }
}

model::Tag ToTag(const db::model::TagRecord& r) {
  return model::Tag{r.name, r.value};
}

} // namespace

std::shared_ptr<const Snapshot> Snapshot::Capture(db::Repository& repository, const tags::AutomaticTags& automatic_tags) {
  auto tx = repository.Begin();

  std::shared_ptr<Snapshot> snap(new Snapshot());

  for (const auto& record : repository.ListEntities(*tx)) {
    auto entity = ToEntity(record);
    if (!entity) continue;
    snap->entity_index_.emplace(entity->id, snap->entities_.size());
    snap->entities_.push_back(std::move(*entity));
  }

  for (const auto& record : repository.ListEntityTags(*tx)) {
    snap->entity_tags_[record.owner_id].push_back(ToTag(record));
  }

  for (const auto& record : repository.ListTimelines(*tx)) {
    snap->timeline_index_.emplace(record.id, snap->timelines_.size());
    snap->timeline_name_index_.emplace(record.name, snap->timelines_.size());
    snap->timelines_.push_back(model::Timeline{record.id, record.name, record.bool_expression});
  }

  for (const auto& edge : repository.ListSubtimelineEdges(*tx)) {
    snap->children_[edge.parent_id].push_back(edge.child_id);
  }

  for (const auto& link : repository.ListTimelineEntityLinks(*tx)) {
    snap->links_[link.timeline_id].push_back(link.entity_id);
  }

  tx->Commit();

  for (const auto& entity : snap->entities_) {
    automatic_tags.Apply(snap->entity_tags_[entity.id]);
  }

  return snap;
}

std::optional<model::Entity> Snapshot::GetEntity(const std::string& id) const {
  auto it = entity_index_.find(id);
  if (it == entity_index_.end()) return std::nullopt;
  return entities_[it->second];
}

std::vector<model::Entity> Snapshot::ListEntities() const {
  return entities_;
}

model::TagSet Snapshot::GetTags(const std::string& entity_id) const {
  auto it = entity_tags_.find(entity_id);
  if (it == entity_tags_.end()) return {};
  return it->second;
}

std::optional<model::Timeline> Snapshot::GetTimeline(const std::string& id) const {
  auto it = timeline_index_.find(id);
  if (it == timeline_index_.end()) return std::nullopt;
  return timelines_[it->second];
}

std::vector<std::string> Snapshot::ListSubtimelineChildren(const std::string& parent_id) const {
  auto it = children_.find(parent_id);
  if (it == children_.end()) return {};
  return it->second;
}

std::vector<std::string> Snapshot::ListLinkedEntities(const std::string& timeline_id) const {
  auto it = links_.find(timeline_id);
  if (it == links_.end()) return {};
  return it->second;
}

std::optional<model::Timeline> Snapshot::FindTimelineByName(const std::string& name) const {
  auto it = timeline_name_index_.find(name);
  if (it == timeline_name_index_.end()) return std::nullopt;
  return timelines_[it->second];
}

} // namespace opentimeline::store
