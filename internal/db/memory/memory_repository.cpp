#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace opentimeline::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------
// Entities
// ------------------------------------------------------------

Result MemoryRepository::InsertEntity(Transaction& t, const model::EntityRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.entity_index.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "entity id " + r.id);
  if (s.entity_names.contains(r.name)) return Result::Err(ErrorCode::AlreadyExists, "entity name " + r.name);
  s.entity_index[r.id] = s.entities.size();
  s.entity_names.insert(r.name);
  s.entities.push_back(r);
  return Result::Ok();
}

std::optional<model::EntityRecord> MemoryRepository::GetEntity(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.entity_index.find(id);
  if (it == s.entity_index.end()) return std::nullopt;
  return s.entities[it->second];
}

std::vector<model::EntityRecord> MemoryRepository::ListEntities(Transaction& t) {
  return TX(t).View().entities;
}

Result MemoryRepository::InsertEntityTag(Transaction& t, const model::TagRecord& r) {
  TX(t).Mutable().entity_tags.push_back(r);
  return Result::Ok();
}

std::vector<model::TagRecord> MemoryRepository::GetEntityTags(Transaction& t, const std::string& entity_id) {
  std::vector<model::TagRecord> out;
  for (const auto& tag : TX(t).View().entity_tags)
    if (tag.owner_id == entity_id) out.push_back(tag);
  return out;
}

std::vector<model::TagRecord> MemoryRepository::ListEntityTags(Transaction& t) {
  return TX(t).View().entity_tags;
}

// ------------------------------------------------------------
// Timelines
// ------------------------------------------------------------

Result MemoryRepository::InsertTimeline(Transaction& t, const model::TimelineRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.timeline_index.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "timeline id " + r.id);
  if (s.timeline_name_index.contains(r.name)) return Result::Err(ErrorCode::AlreadyExists, "timeline name " + r.name);
  s.timeline_index[r.id]        = s.timelines.size();
  s.timeline_name_index[r.name] = s.timelines.size();
  s.timelines.push_back(r);
  return Result::Ok();
}

std::optional<model::TimelineRecord> MemoryRepository::GetTimeline(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.timeline_index.find(id);
  if (it == s.timeline_index.end()) return std::nullopt;
  return s.timelines[it->second];
}

std::optional<model::TimelineRecord> MemoryRepository::GetTimelineByName(Transaction& t, const std::string& name) {
  const auto& s  = TX(t).View();
  auto        it = s.timeline_name_index.find(name);
  if (it == s.timeline_name_index.end()) return std::nullopt;
  return s.timelines[it->second];
}

std::vector<model::TimelineRecord> MemoryRepository::ListTimelines(Transaction& t) {
  return TX(t).View().timelines;
}

Result MemoryRepository::InsertTimelineTag(Transaction& t, const model::TagRecord& r) {
  TX(t).Mutable().timeline_tags.push_back(r);
  return Result::Ok();
}

std::vector<model::TagRecord> MemoryRepository::GetTimelineTags(Transaction& t, const std::string& timeline_id) {
  std::vector<model::TagRecord> out;
  for (const auto& tag : TX(t).View().timeline_tags)
    if (tag.owner_id == timeline_id) out.push_back(tag);
  return out;
}

// ------------------------------------------------------------
// Subtimelines / links
// ------------------------------------------------------------

Result MemoryRepository::InsertSubtimeline(Transaction& t, const model::SubtimelineRecord& r) {
  TX(t).Mutable().subtimelines.push_back(r);
  return Result::Ok();
}

std::vector<std::string> MemoryRepository::ListSubtimelineChildren(Transaction& t, const std::string& parent_id) {
  std::vector<std::string> out;
  for (const auto& e : TX(t).View().subtimelines)
    if (e.parent_id == parent_id) out.push_back(e.child_id);
  return out;
}

std::vector<model::SubtimelineRecord> MemoryRepository::ListSubtimelineEdges(Transaction& t) {
  return TX(t).View().subtimelines;
}

Result MemoryRepository::InsertTimelineEntity(Transaction& t, const model::TimelineEntityRecord& r) {
  TX(t).Mutable().timeline_entities.push_back(r);
  return Result::Ok();
}

std::vector<std::string> MemoryRepository::ListLinkedEntities(Transaction& t, const std::string& timeline_id) {
  std::vector<std::string> out;
  for (const auto& l : TX(t).View().timeline_entities)
    if (l.timeline_id == timeline_id) out.push_back(l.entity_id);
  return out;
}

std::vector<model::TimelineEntityRecord> MemoryRepository::ListTimelineEntityLinks(Transaction& t) {
  return TX(t).View().timeline_entities;
}

} // namespace opentimeline::db::memory
