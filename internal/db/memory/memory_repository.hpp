#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace opentimeline::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertEntity(Transaction&, const model::EntityRecord&) override;
  std::optional<model::EntityRecord> GetEntity(Transaction&, const std::string&) override;
  std::vector<model::EntityRecord> ListEntities(Transaction&) override;
  Result InsertEntityTag(Transaction&, const model::TagRecord&) override;
  std::vector<model::TagRecord> GetEntityTags(Transaction&, const std::string&) override;
  std::vector<model::TagRecord> ListEntityTags(Transaction&) override;

  Result InsertTimeline(Transaction&, const model::TimelineRecord&) override;
  std::optional<model::TimelineRecord> GetTimeline(Transaction&, const std::string&) override;
  std::optional<model::TimelineRecord> GetTimelineByName(Transaction&, const std::string&) override;
  std::vector<model::TimelineRecord> ListTimelines(Transaction&) override;
  Result InsertTimelineTag(Transaction&, const model::TagRecord&) override;
  std::vector<model::TagRecord> GetTimelineTags(Transaction&, const std::string&) override;

  Result InsertSubtimeline(Transaction&, const model::SubtimelineRecord&) override;
  std::vector<std::string> ListSubtimelineChildren(Transaction&, const std::string&) override;
  std::vector<model::SubtimelineRecord> ListSubtimelineEdges(Transaction&) override;

  Result InsertTimelineEntity(Transaction&, const model::TimelineEntityRecord&) override;
  std::vector<std::string> ListLinkedEntities(Transaction&, const std::string&) override;
  std::vector<model::TimelineEntityRecord> ListTimelineEntityLinks(Transaction&) override;

private:
  friend class MemoryTransaction;

  // Vectors keep insertion order so listings are deterministic.
  struct State {
    std::vector<model::EntityRecord>             entities;
    std::unordered_map<std::string, std::size_t> entity_index;
    std::unordered_set<std::string>              entity_names;
    std::vector<model::TagRecord>                entity_tags;

    std::vector<model::TimelineRecord>           timelines;
    std::unordered_map<std::string, std::size_t> timeline_index;
    std::unordered_map<std::string, std::size_t> timeline_name_index;
    std::vector<model::TagRecord>                timeline_tags;

    std::vector<model::SubtimelineRecord>    subtimelines;
    std::vector<model::TimelineEntityRecord> timeline_entities;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
