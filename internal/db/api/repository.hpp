#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/entity_record.hpp"
#include "internal/db/model/tag_record.hpp"
#include "internal/db/model/timeline_record.hpp"

namespace opentimeline::db {

/*
  Repository abstraction over the timeline schema.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Entity/timeline ids and names are unique (AlreadyExists otherwise)
  - Edges and links are NOT checked against existing rows; dangling
    references are legal data and must be tolerated by readers

  The resolution engine only ever reads. Writes exist for import and tests.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Entities
  // ---------------------------------------------------------------------

  virtual Result InsertEntity(Transaction&, const model::EntityRecord&) = 0;

  virtual std::optional<model::EntityRecord> GetEntity(Transaction&, const std::string& id) = 0;

  virtual std::vector<model::EntityRecord> ListEntities(Transaction&) = 0;

  virtual Result InsertEntityTag(Transaction&, const model::TagRecord&) = 0;

  virtual std::vector<model::TagRecord> GetEntityTags(Transaction&, const std::string& entity_id) = 0;

  // All entity tags in one pass (snapshot capture).
  virtual std::vector<model::TagRecord> ListEntityTags(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Timelines
  // ---------------------------------------------------------------------

  virtual Result InsertTimeline(Transaction&, const model::TimelineRecord&) = 0;

  virtual std::optional<model::TimelineRecord> GetTimeline(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::TimelineRecord> GetTimelineByName(Transaction&, const std::string& name) = 0;

  virtual std::vector<model::TimelineRecord> ListTimelines(Transaction&) = 0;

  virtual Result InsertTimelineTag(Transaction&, const model::TagRecord&) = 0;

  virtual std::vector<model::TagRecord> GetTimelineTags(Transaction&, const std::string& timeline_id) = 0;

  // ---------------------------------------------------------------------
  // Subtimeline edges
  // ---------------------------------------------------------------------

  virtual Result InsertSubtimeline(Transaction&, const model::SubtimelineRecord&) = 0;

  virtual std::vector<std::string> ListSubtimelineChildren(Transaction&, const std::string& parent_id) = 0;

  virtual std::vector<model::SubtimelineRecord> ListSubtimelineEdges(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Timeline-entity links
  // ---------------------------------------------------------------------

  virtual Result InsertTimelineEntity(Transaction&, const model::TimelineEntityRecord&) = 0;

  virtual std::vector<std::string> ListLinkedEntities(Transaction&, const std::string& timeline_id) = 0;

  virtual std::vector<model::TimelineEntityRecord> ListTimelineEntityLinks(Transaction&) = 0;
};

} // namespace opentimeline::db
