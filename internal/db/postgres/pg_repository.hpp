#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace opentimeline::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
