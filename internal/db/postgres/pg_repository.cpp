#include "pg_repository.hpp"

namespace opentimeline::db::postgres {

namespace {

template <typename Int>
std::optional<Int> OptInt(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return static_cast<Int>(f.as<int>());
}

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

// pqxx binds an empty optional as NULL
template <typename Int>
std::optional<int> Param(const std::optional<Int>& v) {
  if (!v) return std::nullopt;
  return static_cast<int>(*v);
}

model::EntityRecord ReadEntity(const pqxx::row& row) {
  model::EntityRecord r;
  r.id          = row[0].c_str();
  r.name        = row[1].c_str();
  r.start_year  = row[2].as<int>();
  r.start_month = OptInt<uint8_t>(row[3]);
  r.start_day   = OptInt<uint8_t>(row[4]);
  r.end_year    = OptInt<int32_t>(row[5]);
  r.end_month   = OptInt<uint8_t>(row[6]);
  r.end_day     = OptInt<uint8_t>(row[7]);
  return r;
}

model::TimelineRecord ReadTimeline(const pqxx::row& row) {
  model::TimelineRecord r;
  r.id              = row[0].c_str();
  r.name            = row[1].c_str();
  r.bool_expression = OptText(row[2]);
  return r;
}

model::TagRecord ReadTag(const pqxx::row& row) {
  model::TagRecord r;
  r.owner_id = row[0].c_str();
  r.name     = OptText(row[1]);
  r.value    = row[2].c_str();
  return r;
}

std::vector<model::TagRecord> ReadTags(const pqxx::result& res) {
  std::vector<model::TagRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadTag(row));
  return out;
}

std::vector<std::string> ReadStrings(const pqxx::result& res) {
  std::vector<std::string> out;
  out.reserve(res.size());
  for (const auto& row : res) out.emplace_back(row[0].c_str());
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Entities
// ------------------------------------------------------------------

Result PgRepository::InsertEntity(Transaction& t, const model::EntityRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_entity", r.id, r.name, r.start_year, Param(r.start_month), Param(r.start_day), Param(r.end_year),
                               Param(r.end_month), Param(r.end_day));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::EntityRecord> PgRepository::GetEntity(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_entity", id);
  if (res.empty()) return std::nullopt;
  return ReadEntity(res[0]);
}

std::vector<model::EntityRecord> PgRepository::ListEntities(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT id,name,start_year,start_month,start_day,end_year,end_month,end_day FROM entities ORDER BY ctid;");

  std::vector<model::EntityRecord> records;
  records.reserve(res.size());
  for (const auto& row : res) records.push_back(ReadEntity(row));
  return records;
}

Result PgRepository::InsertEntityTag(Transaction& t, const model::TagRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_entity_tag", r.owner_id, r.name, r.value);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::TagRecord> PgRepository::GetEntityTags(Transaction& t, const std::string& entity_id) {
  return ReadTags(TX(t).Work().exec_prepared("get_entity_tags", entity_id));
}

std::vector<model::TagRecord> PgRepository::ListEntityTags(Transaction& t) {
  return ReadTags(TX(t).Work().exec("SELECT entity_id,name,value FROM entity_tags ORDER BY ctid;"));
}

// ------------------------------------------------------------------
// Timelines
// ------------------------------------------------------------------

Result PgRepository::InsertTimeline(Transaction& t, const model::TimelineRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_timeline", r.id, r.name, r.bool_expression);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::TimelineRecord> PgRepository::GetTimeline(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_timeline", id);
  if (res.empty()) return std::nullopt;
  return ReadTimeline(res[0]);
}

std::optional<model::TimelineRecord> PgRepository::GetTimelineByName(Transaction& t, const std::string& name) {
  auto res = TX(t).Work().exec_prepared("get_timeline_by_name", name);
  if (res.empty()) return std::nullopt;
  return ReadTimeline(res[0]);
}

std::vector<model::TimelineRecord> PgRepository::ListTimelines(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT id,name,bool_expression FROM timelines ORDER BY ctid;");

  std::vector<model::TimelineRecord> records;
  records.reserve(res.size());
  for (const auto& row : res) records.push_back(ReadTimeline(row));
  return records;
}

Result PgRepository::InsertTimelineTag(Transaction& t, const model::TagRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_timeline_tag", r.owner_id, r.name, r.value);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::TagRecord> PgRepository::GetTimelineTags(Transaction& t, const std::string& timeline_id) {
  return ReadTags(TX(t).Work().exec_prepared("get_timeline_tags", timeline_id));
}

// ------------------------------------------------------------------
// Subtimelines
// ------------------------------------------------------------------

Result PgRepository::InsertSubtimeline(Transaction& t, const model::SubtimelineRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_subtimeline", r.parent_id, r.child_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<std::string> PgRepository::ListSubtimelineChildren(Transaction& t, const std::string& parent_id) {
  return ReadStrings(TX(t).Work().exec_prepared("list_subtimeline_children", parent_id));
}

std::vector<model::SubtimelineRecord> PgRepository::ListSubtimelineEdges(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT timeline_parent_id,timeline_child_id FROM subtimelines ORDER BY ctid;");

  std::vector<model::SubtimelineRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back({row[0].c_str(), row[1].c_str()});
  return out;
}

// ------------------------------------------------------------------
// Timeline-entity links
// ------------------------------------------------------------------

Result PgRepository::InsertTimelineEntity(Transaction& t, const model::TimelineEntityRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_timeline_entity", r.timeline_id, r.entity_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<std::string> PgRepository::ListLinkedEntities(Transaction& t, const std::string& timeline_id) {
  return ReadStrings(TX(t).Work().exec_prepared("list_linked_entities", timeline_id));
}

std::vector<model::TimelineEntityRecord> PgRepository::ListTimelineEntityLinks(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT timeline_id,entity_id FROM timeline_entities ORDER BY ctid;");

  std::vector<model::TimelineEntityRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back({row[0].c_str(), row[1].c_str()});
  return out;
}

} // namespace opentimeline::db::postgres
