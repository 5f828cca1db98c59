#include "internal/dataset/dataset_loader.hpp"

#include <google/protobuf/util/json_util.h>

#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/entity.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace opentimeline::dataset {

namespace pb = ::opentimeline::v1;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw std::runtime_error(message);
  }
}

std::optional<uint8_t> SmallField(bool present, uint32_t value) {
  if (!present) return std::nullopt;
  // out-of-range values still reach PartialDate::Make and fail there
  return static_cast<uint8_t>(value > 255 ? 255 : value);
}

model::PartialDate ToDate(const pb::Date& date) {
  return model::PartialDate::Make(date.year(), SmallField(date.has_month(), date.month()), SmallField(date.has_day(), date.day()));
}

void SetDate(pb::Date* out, int32_t year, std::optional<uint8_t> month, std::optional<uint8_t> day) {
  out->set_year(year);
  if (month) out->set_month(*month);
  if (day) out->set_day(*day);
}

db::model::TagRecord ToTagRecord(const std::string& owner, const pb::Tag& tag) {
  db::model::TagRecord record;
  record.owner_id = owner;
  if (tag.has_name()) record.name = tag.name();
  record.value = tag.value();
  return record;
}

void SetTag(pb::Tag* out, const db::model::TagRecord& record) {
  if (record.name) out->set_name(*record.name);
  out->set_value(record.value);
}

} // namespace

// ------------------------------------------------------------
// JSON
// ------------------------------------------------------------

pb::Dataset DatasetLoader::ParseJson(const std::string& json) {
  pb::Dataset dataset;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &dataset, options);
  if (!status.ok()) {
    throw util::InvalidArgument("Invalid dataset: " + std::string(status.message()));
  }
  return dataset;
}

pb::Dataset DatasetLoader::LoadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw util::InvalidArgument("Failed to open dataset: " + path);
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  return ParseJson(buf.str());
}

std::string DatasetLoader::ToJson(const pb::Dataset& dataset) {
  std::string json;

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  options.preserve_proto_field_names = true;

  auto status = google::protobuf::util::MessageToJsonString(dataset, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize dataset: " + std::string(status.message()));
  }
  return json;
}

// ------------------------------------------------------------
// Import
// ------------------------------------------------------------

ImportSummary DatasetLoader::Import(db::Repository& repository, const pb::Dataset& dataset) {
  ImportSummary summary;

  // Resolve ids up front so timelines can reference entities by name.
  std::unordered_map<std::string, std::string> entity_refs;
  std::vector<db::model::EntityRecord>         entities;
  for (const auto& e : dataset.entities()) {
    try {
      model::Entity entity{
          .id    = e.id().empty() ? util::NewId() : e.id(),
          .name  = e.name(),
          .start = ToDate(e.start()),
          .end   = e.has_end() ? std::optional<model::PartialDate>(ToDate(e.end())) : std::nullopt,
      };
      entity.Validate();

      db::model::EntityRecord record;
      record.id          = entity.id;
      record.name        = entity.name;
      record.start_year  = entity.start.Year();
      record.start_month = entity.start.Month();
      record.start_day   = entity.start.Day();
      if (entity.end) {
        record.end_year  = entity.end->Year();
        record.end_month = entity.end->Month();
        record.end_day   = entity.end->Day();
      }
      entities.push_back(record);
    } catch (const model::DateError& err) {
      throw util::InvalidArgument("entity '" + e.name() + "': " + err.what());
    }
  }

  std::vector<std::string> timeline_ids;
  for (const auto& t : dataset.timelines()) {
    timeline_ids.push_back(t.id().empty() ? util::NewId() : t.id());
  }

  // Ids take precedence: every id is registered before any name.
  std::unordered_map<std::string, std::string> timeline_refs;
  for (const auto& id : timeline_ids) {
    timeline_refs.emplace(id, id);
  }
  for (int i = 0; i < dataset.timelines_size(); ++i) {
    timeline_refs.emplace(dataset.timelines(i).name(), timeline_ids[static_cast<std::size_t>(i)]);
  }
  for (const auto& record : entities) {
    entity_refs.emplace(record.id, record.id);
  }
  for (const auto& record : entities) {
    entity_refs.emplace(record.name, record.id);
  }

  auto resolve = [](const std::unordered_map<std::string, std::string>& refs, const std::string& ref) {
    auto it = refs.find(ref);
    return it == refs.end() ? ref : it->second;
  };

  auto tx = repository.Begin();

  for (int i = 0; i < dataset.entities_size(); ++i) {
    const auto& record = entities[static_cast<std::size_t>(i)];
    ThrowIfDbError(repository.InsertEntity(*tx, record), "insert entity '" + record.name + "'");
    for (const auto& tag : dataset.entities(i).tags()) {
      ThrowIfDbError(repository.InsertEntityTag(*tx, ToTagRecord(record.id, tag)), "insert entity tag");
    }
    ++summary.entities;
  }

  for (int i = 0; i < dataset.timelines_size(); ++i) {
    const auto& t  = dataset.timelines(i);
    const auto& id = timeline_ids[static_cast<std::size_t>(i)];

    db::model::TimelineRecord record;
    record.id   = id;
    record.name = t.name();
    if (t.has_bool_expression()) record.bool_expression = t.bool_expression();
    ThrowIfDbError(repository.InsertTimeline(*tx, record), "insert timeline '" + t.name() + "'");

    for (const auto& tag : t.tags()) {
      ThrowIfDbError(repository.InsertTimelineTag(*tx, ToTagRecord(id, tag)), "insert timeline tag");
    }
    for (const auto& ref : t.entity_ids()) {
      ThrowIfDbError(repository.InsertTimelineEntity(*tx, {id, resolve(entity_refs, ref)}), "link entity");
      ++summary.links;
    }
    for (const auto& ref : t.subtimeline_ids()) {
      ThrowIfDbError(repository.InsertSubtimeline(*tx, {id, resolve(timeline_refs, ref)}), "add subtimeline");
      ++summary.edges;
    }
    ++summary.timelines;
  }

  tx->Commit();

  OPENTIMELINE_LOG_INFO("dataset imported", {observability::CountField("entities", summary.entities),
                                             observability::CountField("timelines", summary.timelines),
                                             observability::CountField("links", summary.links),
                                             observability::CountField("edges", summary.edges)});
  return summary;
}

// ------------------------------------------------------------
// Export
// ------------------------------------------------------------

pb::Dataset DatasetLoader::Export(db::Repository& repository) {
  pb::Dataset dataset;
  auto        tx = repository.Begin();

  std::unordered_map<std::string, pb::Entity*> entities;
  for (const auto& record : repository.ListEntities(*tx)) {
    auto* e = dataset.add_entities();
    e->set_id(record.id);
    e->set_name(record.name);
    SetDate(e->mutable_start(), record.start_year, record.start_month, record.start_day);
    if (record.end_year) {
      SetDate(e->mutable_end(), *record.end_year, record.end_month, record.end_day);
    }
    entities.emplace(record.id, e);
  }
  for (const auto& tag : repository.ListEntityTags(*tx)) {
    auto it = entities.find(tag.owner_id);
    if (it != entities.end()) SetTag(it->second->add_tags(), tag);
  }

  std::unordered_map<std::string, pb::Timeline*> timelines;
  for (const auto& record : repository.ListTimelines(*tx)) {
    auto* t = dataset.add_timelines();
    t->set_id(record.id);
    t->set_name(record.name);
    if (record.bool_expression) t->set_bool_expression(*record.bool_expression);
    for (const auto& tag : repository.GetTimelineTags(*tx, record.id)) {
      SetTag(t->add_tags(), tag);
    }
    timelines.emplace(record.id, t);
  }
  for (const auto& link : repository.ListTimelineEntityLinks(*tx)) {
    auto it = timelines.find(link.timeline_id);
    if (it != timelines.end()) it->second->add_entity_ids(link.entity_id);
  }
  for (const auto& edge : repository.ListSubtimelineEdges(*tx)) {
    auto it = timelines.find(edge.parent_id);
    if (it != timelines.end()) it->second->add_subtimeline_ids(edge.child_id);
  }

  tx->Commit();
  return dataset;
}

} // namespace opentimeline::dataset
