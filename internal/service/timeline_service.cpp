#include "timeline_service.hpp"

#include <chrono>
#include <string_view>

#include "internal/core/timeline_engine.hpp"
#include "internal/expr/parser.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/tracing.hpp"
#include "internal/util/errors.hpp"

namespace opentimeline::service {

using namespace opentimeline::v1;

namespace {

void ToProto(const model::PartialDate& date, Date* out) {
  out->set_year(date.Year());
  if (date.Month()) out->set_month(*date.Month());
  if (date.Day()) out->set_day(*date.Day());
}

void ToProto(const model::Entity& entity, const model::TagSet& tags, Entity* out) {
  out->set_id(entity.id);
  out->set_name(entity.name);
  ToProto(entity.start, out->mutable_start());
  if (entity.end) ToProto(*entity.end, out->mutable_end());
  for (const auto& tag : tags) {
    auto* t = out->add_tags();
    if (tag.name) t->set_name(*tag.name);
    t->set_value(tag.value);
  }
}

std::string_view Outcome(const std::exception& ex) {
  if (dynamic_cast<const util::CycleError*>(&ex)) return "cycle";
  if (dynamic_cast<const util::ParseError*>(&ex)) return "parse_error";
  if (dynamic_cast<const util::NotFound*>(&ex)) return "not_found";
  if (dynamic_cast<const util::InvalidArgument*>(&ex)) return "invalid_argument";
  return "internal";
}

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view timeline_ref, Fn&& fn) {
  observability::SpanScope span(route);
  if (!timeline_ref.empty()) {
    span.SetAttribute("timeline.ref", timeline_ref);
  }

  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto result = fn();
    observability::Metrics::Instance().RecordRpc(route, "ok", ElapsedMs(started_at));
    return result;
  } catch (const std::exception& ex) {
    const auto outcome = Outcome(ex);
    span.RecordError(outcome, ex.what());
    observability::Metrics::Instance().RecordRpc(route, outcome, ElapsedMs(started_at));
    OPENTIMELINE_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("outcome", outcome),
                                          observability::StringField("timeline", timeline_ref),
                                          observability::StringField("error", ex.what())});
    throw;
  }
}

} // namespace

TimelineService::TimelineService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RenderTimelineResponse TimelineService::RenderTimeline(const RenderTimelineRequest& req) {
  const std::string ref = req.has_name() ? req.name() : req.id();

  return ObserveRpc("TimelineService.RenderTimeline", ref, [&] {
    if (ref.empty()) {
      throw util::InvalidArgument("timeline id or name is required");
    }

    const auto rendered = req.has_name() ? ctx_.engine->RenderTimelineByName(req.name()) : ctx_.engine->RenderTimeline(req.id());

    RenderTimelineResponse resp;
    resp.set_timeline_id(rendered.timeline_id);
    resp.set_timeline_name(rendered.timeline_name);
    for (const auto& id : rendered.contributing_timeline_ids) {
      resp.add_contributing_timeline_ids(id);
    }
    for (const auto& entity : rendered.entities) {
      const auto it = rendered.tags.find(entity.id);
      ToProto(entity, it == rendered.tags.end() ? model::TagSet{} : it->second, resp.add_entities());
    }

    observability::Metrics::Instance().RecordRender(rendered.entities.size(), rendered.contributing_timeline_ids.size());
    return resp;
  });
}

ValidateExpressionResponse TimelineService::ValidateExpression(const ValidateExpressionRequest& req) {
  return ObserveRpc("TimelineService.ValidateExpression", {}, [&] {
    ValidateExpressionResponse resp;
    try {
      const auto predicate = expr::Parse(req.expression());
      resp.set_valid(true);
      if (predicate) resp.set_canonical(expr::ToString(*predicate));
    } catch (const util::ParseError& e) {
      resp.set_valid(false);
      resp.set_error_position(static_cast<uint32_t>(e.Position()));
      resp.set_error_reason(e.Reason());
    }
    return resp;
  });
}

} // namespace opentimeline::service
