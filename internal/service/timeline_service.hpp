#pragma once

#include "service_context.hpp"
#include "opentimeline/v1.hpp"

namespace opentimeline::service {

class TimelineService {
public:
  explicit TimelineService(ServiceContext ctx);

  opentimeline::v1::RenderTimelineResponse
  RenderTimeline(const opentimeline::v1::RenderTimelineRequest& req);

  // Never throws for a malformed expression; the error is in the response.
  opentimeline::v1::ValidateExpressionResponse
  ValidateExpression(const opentimeline::v1::ValidateExpressionRequest& req);

private:
  ServiceContext ctx_;
};

}
