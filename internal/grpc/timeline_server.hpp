#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/timeline_service.hpp"
#include "opentimeline/v1.hpp"

namespace opentimeline::grpc {

class TimelineServer final : public opentimeline::v1::TimelineService::Service {
public:
  explicit TimelineServer(std::shared_ptr<opentimeline::service::TimelineService> svc);

  ::grpc::Status RenderTimeline(::grpc::ServerContext*,
                              const opentimeline::v1::RenderTimelineRequest*,
                              opentimeline::v1::RenderTimelineResponse*) override;

  ::grpc::Status ValidateExpression(::grpc::ServerContext*,
                                  const opentimeline::v1::ValidateExpressionRequest*,
                                  opentimeline::v1::ValidateExpressionResponse*) override;

private:
  std::shared_ptr<opentimeline::service::TimelineService> service_;
};

}
