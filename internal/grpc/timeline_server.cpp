#include "timeline_server.hpp"
#include "grpc_error.hpp"

namespace opentimeline::grpc {

TimelineServer::TimelineServer(std::shared_ptr<opentimeline::service::TimelineService> svc)
    : service_(std::move(svc)) {}

::grpc::Status TimelineServer::RenderTimeline(::grpc::ServerContext*,
                                            const opentimeline::v1::RenderTimelineRequest* req,
                                            opentimeline::v1::RenderTimelineResponse* resp) {
  try {
    *resp = service_->RenderTimeline(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TimelineServer::ValidateExpression(::grpc::ServerContext*,
                                                const opentimeline::v1::ValidateExpressionRequest* req,
                                                opentimeline::v1::ValidateExpressionResponse* resp) {
  try {
    *resp = service_->ValidateExpression(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
