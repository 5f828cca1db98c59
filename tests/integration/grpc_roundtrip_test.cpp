#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/dataset/dataset_loader.hpp"
#include "internal/factory.hpp"
#include "internal/runtime/server.hpp"
#include "opentimeline/v1.hpp"

namespace {

constexpr const char* kDataset = R"({
  "entities": [
    {"id": "sarajevo", "name": "Assassination in Sarajevo", "start": {"year": 1914, "month": 6, "day": 28}, "tags": [{"name": "era", "value": "ww1"}]},
    {"id": "armistice", "name": "Armistice", "start": {"year": 1918, "month": 11, "day": 11}, "tags": [{"name": "era", "value": "ww1"}]},
    {"id": "war", "name": "Great War", "start": {"year": 1914}, "end": {"year": 1918}}
  ],
  "timelines": [
    {"id": "ww1", "name": "World War I", "bool_expression": "era = \"ww1\"", "entity_ids": ["war"]},
    {"id": "a", "name": "A", "subtimeline_ids": ["b"]},
    {"id": "b", "name": "B", "subtimeline_ids": ["a"]}
  ]
})";

void RunRoundTrip() {
  opentimeline::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_memory();

  auto app = opentimeline::factory::Build(config);
  opentimeline::dataset::DatasetLoader::Import(*app.repository, opentimeline::dataset::DatasetLoader::ParseJson(kDataset));

  opentimeline::runtime::Server server("127.0.0.1:0", std::move(app.grpc_services));
  server.Start();
  assert(server.SelectedPort() > 0);

  auto channel = grpc::CreateChannel("127.0.0.1:" + std::to_string(server.SelectedPort()), grpc::InsecureChannelCredentials());
  auto stub    = opentimeline::v1::TimelineService::NewStub(channel);

  {
    grpc::ClientContext                      ctx;
    opentimeline::v1::RenderTimelineRequest  req;
    opentimeline::v1::RenderTimelineResponse resp;
    req.set_id("ww1");

    const auto status = stub->RenderTimeline(&ctx, req, &resp);
    assert(status.ok());
    assert(resp.timeline_name() == "World War I");
    assert(resp.entities_size() == 3);
    assert(resp.entities(0).id() == "war");
    assert(resp.entities(0).end().year() == 1918);
    assert(resp.entities(1).id() == "sarajevo");
    assert(resp.entities(2).id() == "armistice");
  }

  {
    grpc::ClientContext                      ctx;
    opentimeline::v1::RenderTimelineRequest  req;
    opentimeline::v1::RenderTimelineResponse resp;
    req.set_name("A");

    const auto status = stub->RenderTimeline(&ctx, req, &resp);
    assert(status.error_code() == grpc::StatusCode::FAILED_PRECONDITION);
    assert(status.error_message().find("a -> b -> a") != std::string::npos);
  }

  {
    grpc::ClientContext                          ctx;
    opentimeline::v1::ValidateExpressionRequest  req;
    opentimeline::v1::ValidateExpressionResponse resp;
    req.set_expression("country exists OR");

    assert(stub->ValidateExpression(&ctx, req, &resp).ok());
    assert(!resp.valid());
    assert(resp.error_position() == 17);
  }

  server.Stop();
}

} // namespace

int main() {
  RunRoundTrip();

  std::cout << "opentimeline_integration_grpc_roundtrip: pass\n";
  return 0;
}
