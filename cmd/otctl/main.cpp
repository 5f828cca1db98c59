#include <grpcpp/grpcpp.h>

#include <iostream>
#include <string>

#include "opentimeline/v1.hpp"

using namespace opentimeline::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  otctl <addr> render <timeline_id>\n"
            << "  otctl <addr> render --name <timeline_name>\n"
            << "  otctl <addr> validate <expression>\n";
}

static std::string FormatDate(const Date& date) {
  std::string out = std::to_string(date.year());
  if (date.has_month()) {
    out += (date.month() < 10 ? "-0" : "-") + std::to_string(date.month());
  }
  if (date.has_day()) {
    out += (date.day() < 10 ? "-0" : "-") + std::to_string(date.day());
  }
  return out;
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error (" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 4) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = TimelineService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------
  if (cmd == "render") {
    RenderTimelineRequest req;
    if (std::string(argv[3]) == "--name") {
      if (argc < 5) {
        Usage();
        return 1;
      }
      req.set_name(argv[4]);
    } else {
      req.set_id(argv[3]);
    }

    RenderTimelineResponse resp;
    auto status = stub->RenderTimeline(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.timeline_name() << " (" << resp.timeline_id() << ")\n";
    std::cout << "contributing=" << resp.contributing_timeline_ids_size() << " entities=" << resp.entities_size() << "\n";
    for (const auto& entity : resp.entities()) {
      std::cout << FormatDate(entity.start());
      if (entity.has_end()) std::cout << " .. " << FormatDate(entity.end());
      std::cout << "  " << entity.name() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "validate") {
    ValidateExpressionRequest req;
    req.set_expression(argv[3]);

    ValidateExpressionResponse resp;
    auto status = stub->ValidateExpression(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (!resp.valid()) {
      std::cout << "invalid at " << resp.error_position() << ": " << resp.error_reason() << "\n";
      return 3;
    }
    std::cout << "valid: " << (resp.canonical().empty() ? "<matches nothing>" : resp.canonical()) << "\n";
    return 0;
  }

  Usage();
  return 1;
}
