#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace opentimeline::db { class Repository; }
namespace opentimeline::core { class TimelineEngine; }
namespace opentimeline::service { class TimelineService; }

namespace opentimeline::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;
  std::shared_ptr<core::TimelineEngine> engine;
  std::shared_ptr<service::TimelineService> timeline_service;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  BuildRepository

  Opens the configured backend and bootstraps its schema.
  Throws when the backend was not enabled at build time.
*/
std::shared_ptr<db::Repository> BuildRepository(const opentimeline::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the entire backend based on runtime config, importing
  dataset.path when set.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const opentimeline::runtime::config::RuntimeConfig& config);

} // namespace opentimeline::factory
