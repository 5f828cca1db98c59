#pragma once

#include <memory>

namespace opentimeline::core { class TimelineEngine; }
namespace opentimeline::db { class Repository; }

namespace opentimeline::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<opentimeline::core::TimelineEngine> engine;
  std::shared_ptr<opentimeline::db::Repository> repository;
};

}
