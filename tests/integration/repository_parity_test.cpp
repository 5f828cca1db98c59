#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/core/timeline_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/factory.hpp"
#include "internal/service/timeline_service.hpp"
#include "internal/util/errors.hpp"

namespace {

using opentimeline::db::ErrorCode;
using opentimeline::db::Repository;
using opentimeline::db::model::EntityRecord;
using opentimeline::db::model::TagRecord;
using opentimeline::db::model::TimelineRecord;
using opentimeline::runtime::config::RuntimeConfig;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                  name;
  std::function<std::shared_ptr<Repository>()> make_repository;
  std::function<bool()>                        supports_restart;
  std::function<void()>                        cleanup;
};

EntityRecord Entity(const std::string& id, int32_t year, std::optional<uint8_t> month = std::nullopt, std::optional<uint8_t> day = std::nullopt) {
  EntityRecord record;
  record.id          = id;
  record.name        = id + " name";
  record.start_year  = year;
  record.start_month = month;
  record.start_day   = day;
  return record;
}

void VerifyEntityReadWrite(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  auto record     = Entity(prefix + "-armistice", 1918, 11, 11);
  record.end_year = 1918;
  assert(repo.InsertEntity(*tx, record));
  assert(repo.InsertEntityTag(*tx, TagRecord{record.id, std::string("era"), "ww1"}));
  assert(repo.InsertEntityTag(*tx, TagRecord{record.id, std::nullopt, "treaty"}));
  assert(repo.InsertEntityTag(*tx, TagRecord{record.id, std::string("era"), "ww1"}));

  auto read = repo.GetEntity(*tx, record.id);
  assert(read.has_value());
  assert(read->name == record.name);
  assert(read->start_month == std::optional<uint8_t>(11));
  assert(read->start_day == std::optional<uint8_t>(11));
  assert(read->end_year == std::optional<int32_t>(1918));
  assert(!read->end_month.has_value());

  // duplicates and anonymous tags survive storage, in insertion order
  auto tags = repo.GetEntityTags(*tx, record.id);
  assert(tags.size() == 3);
  assert(!tags[1].name.has_value());
  assert(tags[1].value == "treaty");
  assert(tags[2].name == std::optional<std::string>("era"));

  assert(!repo.GetEntity(*tx, prefix + "-missing").has_value());
  tx->Commit();
}

void VerifyUniqueness(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertEntity(*tx, Entity(prefix + "-u", 1000)));
    assert(repo.InsertTimeline(*tx, TimelineRecord{prefix + "-tl", prefix + " unique timeline", std::nullopt}));
    tx->Commit();
  }

  {
    auto tx  = repo.Begin();
    auto dup = repo.InsertEntity(*tx, Entity(prefix + "-u", 1001));
    assert(!dup);
    assert(dup.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  {
    auto tx  = repo.Begin();
    auto dup = repo.InsertTimeline(*tx, TimelineRecord{prefix + "-tl2", prefix + " unique timeline", std::nullopt});
    assert(!dup);
    assert(dup.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }
}

void VerifyTimelineGraphStorage(Repository& repo, const std::string& prefix) {
  const auto root  = prefix + "-root";
  const auto child = prefix + "-child";

  auto tx = repo.Begin();
  assert(repo.InsertTimeline(*tx, TimelineRecord{root, prefix + " root", std::string(R"(era = "ww1")")}));
  assert(repo.InsertTimeline(*tx, TimelineRecord{child, prefix + " child", std::nullopt}));
  assert(repo.InsertTimelineTag(*tx, TagRecord{root, std::string("curator"), "ana"}));

  // cycles and dangling ids are storable
  assert(repo.InsertSubtimeline(*tx, {root, child}));
  assert(repo.InsertSubtimeline(*tx, {child, root}));
  assert(repo.InsertSubtimeline(*tx, {root, prefix + "-ghost"}));
  assert(repo.InsertTimelineEntity(*tx, {root, prefix + "-nobody"}));

  auto by_name = repo.GetTimelineByName(*tx, prefix + " root");
  assert(by_name.has_value());
  assert(by_name->id == root);
  assert(by_name->bool_expression == std::optional<std::string>(R"(era = "ww1")"));
  assert(!repo.GetTimeline(*tx, child)->bool_expression.has_value());

  assert(repo.ListSubtimelineChildren(*tx, root) == (std::vector<std::string>{child, prefix + "-ghost"}));
  assert(repo.ListSubtimelineChildren(*tx, child) == std::vector<std::string>{root});
  assert(repo.ListLinkedEntities(*tx, root) == std::vector<std::string>{prefix + "-nobody"});
  assert(repo.GetTimelineTags(*tx, root).size() == 1);

  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertEntity(*tx, Entity(prefix + "-rolled-back", 1500)));
    tx->Rollback();
  }
  {
    // destructor rolls back too
    auto tx = repo.Begin();
    assert(repo.InsertEntity(*tx, Entity(prefix + "-dropped", 1501)));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetEntity(*check_tx, prefix + "-rolled-back").has_value());
  assert(!repo.GetEntity(*check_tx, prefix + "-dropped").has_value());
  check_tx->Commit();
}

void VerifyRenderParity(std::shared_ptr<Repository> repo, const std::string& prefix) {
  {
    auto tx = repo->Begin();
    auto a  = Entity(prefix + "-A", 1917);
    auto b  = Entity(prefix + "-B", 1914);
    auto c  = Entity(prefix + "-C", 1916, 3);
    auto d  = Entity(prefix + "-D", 1918, 11, 11);
    for (const auto& e : {a, b, c, d}) assert(repo->InsertEntity(*tx, e));

    const auto era = prefix + "-era";
    const auto cty = prefix + "-country";
    assert(repo->InsertEntityTag(*tx, TagRecord{b.id, era, "ww1"}));
    assert(repo->InsertEntityTag(*tx, TagRecord{c.id, cty, "France"}));
    assert(repo->InsertEntityTag(*tx, TagRecord{d.id, era, "ww1"}));
    assert(repo->InsertEntityTag(*tx, TagRecord{d.id, cty, "Germany"}));

    assert(repo->InsertTimeline(*tx, TimelineRecord{prefix + "-T", prefix + " T", era + R"( = "ww1")"}));
    assert(repo->InsertTimeline(*tx, TimelineRecord{prefix + "-S", prefix + " S", cty + " exists"}));
    assert(repo->InsertSubtimeline(*tx, {prefix + "-T", prefix + "-S"}));
    assert(repo->InsertTimelineEntity(*tx, {prefix + "-T", a.id}));
    tx->Commit();
  }

  opentimeline::core::TimelineEngine engine(repo, opentimeline::tags::AutomaticTags::Defaults());
  const auto                         rendered = engine.RenderTimeline(prefix + "-T");

  std::vector<std::string> ids;
  for (const auto& e : rendered.entities) ids.push_back(e.id);
  assert(ids == (std::vector<std::string>{prefix + "-B", prefix + "-C", prefix + "-A", prefix + "-D"}));
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  {
    auto repo = backend.make_repository();
    auto tx   = repo->Begin();
    assert(repo->InsertEntity(*tx, Entity(prefix + "-durable", -44, 3, 15)));
    assert(repo->InsertEntityTag(*tx, TagRecord{prefix + "-durable", std::nullopt, "emperor"}));
    tx->Commit();
  }

  auto repo = backend.make_repository();
  auto tx   = repo->Begin();
  auto e    = repo->GetEntity(*tx, prefix + "-durable");
  assert(e.has_value());
  assert(e->start_year == -44);
  assert(e->start_day == std::optional<uint8_t>(15));
  assert(repo->GetEntityTags(*tx, prefix + "-durable").size() == 1);
  tx->Commit();
}

BackendFactory MakeFactory(const std::string& name, RuntimeConfig config, bool supports_restart, std::function<void()> cleanup) {
  return BackendFactory{
      .name             = name,
      .make_repository  = [config]() { return opentimeline::factory::BuildRepository(config); },
      .supports_restart = [supports_restart]() { return supports_restart; },
      .cleanup          = std::move(cleanup),
  };
}

BackendFactory MakeMemoryFactory() {
  RuntimeConfig config;
  config.mutable_database()->mutable_memory();
  return MakeFactory("memory", config, false, [] {});
}

#if OPENTIMELINE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("opentimeline_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  RuntimeConfig config;
  config.mutable_database()->mutable_sqlite()->set_path(db_path);
  config.mutable_database()->mutable_sqlite()->set_wal_mode(true);
  return MakeFactory("sqlite", config, true, [db_path] {
    std::filesystem::remove(db_path);
    std::filesystem::remove(db_path + "-wal");
    std::filesystem::remove(db_path + "-shm");
  });
}
#endif

#if OPENTIMELINE_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("OPENTIMELINE_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("OPENTIMELINE_TEST_POSTGRES_URI is not set");
  }

  RuntimeConfig config;
  config.mutable_database()->mutable_postgres()->set_connection_uri(uri);
  config.mutable_database()->mutable_postgres()->set_max_connections(4);
  return MakeFactory("postgres", config, true, [] {});
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // unique per run so a persistent postgres database can be reused
  const auto prefix = backend.name + "-" + std::to_string(NowMs());

  VerifyEntityReadWrite(*repo, prefix);
  VerifyUniqueness(*repo, prefix);
  VerifyTimelineGraphStorage(*repo, prefix);
  VerifyRollbackBehavior(*repo, prefix);
  VerifyRenderParity(repo, prefix);

  repo.reset();
  VerifyRestartDurability(backend, prefix);

  backend.cleanup();
}

void VerifyApplicationBuild() {
  const auto dataset_path = std::filesystem::temp_directory_path() / ("opentimeline_integration_dataset_" + std::to_string(NowMs()) + ".json");
  {
    std::ofstream out(dataset_path);
    out << R"({
      "entities": [
        {"id": "pharaoh", "name": "Ramesses II", "start": {"year": -1303}, "tags": [{"value": "pharaoh"}]},
        {"id": "king", "name": "Louis XIV", "start": {"year": 1638, "month": 9, "day": 5}, "tags": [{"value": "king"}]}
      ],
      "timelines": [
        {"id": "people", "name": "People", "bool_expression": "\"person\""}
      ]
    })";
  }

  RuntimeConfig config;
  config.mutable_database()->mutable_memory();
  config.mutable_dataset()->set_path(dataset_path.string());
  auto* rule = config.mutable_engine()->add_automatic_tags();
  rule->mutable_when()->set_value("pharaoh");
  rule->mutable_add()->set_value("person");

  auto app = opentimeline::factory::Build(config);
  assert(app.grpc_services.size() == 1);

  opentimeline::v1::RenderTimelineRequest req;
  req.set_name("People");
  const auto resp = app.timeline_service->RenderTimeline(req);
  assert(resp.entities_size() == 2);
  assert(resp.entities(0).id() == "pharaoh");
  assert(resp.entities(1).id() == "king");

  std::filesystem::remove(dataset_path);
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if OPENTIMELINE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if OPENTIMELINE_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  VerifyApplicationBuild();

  std::cout << "opentimeline_integration_repository_parity: pass\n";
  return 0;
}
