#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using opentimeline::config::ConfigLoader;
using opentimeline::runtime::config::DatabaseConfig;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "opentimeline_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "C:\\timelines\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\timelines\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().wal_mode());
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(server:
  bind_address: "line1\nline2☃"
database:
  memory: {}
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
  assert(config.database().backend_case() == DatabaseConfig::kMemory);
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects(R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)") && "ConfigLoader must reject unknown fields.");
}

void TestEngineSection() {
  auto config = ConfigLoader::LoadFromYamlString(R"(engine:
  compose_threads: 4
  expression_cache_capacity: 64
  override_automatic_tags: true
  automatic_tags:
    - when: {value: "pharaoh"}
      add: {value: "person"}
    - when: {name: "rank", value: "1"}
      add: {name: "role", value: "leader"}
dataset:
  path: /srv/timelines/world.json
)");

  assert(config.engine().compose_threads() == 4);
  assert(config.engine().expression_cache_capacity() == 64);
  assert(config.engine().override_automatic_tags());
  assert(config.engine().automatic_tags_size() == 2);
  assert(!config.engine().automatic_tags(0).when().has_name());
  // quoted "1" stays a string
  assert(config.engine().automatic_tags(1).when().value() == "1");
  assert(config.dataset().path() == "/srv/timelines/world.json");
}

void TestEmptyDocumentGivesDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(config.database().backend_case() == DatabaseConfig::BACKEND_NOT_SET);
  assert(config.engine().compose_threads() == 0);
}

void TestValidation() {
  assert(Rejects("database:\n  sqlite:\n    wal_mode: true\n"));
  assert(Rejects("database:\n  postgres:\n    max_connections: 4\n"));
  assert(Rejects("engine:\n  compose_threads: 100000\n"));
  assert(Rejects("engine:\n  automatic_tags:\n    - when: {value: \"king\"}\n"));
}

void TestLoggingLevelIsChecked() {
  auto config = ConfigLoader::LoadFromYamlString("logging:\n  level: debug\n  pattern: \"%v\"\n");
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "%v");

  assert(Rejects("logging:\n  level: loud\n"));
  assert(Rejects("logging:\n  include_trace_context: true\n"));
}

void TestMissingFile() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/opentimeline.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestEngineSection();
  TestEmptyDocumentGivesDefaults();
  TestValidation();
  TestLoggingLevelIsChecked();
  TestMissingFile();

  std::cout << "opentimeline_unit_config_loader: pass\n";
  return 0;
}
