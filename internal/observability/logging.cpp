#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace opentimeline::observability {
namespace {

constexpr std::string_view kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

std::string EnvOr(const char* name, const std::string& configured, std::string_view fallback) {
  if (const char* value = std::getenv(name)) {
    return value;
  }
  return configured.empty() ? std::string(fallback) : configured;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) return true;
  for (char c : value) {
    if (c == ' ' || c == '\t' || c == '\n' || c == '"' || c == '=') return true;
  }
  return false;
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out.append(value);
    return;
  }
  out.push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out.push_back('\\');
      out.push_back(c);
    } else if (c == '\n') {
      out.append("\\n");
    } else {
      out.push_back(c);
    }
  }
  out.push_back('"');
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField CountField(std::string_view key, std::size_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField PathField(std::string_view key, const std::vector<std::string>& path) {
  std::string joined;
  for (const auto& id : path) {
    if (!joined.empty()) joined += " -> ";
    joined += id;
  }
  return {std::string(key), std::move(joined)};
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) out.push_back(' ');
    out.append(field.key);
    out.push_back('=');
    AppendValue(out, field.value);
  }
  return out;
}

spdlog::level::level_enum ParseLogLevel(std::string_view name) {
  // from_str maps unknown names to "off"; only accept "off" when asked for.
  const auto level = spdlog::level::from_str(std::string(name));
  if (level == spdlog::level::off && name != "off") {
    throw std::invalid_argument("unknown log level: " + std::string(name));
  }
  return level;
}

void InitializeLogging(const opentimeline::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::stdout_color_mt("opentimeline");
  logger->set_pattern(EnvOr("OPENTIMELINE_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));
  logger->set_level(ParseLogLevel(EnvOr("OPENTIMELINE_LOG_LEVEL", config.logging().level(), "info")));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (fields.size() == 0) {
    spdlog::log(level, "{}", message);
    return;
  }
  spdlog::log(level, "{} {}", message, FormatFields(fields));
}

} // namespace opentimeline::observability
