#pragma once

#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace opentimeline::runtime::config {
class RuntimeConfig;
}

namespace opentimeline::observability {

/*
  One key=value pair appended to a log line.

  Values are quoted when they contain whitespace, '"' or '=', so error
  messages and cycle paths stay a single token for log parsers.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField CountField(std::string_view key, std::size_t value);
// "a -> b -> a"
LogField PathField(std::string_view key, const std::vector<std::string>& path);

std::string FormatFields(std::initializer_list<LogField> fields);

// Throws std::invalid_argument for names spdlog does not know.
spdlog::level::level_enum ParseLogLevel(std::string_view name);

void InitializeLogging(const opentimeline::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace opentimeline::observability

#define OPENTIMELINE_LOG_INFO(message, ...) ::opentimeline::observability::LogInfo((message), ##__VA_ARGS__)
#define OPENTIMELINE_LOG_WARN(message, ...) ::opentimeline::observability::LogWarn((message), ##__VA_ARGS__)
#define OPENTIMELINE_LOG_ERROR(message, ...) ::opentimeline::observability::LogError((message), ##__VA_ARGS__)
