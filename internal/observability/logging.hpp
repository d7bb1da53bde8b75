#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

#include "internal/util/uuid.hpp"

namespace syncq::runtime::config {
class RuntimeConfig;
}

namespace syncq::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// item_id=<canonical uuid>
LogField ItemField(const util::UUID& id);

/*
  Logs go to stderr through the "syncq" spdlog logger, one line per
  event: message followed by key=value fields. Values containing spaces
  or quotes are quoted. SYNCQ_LOG_LEVEL, SYNCQ_LOG_PATTERN and
  SYNCQ_LOG_INCLUDE_TRACE_CONTEXT override the config file.
*/
void InitializeLogging(const syncq::runtime::config::RuntimeConfig& config);
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

} // namespace syncq::observability

#define SYNCQ_LOG_INFO(message, ...) ::syncq::observability::LogInfo((message), ##__VA_ARGS__)
#define SYNCQ_LOG_WARN(message, ...) ::syncq::observability::LogWarn((message), ##__VA_ARGS__)
#define SYNCQ_LOG_ERROR(message, ...) ::syncq::observability::LogError((message), ##__VA_ARGS__)
