#pragma once

#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <initializer_list>
#include <string>
#include <string_view>

#include "internal/model/entity_id.hpp"

namespace artifact::runtime::config {
class RuntimeConfig;
}

namespace artifact::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField CountField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);
LogField IdField(std::string_view key, const artifact::model::EntityId& id);

// keys shared by every maintenance log line
LogField RepositoryField(std::string_view repository);
LogField ChunkField(std::size_t chunk_index);
LogField ErrorField(const std::exception& e);

/*
  Renders fields as space separated key=value pairs. A value that is empty
  or holds a separator character is double quoted, with '"' and '\' escaped.
*/
std::string FormatFields(std::initializer_list<LogField> fields);

void InitializeLogging(const artifact::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace artifact::observability

#define ARTIFACT_LOG_DEBUG(message, ...) ::artifact::observability::LogDebug((message), ##__VA_ARGS__)
#define ARTIFACT_LOG_INFO(message, ...) ::artifact::observability::LogInfo((message), ##__VA_ARGS__)
#define ARTIFACT_LOG_WARN(message, ...) ::artifact::observability::LogWarn((message), ##__VA_ARGS__)
#define ARTIFACT_LOG_ERROR(message, ...) ::artifact::observability::LogError((message), ##__VA_ARGS__)
