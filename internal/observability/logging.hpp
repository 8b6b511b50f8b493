#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace fmd::runtime::config {
class RuntimeConfig;
}

namespace fmd::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

void InitializeLogging(const fmd::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

// Fire-and-forget: never throws, never blocks the caller on sink failure.
void Log(spdlog::level::level_enum level, std::string_view category, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view category, std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, category, message, fields);
}

inline void LogInfo(std::string_view category, std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, category, message, fields);
}

inline void LogWarn(std::string_view category, std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, category, message, fields);
}

inline void LogError(std::string_view category, std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, category, message, fields);
}

} // namespace fmd::observability

#define FMD_LOG_DEBUG(category, message, ...) ::fmd::observability::LogDebug((category), (message), ##__VA_ARGS__)
#define FMD_LOG_INFO(category, message, ...) ::fmd::observability::LogInfo((category), (message), ##__VA_ARGS__)
#define FMD_LOG_WARN(category, message, ...) ::fmd::observability::LogWarn((category), (message), ##__VA_ARGS__)
#define FMD_LOG_ERROR(category, message, ...) ::fmd::observability::LogError((category), (message), ##__VA_ARGS__)
