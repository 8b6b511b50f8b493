#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace fmd::observability {
namespace {

std::string ResolveLevel(const fmd::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("FMD_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const fmd::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("FMD_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

std::string SerializeFields(std::string_view category, std::initializer_list<LogField> fields) {
  std::ostringstream out;
  out << "cat=" << category;
  for (const auto& field : fields) {
    out << ' ' << field.key << '=' << field.value;
  }
  return out.str();
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const fmd::runtime::config::RuntimeConfig& config) {
  auto logger = spdlog::get("fmd");
  if (!logger) {
    logger = spdlog::stdout_color_mt("fmd");
  }
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view category, std::string_view message, std::initializer_list<LogField> fields) {
  try {
    auto logger = spdlog::default_logger_raw();
    if (!logger || !logger->should_log(level)) {
      return;
    }
    logger->log(level, "{} {}", message, SerializeFields(category, fields));
  } catch (const std::exception&) {
    // log sinks are best effort
  }
}

} // namespace fmd::observability
